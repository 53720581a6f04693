#include "cli/cli.hpp"
#include "config/ingest_config.hpp"
#include "pipeline/ingest_pipeline.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace kbg;

// ============== Helper Functions ==============

// Options shared by every command
std::vector<ArgDef> common_options() {
    return {
        {"data-dir", "d", "Directory holding source files and id mappings (default: data/kbs/)", false},
        {"edgelist-dir", "e", "Directory for edge-list files (default: node2vec/graph/)", false},
        {"kb-file", "f", "Ontology file, overrides the source's default location", false},
        {"terms", "t", "Plain-text terms file (txt format)", false},
        {"edges", "x", "Plain-text edges file (txt format)", false},
        {"config", "c", "Path to JSON config file (optional)", false},
        {"threads", "j", "Worker threads for descendant counting", false},
        {"stats", "s", "Also write kb_statistics.json next to the id mapping", true},
        {"quiet", "q", "Suppress progress output", true}
    };
}

// Config file, then environment, then command-line options
IngestConfig config_from_args(const Args& args) {
    IngestConfig config = load_config_with_fallback(args.get("config").value);

    if (args.has("data-dir")) config.data_dir = args.get("data-dir").value;
    if (args.has("edgelist-dir")) config.edgelist_dir = args.get("edgelist-dir").value;
    if (args.has("kb-file")) config.kb_file = args.get("kb-file").value;
    if (args.has("terms")) config.terms_file = args.get("terms").value;
    if (args.has("edges")) config.edges_file = args.get("edges").value;
    if (args.has("threads")) config.num_threads = args.get("threads").as_int();
    if (args.has("stats")) config.write_statistics = true;
    if (args.has("quiet")) config.verbose = false;

    return config;
}

int run_pipeline(const Args& args, RunMode mode) {
    const std::string& kb = args.positional[0];
    const std::string& format = args.positional[1];

    IngestConfig config = config_from_args(args);
    IngestPipeline pipeline(config);

    pipeline.run(kb, format, mode);

    if (config.verbose) {
        pipeline.get_statistics().print_summary();
    }
    if (config.write_statistics && config.verbose) {
        std::cout << "Statistics written to: " << pipeline.statistics_path(kb) << "\n";
    }

    return 0;
}

// ============== kbgraph build ==============
int cmd_build(const Args& args) {
    return run_pipeline(args, RunMode::Full);
}

// ============== kbgraph reindex ==============
int cmd_reindex(const Args& args) {
    return run_pipeline(args, RunMode::Reindex);
}

// ============== kbgraph edgelist ==============
int cmd_edgelist(const Args& args) {
    return run_pipeline(args, RunMode::EdgeList);
}

// ============== kbgraph stats ==============
int cmd_stats(const Args& args) {
    const std::string& kb = args.positional[0];
    const std::string& format = args.positional[1];

    IngestConfig config = config_from_args(args);
    IngestPipeline pipeline(config);

    KnowledgeBase knowledge_base = pipeline.run(kb, format, RunMode::StatsOnly);
    knowledge_base.summary().print_summary();

    // Broadest concepts
    std::vector<std::pair<std::string, size_t>> ranked;
    for (const auto& [id, info] : knowledge_base.id_to_info()) {
        ranked.emplace_back(id, info.num_descendants);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > 10) {
        ranked.resize(10);
    }

    std::cout << "\nTop " << ranked.size() << " Concepts by Descendants:\n";
    for (const auto& [id, count] : ranked) {
        const std::string* name = knowledge_base.id_to_name().find(id);
        std::cout << "  " << id;
        if (name) {
            std::cout << " " << *name;
        }
        std::cout << " (" << count << " descendants)\n";
    }

    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kbgraph", "1.0.0");

    // kbgraph build
    cli.register_command({
        "build",
        "Ingest a source, write its id mapping, then its edge list",
        {"kb", "format"},
        common_options(),
        cmd_build
    });

    // kbgraph reindex
    cli.register_command({
        "reindex",
        "Ingest a source and write only int_to_node_id.json / node_id_to_int.json",
        {"kb", "format"},
        common_options(),
        cmd_reindex
    });

    // kbgraph edgelist
    cli.register_command({
        "edgelist",
        "Ingest a source and write its edge list using the persisted id mapping",
        {"kb", "format"},
        common_options(),
        cmd_edgelist
    });

    // kbgraph stats
    cli.register_command({
        "stats",
        "Ingest a source and print knowledge-base statistics",
        {"kb", "format"},
        common_options(),
        cmd_stats
    });

    return cli.run(argc, argv);
}
