#include "pipeline/ingest_pipeline.hpp"
#include "common/errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

using json = nlohmann::json;

namespace kbg {

namespace {

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start
    ).count();
}

}  // namespace

// ============================================================================
// IngestStatistics
// ============================================================================

void IngestStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Ingestion Summary: " << kb << " (" << format << ")\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Extraction:\n";
    std::cout << "  Records read: " << extraction.records_read << "\n";
    std::cout << "  Accepted: " << extraction.records_accepted << "\n";
    std::cout << "  Filtered: " << extraction.records_filtered << "\n";
    std::cout << "  Obsolete: " << extraction.records_obsolete << "\n";
    std::cout << "  Skipped (malformed): " << extraction.records_skipped << "\n\n";

    std::cout << "Knowledge Base:\n";
    std::cout << "  Concepts: " << concepts << "\n";
    std::cout << "  Edges: " << edges << "\n";
    std::cout << "  Graph nodes: " << graph_nodes << "\n";
    std::cout << "  Graph edges: " << graph_edges << "\n\n";

    std::cout << "Outputs:\n";
    std::cout << "  Ids mapped: " << ids_mapped << "\n";
    std::cout << "  Edge-list lines: " << edge_list.edges_written << "\n";
    std::cout << "  Edges dropped (unmapped endpoint): " << edge_list.edges_dropped << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Extraction: " << extraction_time_seconds << " seconds\n";
    std::cout << "  Graph building: " << graph_building_time_seconds << " seconds\n";
    std::cout << "  Export: " << export_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json IngestStatistics::to_json() const {
    json j;

    j["kb"] = kb;
    j["format"] = format;

    j["extraction"] = extraction.to_json();
    j["concepts"] = concepts;
    j["edges"] = edges;

    j["graph_nodes"] = graph_nodes;
    j["graph_edges"] = graph_edges;

    j["ids_mapped"] = ids_mapped;
    j["edge_list"] = edge_list.to_json();

    j["total_time_seconds"] = total_time_seconds;
    j["extraction_time_seconds"] = extraction_time_seconds;
    j["graph_building_time_seconds"] = graph_building_time_seconds;
    j["export_time_seconds"] = export_time_seconds;

    return j;
}

// ============================================================================
// IngestPipeline
// ============================================================================

IngestPipeline::IngestPipeline(const IngestConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    registry_ = config_.make_registry();
}

SourceProfile IngestPipeline::resolve_profile(
    const std::string& kb,
    const std::string& format
) const {
    return registry_.resolve(kb, format);
}

SourceFiles IngestPipeline::resolve_files(const SourceProfile& profile) const {
    SourceFiles files;

    if (profile.format == SourceFormat::Txt) {
        if (config_.terms_file.empty() || config_.edges_file.empty()) {
            throw std::invalid_argument(
                "Plain-text sources need both a terms file and an edges file");
        }
        files.terms = config_.terms_file;
        files.edges = config_.edges_file;
        return files;
    }

    if (!config_.kb_file.empty()) {
        files.primary = config_.kb_file;
    } else if (!profile.file_name.empty()) {
        files.primary = (fs::path(config_.data_dir) / profile.file_name).string();
    } else {
        throw std::invalid_argument(
            "No input file known for '" + profile.kb + "'; pass it with --kb-file");
    }

    return files;
}

KnowledgeBase IngestPipeline::ingest(const std::string& kb, const std::string& format) {
    stats_.kb = kb;
    stats_.format = format;

    SourceProfile profile = resolve_profile(kb, format);
    SourceFiles files = resolve_files(profile);

    auto extractor = ExtractorFactory::create(profile, files);
    extractor->set_verbose(config_.verbose);

    report_progress("Extracting",
                    profile.format == SourceFormat::Txt
                        ? files.terms + " + " + files.edges
                        : files.primary);

    auto extract_start = std::chrono::high_resolution_clock::now();
    ExtractionResult result = extractor->extract();
    stats_.extraction_time_seconds += seconds_since(extract_start);
    stats_.extraction = result.stats;

    report_progress("Building",
                    std::to_string(result.concepts.size()) + " concepts, " +
                    std::to_string(result.edges.size()) + " standalone edges");

    auto build_start = std::chrono::high_resolution_clock::now();
    KnowledgeBase knowledge_base = KnowledgeBase::build(
        result, profile, static_cast<size_t>(config_.num_threads));
    stats_.graph_building_time_seconds += seconds_since(build_start);

    stats_.concepts = knowledge_base.num_concepts();
    stats_.edges = knowledge_base.edges().size();
    stats_.graph_nodes = knowledge_base.graph().num_nodes();
    stats_.graph_edges = knowledge_base.graph().num_edges();

    return knowledge_base;
}

IdMapping IngestPipeline::write_id_mapping(const KnowledgeBase& knowledge_base) {
    auto start = std::chrono::high_resolution_clock::now();

    IdMapping mapping = IdMapping::from_name_to_id(knowledge_base.name_to_id());
    std::string directory = mapping_directory(knowledge_base.kb());
    mapping.save(directory);

    stats_.ids_mapped = mapping.size();
    stats_.export_time_seconds += seconds_since(start);

    report_progress("Reindexing", std::to_string(mapping.size()) + " ids -> " + directory);
    return mapping;
}

ExportStatistics IngestPipeline::write_edge_list(const KnowledgeBase& knowledge_base) {
    auto start = std::chrono::high_resolution_clock::now();

    IdMapping mapping = IdMapping::load(mapping_directory(knowledge_base.kb()));
    std::string path = edge_list_path(knowledge_base.kb());

    EdgeListExporter exporter;
    ExportStatistics export_stats = exporter.write(knowledge_base.edges(), mapping, path);

    stats_.edge_list = export_stats;
    stats_.export_time_seconds += seconds_since(start);

    report_progress("Exporting", std::to_string(export_stats.edges_written) + " edges -> " + path);
    if (config_.verbose && export_stats.edges_dropped > 0) {
        std::cerr << "Warning: dropped " << export_stats.edges_dropped
                  << " edges with an endpoint outside the id mapping\n";
    }

    return export_stats;
}

void IngestPipeline::write_statistics(const KnowledgeBase& knowledge_base) const {
    fs::path path(statistics_path(knowledge_base.kb()));
    fs::create_directories(path.parent_path());

    json j;
    j["knowledge_base"] = knowledge_base.summary().to_json();
    j["run"] = stats_.to_json();

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    file << j.dump(2);
}

KnowledgeBase IngestPipeline::run(
    const std::string& kb,
    const std::string& format,
    RunMode mode
) {
    auto start_time = std::chrono::high_resolution_clock::now();

    KnowledgeBase knowledge_base = ingest(kb, format);

    if (mode == RunMode::Full || mode == RunMode::Reindex) {
        write_id_mapping(knowledge_base);
    }
    if (mode == RunMode::Full || mode == RunMode::EdgeList) {
        write_edge_list(knowledge_base);
    }

    stats_.total_time_seconds += seconds_since(start_time);

    if (config_.write_statistics) {
        write_statistics(knowledge_base);
    }

    return knowledge_base;
}

std::string IngestPipeline::mapping_directory(const std::string& kb) const {
    return (fs::path(config_.data_dir) / kb).string();
}

std::string IngestPipeline::edge_list_path(const std::string& kb) const {
    return (fs::path(config_.edgelist_dir) / (kb + ".edgelist")).string();
}

std::string IngestPipeline::statistics_path(const std::string& kb) const {
    return (fs::path(config_.data_dir) / kb / "kb_statistics.json").string();
}

void IngestPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void IngestPipeline::reset_statistics() {
    stats_ = IngestStatistics();
}

void IngestPipeline::report_progress(const std::string& stage, const std::string& message) {
    if (progress_callback_) {
        progress_callback_(stage, message);
    } else if (config_.verbose) {
        std::cout << "[" << stage << "] " << message << "\n";
    }
}

} // namespace kbg
