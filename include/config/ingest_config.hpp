#pragma once

#include "config/source_profile.hpp"
#include <string>
#include <vector>

namespace kbg {

/**
 * @brief Runtime configuration for one ingestion run
 */
struct IngestConfig {
    // Locations
    std::string data_dir = "data/kbs/";          ///< Source files and per-kb id mappings
    std::string edgelist_dir = "node2vec/graph/"; ///< Edge lists for the embedding tool

    // Explicit input files (override the profile's file name)
    std::string kb_file;                          ///< Ontology file for generic obo sources
    std::string terms_file;                       ///< Plain-text terms (txt format)
    std::string edges_file;                       ///< Plain-text edges (txt format)

    // Processing
    int num_threads = 1;                          ///< Workers for descendant counting
    bool verbose = true;
    bool write_statistics = false;                ///< Also write kb_statistics.json

    // Extra or overriding source profiles
    std::vector<SourceProfile> sources;

    /**
     * @brief Load configuration from JSON file; absent keys keep defaults
     */
    static IngestConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overlaid with KBG_* environment variables
     */
    static IngestConfig from_environment();

    /**
     * @brief Overlay KBG_DATA_DIR, KBG_EDGELIST_DIR, KBG_THREADS, KBG_VERBOSE
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Built-in profiles plus the ones declared in this config
     */
    SourceProfileRegistry make_registry() const;
};

/**
 * @brief Load configuration from file (if given) with environment overlay
 */
IngestConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace kbg
