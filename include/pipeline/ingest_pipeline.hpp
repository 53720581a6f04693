#pragma once

#include "config/ingest_config.hpp"
#include "config/source_profile.hpp"
#include "export/edge_list_exporter.hpp"
#include "extract/extractor.hpp"
#include "model/knowledge_base.hpp"
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace kbg {

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Statistics from one ingestion run
 */
struct IngestStatistics {
    std::string kb;
    std::string format;

    // Extraction
    ExtractionStatistics extraction;
    size_t concepts = 0;
    size_t edges = 0;

    // Graph
    size_t graph_nodes = 0;
    size_t graph_edges = 0;

    // Outputs
    size_t ids_mapped = 0;
    ExportStatistics edge_list;

    // Timing
    double total_time_seconds = 0.0;
    double extraction_time_seconds = 0.0;
    double graph_building_time_seconds = 0.0;
    double export_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    const std::string& message
)>;

// ============================================================================
// Ingest Pipeline
// ============================================================================

/**
 * @brief Which outputs a run produces
 */
enum class RunMode {
    Full,        ///< id mapping, then edge list
    Reindex,     ///< id mapping only
    EdgeList,    ///< edge list from a previously persisted id mapping
    StatsOnly    ///< no files written
};

/**
 * @brief End-to-end ingestion of one knowledge base
 *
 * Source file -> extractor -> KnowledgeBase -> id mapping -> edge list.
 * The two export stages communicate only through the persisted
 * node_id_to_int.json, so the edge list can be regenerated against an
 * earlier mapping.
 */
class IngestPipeline {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit IngestPipeline(const IngestConfig& config);

    /**
     * @brief Resolve the profile and input files for a source
     * @throws UnknownFormatError before any file is opened
     */
    SourceProfile resolve_profile(const std::string& kb, const std::string& format) const;

    /**
     * @brief Input files for a profile: explicit config files first, then the
     *        profile's file name under data_dir
     */
    SourceFiles resolve_files(const SourceProfile& profile) const;

    /**
     * @brief Extract and build the finalized knowledge base
     */
    KnowledgeBase ingest(const std::string& kb, const std::string& format);

    /**
     * @brief Number name_to_id and write the mapping pair under data_dir/<kb>/
     */
    IdMapping write_id_mapping(const KnowledgeBase& knowledge_base);

    /**
     * @brief Write edgelist_dir/<kb>.edgelist using the persisted mapping
     * @throws MissingFileError if no mapping has been written for this kb
     */
    ExportStatistics write_edge_list(const KnowledgeBase& knowledge_base);

    /**
     * @brief Write data_dir/<kb>/kb_statistics.json
     */
    void write_statistics(const KnowledgeBase& knowledge_base) const;

    /**
     * @brief Run ingestion and the exports selected by mode
     */
    KnowledgeBase run(const std::string& kb, const std::string& format,
                      RunMode mode = RunMode::Full);

    std::string mapping_directory(const std::string& kb) const;
    std::string edge_list_path(const std::string& kb) const;
    std::string statistics_path(const std::string& kb) const;

    void set_progress_callback(ProgressCallback callback);

    IngestStatistics get_statistics() const { return stats_; }

    void reset_statistics();

    IngestConfig get_config() const { return config_; }

private:
    IngestConfig config_;
    SourceProfileRegistry registry_;
    IngestStatistics stats_;
    ProgressCallback progress_callback_;

    void report_progress(const std::string& stage, const std::string& message);
};

} // namespace kbg
