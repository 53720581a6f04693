#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace kbg {

// ============================================================================
// Source Formats
// ============================================================================

enum class SourceFormat {
    Obo,         ///< Stanza-based hierarchical ontology
    Tsv,         ///< CTD-style tab-separated hierarchy export
    Csv,         ///< Comma-separated taxonomy registry
    GeneInfo,    ///< NCBI gene_info registry
    Txt          ///< Plain-text term and edge files
};

std::string source_format_to_string(SourceFormat format);

/**
 * @brief Parse a format tag ("obo", "tsv", "csv", "gene_info", "txt")
 */
std::optional<SourceFormat> source_format_from_string(const std::string& tag);

// ============================================================================
// Source Profile
// ============================================================================

/**
 * @brief Engineered root concept anchoring a source hierarchy
 */
struct RootConcept {
    std::string id;
    std::string name;
};

/**
 * @brief Column positions for delimited sources (zero-based)
 */
struct ColumnLayout {
    size_t id = 1;
    size_t name = 0;
    size_t parents = 4;
    size_t synonyms = 7;
    size_t rank = 9;
    size_t description = 8;

    /**
     * @brief Highest column index a row must reach for this layout
     */
    size_t required_width(SourceFormat format) const;
};

/**
 * @brief Declarative description of one knowledge-base source
 *
 * Everything that differs between sources (file name, namespace filter,
 * root concept, bridging edges, column positions, separators) lives here so
 * that the extractors and the model builder stay source-agnostic.
 */
struct SourceProfile {
    std::string kb;                           ///< Knowledge-base tag, e.g. "go_bp"
    SourceFormat format = SourceFormat::Obo;
    std::string file_name;                    ///< Relative to the data directory

    // Hierarchical ontology options
    std::optional<std::string> target_namespace;
    bool derived_from_edges = false;          ///< Emit (X, id) for "derived_from X"
    std::optional<std::string> xref_alias_prefix;

    // Root connectivity
    std::optional<RootConcept> root;
    bool always_inject_root = false;          ///< Inject even if the root name exists
    std::vector<std::string> bridging_children;  ///< Top-level ids linked to the root

    // Delimited sources
    size_t header_rows = 0;
    ColumnLayout columns;
    char parent_separator = '|';
    char synonym_separator = '|';
    std::string source_uri_marker;            ///< Row filter and id stem marker
    std::string target_rank;
    std::string id_prefix;                    ///< Local prefix added to derived ids
    std::string missing_value = "-";          ///< Sentinel for empty list entries

    // Registries without topology
    std::optional<std::pair<std::string, std::string>> placeholder_edge;

    nlohmann::json to_json() const;
    static SourceProfile from_json(const nlohmann::json& j);
};

// ============================================================================
// Profile Registry
// ============================================================================

/**
 * @brief Lookup table of source profiles keyed by (kb, format)
 */
class SourceProfileRegistry {
public:
    SourceProfileRegistry() = default;

    /**
     * @brief Registry preloaded with the built-in biomedical sources
     */
    static SourceProfileRegistry defaults();

    /**
     * @brief Add or replace the profile for (profile.kb, profile.format)
     */
    void add(const SourceProfile& profile);

    std::optional<SourceProfile> find(const std::string& kb, SourceFormat format) const;

    /**
     * @brief Resolve a profile or throw UnknownFormatError
     *
     * An exact (kb, format) match wins. Otherwise a kb registered as a csv or
     * gene_info source (ncbi_taxon, ncbi_gene) resolves to that profile for
     * any format tag except "obo" and "tsv". Remaining "obo" and "txt"
     * requests get a generic profile; the caller supplies the file paths.
     */
    SourceProfile resolve(const std::string& kb, const std::string& format_tag) const;

    size_t size() const { return profiles_.size(); }

    std::vector<SourceProfile> all() const;

private:
    std::map<std::pair<std::string, SourceFormat>, SourceProfile> profiles_;
};

} // namespace kbg
