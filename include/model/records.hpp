#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kbg {

/**
 * @brief Directed relation between two concept identifiers
 *
 * For is-a edges source is the child and target the parent. Derived-from
 * edges run from the origin concept to the derived one.
 */
struct Edge {
    std::string source;
    std::string target;

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }
};

/**
 * @brief One concept as produced by an extractor
 */
struct ConceptRecord {
    std::string id;                          // Source-qualified identifier
    std::string name;                        // Canonical name
    std::vector<std::string> synonyms;
    std::vector<std::string> alt_ids;        // Deprecated identifiers resolving to id
    std::vector<std::string> aliases;        // External-vocabulary identifiers
    std::vector<std::string> parents;        // Direct ancestors, encounter order
    std::vector<Edge> extra_edges;           // Non is-a edges emitted with this concept
    bool obsolete = false;                   // Retracts any earlier record with this id
};

/**
 * @brief Counters reported by an extractor
 */
struct ExtractionStatistics {
    size_t records_read = 0;        // Stanzas or rows examined
    size_t records_accepted = 0;
    size_t records_filtered = 0;    // Rejected by namespace, rank or source filters
    size_t records_obsolete = 0;
    size_t records_skipped = 0;     // Malformed records skipped by tolerant sources

    nlohmann::json to_json() const;
};

/**
 * @brief Concepts and edges extracted from one source
 *
 * Concept edges (parents, extra_edges) come first in concept order, followed
 * by the standalone edges.
 */
struct ExtractionResult {
    std::string kb;
    std::vector<ConceptRecord> concepts;
    std::vector<Edge> edges;
    ExtractionStatistics stats;
};

} // namespace kbg
