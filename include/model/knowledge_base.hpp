#ifndef KBG_KNOWLEDGE_BASE_HPP
#define KBG_KNOWLEDGE_BASE_HPP

#include "config/source_profile.hpp"
#include "graph/concept_graph.hpp"
#include "model/ordered_map.hpp"
#include "model/records.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kbg {

/**
 * @brief Size summary of a knowledge base
 */
struct KnowledgeBaseSummary {
    std::string kb;
    size_t num_concepts = 0;
    size_t num_synonyms = 0;
    size_t num_alt_ids = 0;
    size_t num_aliases = 0;
    size_t num_single_parent = 0;
    size_t num_edges = 0;
    size_t num_graph_nodes = 0;
    size_t num_graph_edges = 0;
    size_t max_descendants = 0;
    std::optional<std::string> root_concept;

    void print_summary() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Canonical model of one knowledge base
 *
 * Owns every derived mapping so that identifiers stay consistent across
 * name_to_id, id_to_name, the edge list and the graph statistics. Built once
 * per ingestion run: concepts and edges are added, the root is ensured, then
 * finalize() derives the graph, the undirected adjacency and id_to_info.
 *
 * Name and synonym collisions follow overwrite-wins: the later record for a
 * duplicate name replaces the earlier mapping.
 */
class KnowledgeBase {
public:
    using StringMap = OrderedMap<std::string, std::string>;
    using AdjacencyMap = OrderedMap<std::string, std::vector<std::string>>;
    using InfoMap = OrderedMap<std::string, NodeInfo>;

    explicit KnowledgeBase(std::string kb = "");

    /**
     * @brief Build a finalized knowledge base from extractor output
     * @param result Concepts and edges in source order
     * @param profile Source profile (root concept, bridging edges)
     * @param num_threads Workers for descendant counting
     */
    static KnowledgeBase build(
        const ExtractionResult& result,
        const SourceProfile& profile,
        size_t num_threads = 1
    );

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Register a concept with its names, synonyms and is-a edges
     *
     * An obsolete record retracts whatever was registered under its id.
     * child_to_parent is set only when the record has exactly one parent.
     */
    void add_concept(const ConceptRecord& concept_record);

    /**
     * @brief Remove a concept, its mappings and the edges its record added
     *
     * Edges added by other records or by add_edge() are left in place.
     * @return true if the identifier was registered
     */
    bool retract_concept(const std::string& id);

    void add_edge(const Edge& edge);
    void add_edge(const std::string& source, const std::string& target);

    /**
     * @brief Make sure the profile's root concept exists and is connected
     *
     * The root is injected when its name is absent (or always, for sources
     * that request it). Bridging children are linked to the resolved root id.
     * Does nothing for profiles without a root.
     */
    void ensure_root(const SourceProfile& profile);

    /**
     * @brief Derive graph, node_to_node and id_to_info from the edges
     */
    void finalize(size_t num_threads = 1);

    bool is_finalized() const { return finalized_; }

    // ==========================================
    // Accessors
    // ==========================================

    const std::string& kb() const { return kb_; }

    const StringMap& name_to_id() const { return name_to_id_; }
    const StringMap& id_to_name() const { return id_to_name_; }
    const StringMap& synonym_to_id() const { return synonym_to_id_; }
    const StringMap& alt_id_to_id() const { return alt_id_to_id_; }
    const StringMap& alias_to_id() const { return alias_to_id_; }
    const StringMap& child_to_parent() const { return child_to_parent_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const ConceptGraph& graph() const { return graph_; }
    const AdjacencyMap& node_to_node() const { return node_to_node_; }
    const InfoMap& id_to_info() const { return id_to_info_; }
    const std::optional<std::string>& root_concept() const { return root_concept_; }

    /**
     * @brief Resolve a name or synonym to an identifier
     */
    std::optional<std::string> lookup(const std::string& name_or_synonym) const;

    /**
     * @brief Resolve an alternate or alias identifier to the current one
     */
    std::string canonical_id(const std::string& id) const;

    size_t num_concepts() const { return id_to_name_.size(); }

    KnowledgeBaseSummary summary() const;

private:
    std::string kb_;

    StringMap name_to_id_;
    StringMap id_to_name_;
    StringMap synonym_to_id_;
    StringMap alt_id_to_id_;
    StringMap alias_to_id_;              // e.g. UMLS CUI -> HP id
    StringMap child_to_parent_;
    std::vector<Edge> edges_;
    std::vector<std::string> edge_owners_;   // contributing concept id, empty for add_edge()

    ConceptGraph graph_;
    AdjacencyMap node_to_node_;
    InfoMap id_to_info_;
    std::optional<std::string> root_concept_;

    bool finalized_ = false;

    void require_not_finalized() const;
    void push_edge(const Edge& edge, const std::string& owner);
};

} // namespace kbg

#endif // KBG_KNOWLEDGE_BASE_HPP
