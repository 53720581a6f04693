#ifndef KBG_CONCEPT_GRAPH_HPP
#define KBG_CONCEPT_GRAPH_HPP

#include <string>
#include <vector>
#include <set>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace kbg {

/**
 * @brief Per-node structural statistics
 */
struct NodeInfo {
    size_t out_degree = 0;         // Distinct successors
    size_t in_degree = 0;          // Distinct predecessors
    size_t num_descendants = 0;    // Nodes reachable through one or more outgoing edges

    bool operator==(const NodeInfo& other) const {
        return out_degree == other.out_degree &&
               in_degree == other.in_degree &&
               num_descendants == other.num_descendants;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Directed graph over concept identifiers
 *
 * Nodes are the endpoints of the edges added, kept in first-seen order.
 * Parallel edges collapse into one (a simple digraph), so degrees count
 * distinct neighbours. Self-loops and cycles are allowed; the ontology is
 * not validated.
 */
class ConceptGraph {
public:
    ConceptGraph() = default;

    /**
     * @brief Build from an ordered edge sequence (source -> target)
     */
    template <typename EdgeRange>
    static ConceptGraph from_edges(const EdgeRange& edges) {
        ConceptGraph graph;
        for (const auto& edge : edges) {
            graph.add_edge(edge.source, edge.target);
        }
        return graph;
    }

    /**
     * @brief Add a directed edge, creating endpoints on first sight
     * @return false if the edge was already present
     */
    bool add_edge(const std::string& source, const std::string& target);

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& source, const std::string& target) const;

    size_t num_nodes() const { return node_ids_.size(); }
    size_t num_edges() const { return num_edges_; }
    bool empty() const { return node_ids_.empty(); }

    /**
     * @brief Node identifiers in first-seen order
     */
    const std::vector<std::string>& nodes() const { return node_ids_; }

    std::vector<std::string> successors(const std::string& node_id) const;
    std::vector<std::string> predecessors(const std::string& node_id) const;

    size_t out_degree(const std::string& node_id) const;
    size_t in_degree(const std::string& node_id) const;

    /**
     * @brief All nodes reachable from node_id through one or more edges
     *
     * A visited set bounds the traversal, so cycles terminate. The start node
     * is included only when it lies on a cycle (or carries a self-loop).
     */
    std::set<std::string> descendants(const std::string& node_id) const;

    size_t count_descendants(const std::string& node_id) const;

    /**
     * @brief Compute degree and descendant statistics for every node
     * @param num_threads Worker threads for the reachability pass
     * @return One NodeInfo per node, aligned with nodes()
     *
     * Each node runs its own traversal, so the cost is O(V * (V + E)) in the
     * worst case. Traversals only read the adjacency lists and each worker
     * writes a disjoint slice of the result, so no locking is needed.
     */
    std::vector<NodeInfo> compute_node_info(size_t num_threads = 1) const;

    void clear();

private:
    std::unordered_map<std::string, size_t> index_;    // node_id -> position
    std::vector<std::string> node_ids_;
    std::vector<std::vector<size_t>> successors_;
    std::vector<std::vector<size_t>> predecessors_;
    size_t num_edges_ = 0;

    size_t intern(const std::string& node_id);
    size_t reachable_count(size_t start, std::vector<char>& visited,
                           std::vector<size_t>& touched) const;
};

} // namespace kbg

#endif // KBG_CONCEPT_GRAPH_HPP
