#pragma once

#include "model/ordered_map.hpp"
#include "model/records.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace kbg {

/**
 * @brief Dense integer ids for the identifiers of one knowledge base
 *
 * Identifiers are numbered from zero in the iteration order of name_to_id.
 * If two names share an identifier, int_to_node_id lists it twice and
 * node_id_to_int keeps the later integer.
 */
class IdMapping {
public:
    static constexpr const char* kIntToNodeFile = "int_to_node_id.json";
    static constexpr const char* kNodeToIntFile = "node_id_to_int.json";

    IdMapping() = default;

    /**
     * @brief Number identifiers in name_to_id order
     */
    static IdMapping from_name_to_id(const OrderedMap<std::string, std::string>& name_to_id);

    /**
     * @brief Write int_to_node_id.json and node_id_to_int.json into a directory
     *
     * The directory is created if needed. Both files are JSON objects with
     * four-space indentation, keys in numbering order.
     */
    void save(const std::string& directory) const;

    /**
     * @brief Load a mapping written by save()
     *
     * Only node_id_to_int.json is required; int_to_node_id.json is rebuilt
     * from it when absent.
     * @throws MissingFileError if node_id_to_int.json does not exist
     */
    static IdMapping load(const std::string& directory);

    std::optional<size_t> lookup(const std::string& node_id) const;

    bool contains(const std::string& node_id) const;

    size_t size() const { return int_to_node_.size(); }
    bool empty() const { return int_to_node_.empty(); }

    const std::vector<std::string>& int_to_node_id() const { return int_to_node_; }

    nlohmann::ordered_json int_to_node_json() const;
    nlohmann::ordered_json node_to_int_json() const;

private:
    std::vector<std::string> int_to_node_;
    std::unordered_map<std::string, size_t> node_to_int_;
    std::vector<std::string> node_order_;    // First-numbered order of node_to_int_ keys

    void assign(size_t index, const std::string& node_id);
};

/**
 * @brief Counters for one edge-list export
 */
struct ExportStatistics {
    size_t edges_total = 0;
    size_t edges_written = 0;
    size_t edges_dropped = 0;    // At least one endpoint missing from the mapping

    nlohmann::json to_json() const;
};

/**
 * @brief Writes the integer edge list consumed by the embedding tool
 *
 * One line "<int-source> <int-target>\n" per edge in source order, no
 * header. Edges with an endpoint outside the mapping are dropped.
 */
class EdgeListExporter {
public:
    EdgeListExporter() = default;

    /**
     * @brief Render the edge list to a string
     */
    std::string render(const std::vector<Edge>& edges, const IdMapping& mapping,
                       ExportStatistics* stats = nullptr) const;

    /**
     * @brief Write the edge list to a file, creating its parent directory
     */
    ExportStatistics write(const std::vector<Edge>& edges, const IdMapping& mapping,
                           const std::string& path) const;
};

} // namespace kbg
