#include "export/edge_list_exporter.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace kbg {

namespace {

nlohmann::ordered_json read_json_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MissingFileError(path.string());
    }

    nlohmann::ordered_json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path.string() + ": " + e.what());
    }
    return j;
}

void write_json_file(const fs::path& path, const nlohmann::ordered_json& j) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    file << j.dump(4, ' ', true);
}

}  // namespace

// ============================================================================
// IdMapping
// ============================================================================

void IdMapping::assign(size_t index, const std::string& node_id) {
    if (index >= int_to_node_.size()) {
        int_to_node_.resize(index + 1);
    }
    int_to_node_[index] = node_id;

    auto [it, inserted] = node_to_int_.insert_or_assign(node_id, index);
    if (inserted) {
        node_order_.push_back(node_id);
    }
}

IdMapping IdMapping::from_name_to_id(const OrderedMap<std::string, std::string>& name_to_id) {
    IdMapping mapping;
    size_t index = 0;
    for (const auto& [name, node_id] : name_to_id) {
        mapping.assign(index++, node_id);
    }
    return mapping;
}

std::optional<size_t> IdMapping::lookup(const std::string& node_id) const {
    auto it = node_to_int_.find(node_id);
    if (it == node_to_int_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IdMapping::contains(const std::string& node_id) const {
    return node_to_int_.find(node_id) != node_to_int_.end();
}

nlohmann::ordered_json IdMapping::int_to_node_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (size_t i = 0; i < int_to_node_.size(); ++i) {
        j[std::to_string(i)] = int_to_node_[i];
    }
    return j;
}

nlohmann::ordered_json IdMapping::node_to_int_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& node_id : node_order_) {
        j[node_id] = node_to_int_.at(node_id);
    }
    return j;
}

void IdMapping::save(const std::string& directory) const {
    fs::path dir(directory);
    fs::create_directories(dir);

    write_json_file(dir / kIntToNodeFile, int_to_node_json());
    write_json_file(dir / kNodeToIntFile, node_to_int_json());
}

IdMapping IdMapping::load(const std::string& directory) {
    fs::path dir(directory);
    IdMapping mapping;

    auto node_to_int = read_json_file(dir / kNodeToIntFile);
    if (!node_to_int.is_object()) {
        throw std::runtime_error("Expected a JSON object in " + (dir / kNodeToIntFile).string());
    }

    for (const auto& [node_id, index] : node_to_int.items()) {
        mapping.node_to_int_[node_id] = index.get<size_t>();
        mapping.node_order_.push_back(node_id);
    }

    fs::path int_to_node_path = dir / kIntToNodeFile;
    if (fs::exists(int_to_node_path)) {
        auto int_to_node = read_json_file(int_to_node_path);
        for (const auto& [key, node_id] : int_to_node.items()) {
            size_t index = std::stoul(key);
            if (index >= mapping.int_to_node_.size()) {
                mapping.int_to_node_.resize(index + 1);
            }
            mapping.int_to_node_[index] = node_id.get<std::string>();
        }
    } else {
        for (const auto& [node_id, index] : mapping.node_to_int_) {
            if (index >= mapping.int_to_node_.size()) {
                mapping.int_to_node_.resize(index + 1);
            }
            mapping.int_to_node_[index] = node_id;
        }
    }

    return mapping;
}

// ============================================================================
// ExportStatistics
// ============================================================================

nlohmann::json ExportStatistics::to_json() const {
    nlohmann::json j;
    j["edges_total"] = edges_total;
    j["edges_written"] = edges_written;
    j["edges_dropped"] = edges_dropped;
    return j;
}

// ============================================================================
// EdgeListExporter
// ============================================================================

std::string EdgeListExporter::render(
    const std::vector<Edge>& edges,
    const IdMapping& mapping,
    ExportStatistics* stats
) const {
    std::ostringstream out;
    ExportStatistics local;
    local.edges_total = edges.size();

    for (const auto& edge : edges) {
        auto source = mapping.lookup(edge.source);
        auto target = mapping.lookup(edge.target);
        if (!source || !target) {
            ++local.edges_dropped;
            continue;
        }
        out << *source << ' ' << *target << '\n';
        ++local.edges_written;
    }

    if (stats) {
        *stats = local;
    }
    return out.str();
}

ExportStatistics EdgeListExporter::write(
    const std::vector<Edge>& edges,
    const IdMapping& mapping,
    const std::string& path
) const {
    ExportStatistics stats;
    std::string content = render(edges, mapping, &stats);

    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    std::ofstream file(out_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << content;

    return stats;
}

} // namespace kbg
