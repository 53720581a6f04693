#include "graph/concept_graph.hpp"
#include <algorithm>
#include <thread>

namespace kbg {

// ==========================================
// NodeInfo Implementation
// ==========================================

nlohmann::json NodeInfo::to_json() const {
    return nlohmann::json::array({out_degree, in_degree, num_descendants});
}

// ==========================================
// ConceptGraph Implementation
// ==========================================

size_t ConceptGraph::intern(const std::string& node_id) {
    auto it = index_.find(node_id);
    if (it != index_.end()) {
        return it->second;
    }
    size_t idx = node_ids_.size();
    index_.emplace(node_id, idx);
    node_ids_.push_back(node_id);
    successors_.emplace_back();
    predecessors_.emplace_back();
    return idx;
}

bool ConceptGraph::add_edge(const std::string& source, const std::string& target) {
    size_t u = intern(source);
    size_t v = intern(target);

    auto& out = successors_[u];
    if (std::find(out.begin(), out.end(), v) != out.end()) {
        return false;
    }
    out.push_back(v);
    predecessors_[v].push_back(u);
    ++num_edges_;
    return true;
}

bool ConceptGraph::has_node(const std::string& node_id) const {
    return index_.find(node_id) != index_.end();
}

bool ConceptGraph::has_edge(const std::string& source, const std::string& target) const {
    auto u = index_.find(source);
    auto v = index_.find(target);
    if (u == index_.end() || v == index_.end()) {
        return false;
    }
    const auto& out = successors_[u->second];
    return std::find(out.begin(), out.end(), v->second) != out.end();
}

std::vector<std::string> ConceptGraph::successors(const std::string& node_id) const {
    std::vector<std::string> result;
    auto it = index_.find(node_id);
    if (it != index_.end()) {
        for (size_t v : successors_[it->second]) {
            result.push_back(node_ids_[v]);
        }
    }
    return result;
}

std::vector<std::string> ConceptGraph::predecessors(const std::string& node_id) const {
    std::vector<std::string> result;
    auto it = index_.find(node_id);
    if (it != index_.end()) {
        for (size_t u : predecessors_[it->second]) {
            result.push_back(node_ids_[u]);
        }
    }
    return result;
}

size_t ConceptGraph::out_degree(const std::string& node_id) const {
    auto it = index_.find(node_id);
    return it != index_.end() ? successors_[it->second].size() : 0;
}

size_t ConceptGraph::in_degree(const std::string& node_id) const {
    auto it = index_.find(node_id);
    return it != index_.end() ? predecessors_[it->second].size() : 0;
}

// ==========================================
// Reachability
// ==========================================

size_t ConceptGraph::reachable_count(
    size_t start,
    std::vector<char>& visited,
    std::vector<size_t>& touched
) const {
    // visited is all-zero on entry and restored before returning
    std::vector<size_t> stack(successors_[start].begin(), successors_[start].end());
    touched.clear();

    while (!stack.empty()) {
        size_t current = stack.back();
        stack.pop_back();

        if (visited[current]) continue;
        visited[current] = 1;
        touched.push_back(current);

        for (size_t next : successors_[current]) {
            if (!visited[next]) {
                stack.push_back(next);
            }
        }
    }

    size_t count = touched.size();
    for (size_t idx : touched) {
        visited[idx] = 0;
    }
    return count;
}

std::set<std::string> ConceptGraph::descendants(const std::string& node_id) const {
    std::set<std::string> result;
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        return result;
    }

    std::vector<char> visited(node_ids_.size(), 0);
    std::vector<size_t> touched;
    reachable_count(it->second, visited, touched);

    for (size_t idx : touched) {
        result.insert(node_ids_[idx]);
    }
    return result;
}

size_t ConceptGraph::count_descendants(const std::string& node_id) const {
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        return 0;
    }
    std::vector<char> visited(node_ids_.size(), 0);
    std::vector<size_t> touched;
    return reachable_count(it->second, visited, touched);
}

std::vector<NodeInfo> ConceptGraph::compute_node_info(size_t num_threads) const {
    const size_t n = node_ids_.size();
    std::vector<NodeInfo> info(n);

    for (size_t i = 0; i < n; ++i) {
        info[i].out_degree = successors_[i].size();
        info[i].in_degree = predecessors_[i].size();
    }

    auto worker = [this, &info, n](size_t first, size_t stride) {
        std::vector<char> visited(n, 0);
        std::vector<size_t> touched;
        for (size_t i = first; i < n; i += stride) {
            info[i].num_descendants = reachable_count(i, visited, touched);
        }
    };

    num_threads = std::max<size_t>(1, std::min(num_threads, n));
    if (num_threads == 1) {
        worker(0, 1);
        return info;
    }

    // Joins on every exit, including a failed thread launch
    struct JoinAll {
        std::vector<std::thread> threads;
        ~JoinAll() {
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }
    } workers;

    workers.threads.reserve(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
        workers.threads.emplace_back(worker, t, num_threads);
    }
    for (auto& w : workers.threads) {
        w.join();
    }

    return info;
}

void ConceptGraph::clear() {
    index_.clear();
    node_ids_.clear();
    successors_.clear();
    predecessors_.clear();
    num_edges_ = 0;
}

} // namespace kbg
