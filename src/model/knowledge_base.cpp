#include "model/knowledge_base.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace kbg {

// ==========================================
// KnowledgeBaseSummary Implementation
// ==========================================

void KnowledgeBaseSummary::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Knowledge Base Summary: " << kb << "\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Concepts:\n";
    std::cout << "  Concepts: " << num_concepts << "\n";
    std::cout << "  Synonyms: " << num_synonyms << "\n";
    std::cout << "  Alternate ids: " << num_alt_ids << "\n";
    std::cout << "  External aliases: " << num_aliases << "\n";
    std::cout << "  Single-parent concepts: " << num_single_parent << "\n\n";

    std::cout << "Graph:\n";
    std::cout << "  Edges (source order): " << num_edges << "\n";
    std::cout << "  Nodes: " << num_graph_nodes << "\n";
    std::cout << "  Distinct edges: " << num_graph_edges << "\n";
    std::cout << "  Max descendants: " << max_descendants << "\n";
    if (root_concept) {
        std::cout << "  Root concept: " << *root_concept << "\n";
    }
    std::cout << std::string(70, '=') << "\n";
}

nlohmann::json KnowledgeBaseSummary::to_json() const {
    nlohmann::json j;
    j["kb"] = kb;
    j["num_concepts"] = num_concepts;
    j["num_synonyms"] = num_synonyms;
    j["num_alt_ids"] = num_alt_ids;
    j["num_aliases"] = num_aliases;
    j["num_single_parent"] = num_single_parent;
    j["num_edges"] = num_edges;
    j["num_graph_nodes"] = num_graph_nodes;
    j["num_graph_edges"] = num_graph_edges;
    j["max_descendants"] = max_descendants;
    if (root_concept) {
        j["root_concept"] = *root_concept;
    }
    return j;
}

// ==========================================
// KnowledgeBase Implementation
// ==========================================

KnowledgeBase::KnowledgeBase(std::string kb) : kb_(std::move(kb)) {}

KnowledgeBase KnowledgeBase::build(
    const ExtractionResult& result,
    const SourceProfile& profile,
    size_t num_threads
) {
    KnowledgeBase kb(result.kb.empty() ? profile.kb : result.kb);

    for (const auto& record : result.concepts) {
        kb.add_concept(record);
    }
    for (const auto& edge : result.edges) {
        kb.add_edge(edge);
    }

    kb.ensure_root(profile);
    kb.finalize(num_threads);

    return kb;
}

void KnowledgeBase::require_not_finalized() const {
    if (finalized_) {
        throw std::logic_error("Knowledge base '" + kb_ + "' is finalized and cannot be modified");
    }
}

void KnowledgeBase::add_concept(const ConceptRecord& concept_record) {
    require_not_finalized();

    const std::string& id = concept_record.id;

    if (concept_record.obsolete) {
        retract_concept(id);
        return;
    }

    name_to_id_.set(concept_record.name, id);
    id_to_name_.set(id, concept_record.name);

    for (const auto& alt_id : concept_record.alt_ids) {
        alt_id_to_id_.set(alt_id, id);
    }

    // Only concepts with exactly one direct ancestor get the shortcut
    if (concept_record.parents.size() == 1) {
        child_to_parent_.set(id, concept_record.parents.front());
    }
    for (const auto& parent : concept_record.parents) {
        push_edge({id, parent}, id);
    }

    for (const auto& edge : concept_record.extra_edges) {
        push_edge(edge, id);
    }

    for (const auto& synonym : concept_record.synonyms) {
        synonym_to_id_.set(synonym, id);
    }

    for (const auto& alias : concept_record.aliases) {
        alias_to_id_.set(alias, id);
    }
}

bool KnowledgeBase::retract_concept(const std::string& id) {
    require_not_finalized();

    if (!id_to_name_.erase(id)) {
        return false;
    }

    auto points_to_id = [&id](const auto& entry) { return entry.second == id; };
    name_to_id_.erase_if(points_to_id);
    synonym_to_id_.erase_if(points_to_id);
    alt_id_to_id_.erase_if(points_to_id);
    alias_to_id_.erase_if(points_to_id);
    child_to_parent_.erase(id);

    size_t kept = 0;
    for (size_t i = 0; i < edges_.size(); ++i) {
        if (edge_owners_[i] == id) {
            continue;
        }
        if (kept != i) {
            edges_[kept] = std::move(edges_[i]);
            edge_owners_[kept] = std::move(edge_owners_[i]);
        }
        ++kept;
    }
    edges_.resize(kept);
    edge_owners_.resize(kept);

    return true;
}

void KnowledgeBase::push_edge(const Edge& edge, const std::string& owner) {
    edges_.push_back(edge);
    edge_owners_.push_back(owner);
}

void KnowledgeBase::add_edge(const Edge& edge) {
    require_not_finalized();
    push_edge(edge, std::string());
}

void KnowledgeBase::add_edge(const std::string& source, const std::string& target) {
    add_edge(Edge{source, target});
}

void KnowledgeBase::ensure_root(const SourceProfile& profile) {
    require_not_finalized();

    if (!profile.root) {
        return;
    }

    const RootConcept& root = *profile.root;
    std::string root_id;

    const std::string* existing = name_to_id_.find(root.name);
    if (profile.always_inject_root || existing == nullptr) {
        name_to_id_.set(root.name, root.id);
        id_to_name_.set(root.id, root.name);
        root_id = root.id;
    } else {
        root_id = *existing;
    }

    for (const auto& child : profile.bridging_children) {
        push_edge({child, root_id}, std::string());
    }

    root_concept_ = root_id;
}

void KnowledgeBase::finalize(size_t num_threads) {
    require_not_finalized();

    graph_ = ConceptGraph::from_edges(edges_);

    // Undirected view: both directions, duplicates kept
    node_to_node_.clear();
    for (const auto& edge : edges_) {
        node_to_node_[edge.source].push_back(edge.target);
        node_to_node_[edge.target].push_back(edge.source);
    }

    id_to_info_.clear();
    auto info = graph_.compute_node_info(num_threads);
    const auto& nodes = graph_.nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        id_to_info_.set(nodes[i], info[i]);
    }

    finalized_ = true;
}

// ==========================================
// Queries
// ==========================================

std::optional<std::string> KnowledgeBase::lookup(const std::string& name_or_synonym) const {
    if (const auto* id = name_to_id_.find(name_or_synonym)) {
        return *id;
    }
    if (const auto* id = synonym_to_id_.find(name_or_synonym)) {
        return *id;
    }
    return std::nullopt;
}

std::string KnowledgeBase::canonical_id(const std::string& id) const {
    if (id_to_name_.contains(id)) {
        return id;
    }
    if (const auto* current = alt_id_to_id_.find(id)) {
        return *current;
    }
    if (const auto* current = alias_to_id_.find(id)) {
        return *current;
    }
    return id;
}

KnowledgeBaseSummary KnowledgeBase::summary() const {
    KnowledgeBaseSummary s;
    s.kb = kb_;
    s.num_concepts = id_to_name_.size();
    s.num_synonyms = synonym_to_id_.size();
    s.num_alt_ids = alt_id_to_id_.size();
    s.num_aliases = alias_to_id_.size();
    s.num_single_parent = child_to_parent_.size();
    s.num_edges = edges_.size();
    s.num_graph_nodes = graph_.num_nodes();
    s.num_graph_edges = graph_.num_edges();
    for (const auto& [id, info] : id_to_info_) {
        s.max_descendants = std::max(s.max_descendants, info.num_descendants);
    }
    s.root_concept = root_concept_;
    return s;
}

} // namespace kbg
