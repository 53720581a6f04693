#include <gtest/gtest.h>
#include "model/knowledge_base.hpp"
#include <algorithm>

using namespace kbg;

namespace {

ConceptRecord make_concept(const std::string& id, const std::string& name,
                           std::vector<std::string> parents = {},
                           std::vector<std::string> synonyms = {}) {
    ConceptRecord record;
    record.id = id;
    record.name = name;
    record.parents = std::move(parents);
    record.synonyms = std::move(synonyms);
    return record;
}

bool lists(const std::vector<std::string>& neighbours, const std::string& id) {
    return std::find(neighbours.begin(), neighbours.end(), id) != neighbours.end();
}

}  // namespace

class KnowledgeBaseTest : public ::testing::Test {
protected:
    KnowledgeBase kb{"test"};

    void SetUp() override {
        kb.add_concept(make_concept("T:1", "root"));
        kb.add_concept(make_concept("T:2", "organ", {"T:1"}, {"body part"}));
        kb.add_concept(make_concept("T:3", "heart", {"T:2"}, {"cardiac organ", "cor"}));
        kb.add_concept(make_concept("T:4", "valve", {"T:3", "T:2"}));
    }
};

// ==========================================
// Mapping Tests
// ==========================================

TEST_F(KnowledgeBaseTest, NameAndIdMappingsAgree) {
    for (const auto& [name, id] : kb.name_to_id()) {
        ASSERT_NE(kb.id_to_name().find(id), nullptr);
        EXPECT_EQ(kb.id_to_name().at(id), name);
    }
    EXPECT_EQ(kb.num_concepts(), 4u);
}

TEST_F(KnowledgeBaseTest, SynonymsResolveToId) {
    EXPECT_EQ(kb.synonym_to_id().at("cardiac organ"), "T:3");
    EXPECT_EQ(kb.lookup("cor"), std::optional<std::string>("T:3"));
    EXPECT_EQ(kb.lookup("heart"), std::optional<std::string>("T:3"));
    EXPECT_FALSE(kb.lookup("lung").has_value());
}

TEST_F(KnowledgeBaseTest, DuplicateNameLaterRecordWins) {
    kb.add_concept(make_concept("T:9", "heart"));

    EXPECT_EQ(kb.name_to_id().at("heart"), "T:9");
    EXPECT_EQ(kb.id_to_name().at(kb.name_to_id().at("heart")), "heart");
    // The earlier identifier keeps its own name entry
    EXPECT_EQ(kb.id_to_name().at("T:3"), "heart");
}

TEST_F(KnowledgeBaseTest, DuplicateSynonymLaterRecordWins) {
    kb.add_concept(make_concept("T:5", "chamber", {"T:3"}, {"cor"}));
    EXPECT_EQ(kb.synonym_to_id().at("cor"), "T:5");
}

TEST_F(KnowledgeBaseTest, ChildToParentOnlyForSingleParent) {
    EXPECT_FALSE(kb.child_to_parent().contains("T:1"));    // no parent
    EXPECT_EQ(kb.child_to_parent().at("T:2"), "T:1");
    EXPECT_EQ(kb.child_to_parent().at("T:3"), "T:2");
    EXPECT_FALSE(kb.child_to_parent().contains("T:4"));    // two parents
}

TEST_F(KnowledgeBaseTest, EveryParentBecomesAnEdge) {
    std::vector<Edge> expected = {
        {"T:2", "T:1"}, {"T:3", "T:2"}, {"T:4", "T:3"}, {"T:4", "T:2"}
    };
    EXPECT_EQ(kb.edges(), expected);
}

TEST_F(KnowledgeBaseTest, AltIdsPointAtKnownConcepts) {
    ConceptRecord record = make_concept("T:6", "atrium", {"T:3"});
    record.alt_ids = {"T:60", "T:61"};
    kb.add_concept(record);

    for (const auto& [alt_id, id] : kb.alt_id_to_id()) {
        EXPECT_TRUE(kb.id_to_name().contains(id)) << alt_id;
    }
    EXPECT_EQ(kb.canonical_id("T:61"), "T:6");
    EXPECT_EQ(kb.canonical_id("T:6"), "T:6");
    EXPECT_EQ(kb.canonical_id("T:404"), "T:404");
}

TEST_F(KnowledgeBaseTest, AliasesResolveToId) {
    ConceptRecord record = make_concept("T:7", "ventricle", {"T:3"});
    record.aliases = {"C0018827"};
    kb.add_concept(record);

    EXPECT_EQ(kb.alias_to_id().at("C0018827"), "T:7");
    EXPECT_EQ(kb.canonical_id("C0018827"), "T:7");
}

// ==========================================
// Obsolete Tests
// ==========================================

TEST_F(KnowledgeBaseTest, ObsoleteRecordRetractsConcept) {
    ConceptRecord record = make_concept("T:8", "septum", {"T:3"}, {"wall"});
    record.alt_ids = {"T:80"};
    kb.add_concept(record);

    ConceptRecord obsolete = make_concept("T:8", "septum");
    obsolete.obsolete = true;
    kb.add_concept(obsolete);

    EXPECT_FALSE(kb.name_to_id().contains("septum"));
    EXPECT_FALSE(kb.id_to_name().contains("T:8"));
    EXPECT_FALSE(kb.synonym_to_id().contains("wall"));
    EXPECT_FALSE(kb.alt_id_to_id().contains("T:80"));
    EXPECT_FALSE(kb.child_to_parent().contains("T:8"));
    for (const auto& edge : kb.edges()) {
        EXPECT_NE(edge.source, "T:8");
    }
}

TEST_F(KnowledgeBaseTest, ObsoleteRecordNeverRegistered) {
    ConceptRecord obsolete = make_concept("T:99", "gone", {"T:1"});
    obsolete.obsolete = true;
    kb.add_concept(obsolete);

    EXPECT_FALSE(kb.name_to_id().contains("gone"));
    EXPECT_FALSE(kb.id_to_name().contains("T:99"));
    EXPECT_FALSE(kb.retract_concept("T:99"));
}

TEST_F(KnowledgeBaseTest, RetractionRemovesOnlyTheRecordsOwnEdges) {
    ConceptRecord record = make_concept("T:8", "septum", {"T:3"});
    record.extra_edges = {{"T:1", "T:8"}};
    kb.add_concept(record);
    kb.add_edge("T:8", "T:2");
    size_t before = kb.edges().size();

    EXPECT_TRUE(kb.retract_concept("T:8"));

    const auto& edges = kb.edges();
    EXPECT_EQ(edges.size(), before - 2);
    EXPECT_NE(std::find(edges.begin(), edges.end(), Edge{"T:8", "T:2"}), edges.end());
    EXPECT_EQ(std::find(edges.begin(), edges.end(), Edge{"T:8", "T:3"}), edges.end());
    EXPECT_EQ(std::find(edges.begin(), edges.end(), Edge{"T:1", "T:8"}), edges.end());
}

// ==========================================
// Finalize Tests
// ==========================================

TEST_F(KnowledgeBaseTest, NodeToNodeIsSymmetric) {
    kb.add_edge("T:4", "T:3");    // duplicate pair
    kb.finalize();

    for (const auto& edge : kb.edges()) {
        const auto* out = kb.node_to_node().find(edge.source);
        const auto* in = kb.node_to_node().find(edge.target);
        ASSERT_NE(out, nullptr);
        ASSERT_NE(in, nullptr);
        EXPECT_TRUE(lists(*out, edge.target));
        EXPECT_TRUE(lists(*in, edge.source));
    }

    // Duplicates are kept in the undirected view
    const auto& valve = kb.node_to_node().at("T:4");
    EXPECT_EQ(std::count(valve.begin(), valve.end(), "T:3"), 2);
}

TEST_F(KnowledgeBaseTest, IdToInfoCoversGraphNodesOnly) {
    kb.add_concept(make_concept("T:50", "isolated"));
    kb.finalize();

    EXPECT_TRUE(kb.name_to_id().contains("isolated"));
    EXPECT_FALSE(kb.id_to_info().contains("T:50"));
    EXPECT_FALSE(kb.graph().has_node("T:50"));
    EXPECT_EQ(kb.id_to_info().size(), kb.graph().num_nodes());

    const NodeInfo& valve = kb.id_to_info().at("T:4");
    EXPECT_EQ(valve.out_degree, 2u);
    EXPECT_EQ(valve.in_degree, 0u);
    EXPECT_EQ(valve.num_descendants, 3u);

    EXPECT_EQ(kb.id_to_info().at("T:1").num_descendants, 0u);
}

TEST_F(KnowledgeBaseTest, FinalizedModelRejectsMutation) {
    kb.finalize();
    EXPECT_TRUE(kb.is_finalized());
    EXPECT_THROW(kb.add_concept(make_concept("T:70", "late")), std::logic_error);
    EXPECT_THROW(kb.add_edge("T:1", "T:2"), std::logic_error);
}

// ==========================================
// Root Tests
// ==========================================

TEST(KnowledgeBaseRootTest, RootInjectedWhenAbsent) {
    SourceProfile profile;
    profile.kb = "do";
    profile.root = RootConcept{"DOID:4", "disease"};

    KnowledgeBase kb("do");
    kb.add_concept(make_concept("DOID:1", "flu"));
    kb.ensure_root(profile);

    EXPECT_EQ(kb.name_to_id().at("disease"), "DOID:4");
    EXPECT_EQ(kb.id_to_name().at("DOID:4"), "disease");
    EXPECT_EQ(kb.root_concept(), std::optional<std::string>("DOID:4"));
}

TEST(KnowledgeBaseRootTest, ExistingRootNameKept) {
    SourceProfile profile;
    profile.kb = "hp";
    profile.root = RootConcept{"HP:0000001", "All"};

    KnowledgeBase kb("hp");
    kb.add_concept(make_concept("HP:9", "All"));
    kb.ensure_root(profile);

    EXPECT_EQ(kb.name_to_id().at("All"), "HP:9");
    EXPECT_FALSE(kb.id_to_name().contains("HP:0000001"));
    EXPECT_EQ(kb.root_concept(), std::optional<std::string>("HP:9"));
}

TEST(KnowledgeBaseRootTest, AlwaysInjectOverridesExistingName) {
    SourceProfile profile;
    profile.kb = "ctd_chem";
    profile.root = RootConcept{"MESH:D", "Chemicals"};
    profile.always_inject_root = true;

    KnowledgeBase kb("ctd_chem");
    kb.add_concept(make_concept("MESH:D1", "Chemicals"));
    kb.ensure_root(profile);

    EXPECT_EQ(kb.name_to_id().at("Chemicals"), "MESH:D");
}

TEST(KnowledgeBaseRootTest, BridgingEdgesTargetRoot) {
    SourceProfile profile;
    profile.kb = "chebi";
    profile.root = RootConcept{"CHEBI:00", "root"};
    profile.bridging_children = {"CHEBI:24431", "CHEBI:50906"};

    ExtractionResult result;
    result.kb = "chebi";
    result.concepts.push_back(make_concept("CHEBI:24431", "chemical entity"));
    result.concepts.push_back(make_concept("CHEBI:50906", "role"));

    KnowledgeBase kb = KnowledgeBase::build(result, profile);

    std::vector<Edge> expected = {{"CHEBI:24431", "CHEBI:00"}, {"CHEBI:50906", "CHEBI:00"}};
    EXPECT_EQ(kb.edges(), expected);
    EXPECT_EQ(kb.id_to_info().at("CHEBI:00").in_degree, 2u);
    EXPECT_TRUE(kb.is_finalized());
}

TEST(KnowledgeBaseRootTest, NoRootProfileLeavesModelUnchanged) {
    SourceProfile profile;
    KnowledgeBase kb("cl");
    kb.add_concept(make_concept("CL:1", "cell"));
    kb.ensure_root(profile);

    EXPECT_EQ(kb.num_concepts(), 1u);
    EXPECT_FALSE(kb.root_concept().has_value());
}

// ==========================================
// Build Tests
// ==========================================

TEST(KnowledgeBaseBuildTest, StandaloneEdgesFollowConceptEdges) {
    ExtractionResult result;
    result.kb = "txt";
    result.concepts.push_back(make_concept("A", "alpha", {"B"}));
    result.concepts.push_back(make_concept("B", "beta"));
    result.edges.push_back({"C", "B"});

    KnowledgeBase kb = KnowledgeBase::build(result, SourceProfile{}, 2);

    std::vector<Edge> expected = {{"A", "B"}, {"C", "B"}};
    EXPECT_EQ(kb.edges(), expected);
    EXPECT_EQ(kb.id_to_info().at("B").in_degree, 2u);

    auto summary = kb.summary();
    EXPECT_EQ(summary.num_concepts, 2u);
    EXPECT_EQ(summary.num_edges, 2u);
    EXPECT_EQ(summary.num_graph_nodes, 3u);
    EXPECT_EQ(summary.max_descendants, 1u);
    EXPECT_EQ(summary.to_json()["num_graph_edges"], 2);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
