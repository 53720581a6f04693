#include <gtest/gtest.h>
#include "graph/concept_graph.hpp"
#include "model/records.hpp"
#include <vector>

using namespace kbg;

class ConceptGraphTest : public ::testing::Test {
protected:
    ConceptGraph graph;

    void SetUp() override {
        // Small is-a hierarchy: D -> B -> A, D -> C -> A, E -> C
        graph.add_edge("B", "A");
        graph.add_edge("C", "A");
        graph.add_edge("D", "B");
        graph.add_edge("D", "C");
        graph.add_edge("E", "C");
    }
};

// ==========================================
// Structure Tests
// ==========================================

TEST_F(ConceptGraphTest, NodesInFirstSeenOrder) {
    EXPECT_EQ(graph.nodes(), (std::vector<std::string>{"B", "A", "C", "D", "E"}));
    EXPECT_EQ(graph.num_nodes(), 5u);
    EXPECT_EQ(graph.num_edges(), 5u);
}

TEST_F(ConceptGraphTest, ParallelEdgesCollapse) {
    EXPECT_FALSE(graph.add_edge("B", "A"));
    EXPECT_EQ(graph.num_edges(), 5u);
    EXPECT_EQ(graph.out_degree("B"), 1u);
}

TEST_F(ConceptGraphTest, Degrees) {
    EXPECT_EQ(graph.out_degree("D"), 2u);
    EXPECT_EQ(graph.in_degree("D"), 0u);
    EXPECT_EQ(graph.in_degree("A"), 2u);
    EXPECT_EQ(graph.out_degree("A"), 0u);
    EXPECT_EQ(graph.in_degree("C"), 2u);
    EXPECT_EQ(graph.out_degree("missing"), 0u);
}

TEST_F(ConceptGraphTest, Neighbours) {
    EXPECT_EQ(graph.successors("D"), (std::vector<std::string>{"B", "C"}));
    EXPECT_EQ(graph.predecessors("C"), (std::vector<std::string>{"D", "E"}));
    EXPECT_TRUE(graph.has_edge("E", "C"));
    EXPECT_FALSE(graph.has_edge("C", "E"));
}

// ==========================================
// Descendant Tests
// ==========================================

TEST_F(ConceptGraphTest, DescendantsFollowOutgoingEdges) {
    EXPECT_EQ(graph.descendants("D"), (std::set<std::string>{"A", "B", "C"}));
    EXPECT_EQ(graph.count_descendants("E"), 2u);
    EXPECT_EQ(graph.count_descendants("B"), 1u);
}

TEST_F(ConceptGraphTest, SinkHasNoDescendants) {
    EXPECT_EQ(graph.count_descendants("A"), 0u);
    EXPECT_TRUE(graph.descendants("A").empty());
}

TEST(ConceptGraphCycleTest, CycleTerminates) {
    std::vector<Edge> edges = {{"A", "B"}, {"B", "C"}, {"C", "B"}};
    ConceptGraph graph = ConceptGraph::from_edges(edges);

    EXPECT_EQ(graph.count_descendants("A"), 2u);
    EXPECT_GE(graph.count_descendants("B"), 1u);
    EXPECT_EQ(graph.descendants("B"), (std::set<std::string>{"B", "C"}));
}

TEST(ConceptGraphCycleTest, SelfLoopCountsOnce) {
    ConceptGraph graph;
    graph.add_edge("X", "X");

    EXPECT_EQ(graph.num_nodes(), 1u);
    EXPECT_EQ(graph.count_descendants("X"), 1u);
    EXPECT_EQ(graph.out_degree("X"), 1u);
    EXPECT_EQ(graph.in_degree("X"), 1u);
}

// ==========================================
// Node Info Tests
// ==========================================

TEST_F(ConceptGraphTest, NodeInfoAlignedWithNodes) {
    auto info = graph.compute_node_info();
    ASSERT_EQ(info.size(), graph.num_nodes());

    const auto& nodes = graph.nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        EXPECT_EQ(info[i].out_degree, graph.out_degree(nodes[i]));
        EXPECT_EQ(info[i].in_degree, graph.in_degree(nodes[i]));
        EXPECT_EQ(info[i].num_descendants, graph.count_descendants(nodes[i]));
    }
}

TEST_F(ConceptGraphTest, ThreadedNodeInfoMatchesSerial) {
    for (int i = 0; i < 50; ++i) {
        graph.add_edge("N" + std::to_string(i + 1), "N" + std::to_string(i));
    }
    graph.add_edge("N0", "D");

    auto serial = graph.compute_node_info(1);
    auto threaded = graph.compute_node_info(4);
    EXPECT_EQ(serial, threaded);
}

TEST_F(ConceptGraphTest, MoreThreadsThanNodesJoinsCleanly) {
    auto serial = graph.compute_node_info(1);
    for (int run = 0; run < 3; ++run) {
        EXPECT_EQ(graph.compute_node_info(64), serial);
    }
}

TEST(NodeInfoTest, JsonIsTriple) {
    NodeInfo info{2, 1, 7};
    EXPECT_EQ(info.to_json(), nlohmann::json::array({2, 1, 7}));
}

TEST(ConceptGraphEmptyTest, EmptyGraph) {
    ConceptGraph graph;
    EXPECT_TRUE(graph.empty());
    EXPECT_TRUE(graph.compute_node_info(3).empty());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
