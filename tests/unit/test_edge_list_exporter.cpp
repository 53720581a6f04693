#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "export/edge_list_exporter.hpp"
#include "temp_dir.hpp"

using namespace kbg;
using kbg::test_support::TempDir;

namespace {

OrderedMap<std::string, std::string> names(
    const std::vector<std::pair<std::string, std::string>>& entries
) {
    OrderedMap<std::string, std::string> map;
    for (const auto& [name, id] : entries) {
        map.set(name, id);
    }
    return map;
}

}  // namespace

class EdgeListExporterTest : public ::testing::Test {
protected:
    TempDir dir;
    EdgeListExporter exporter;
    IdMapping mapping = IdMapping::from_name_to_id(
        names({{"alpha", "A"}, {"beta", "B"}, {"gamma", "C"}}));
};

// ==========================================
// Id Mapping Tests
// ==========================================

TEST_F(EdgeListExporterTest, NumbersInNameOrder) {
    EXPECT_EQ(mapping.size(), 3u);
    EXPECT_EQ(mapping.lookup("A"), std::optional<size_t>(0));
    EXPECT_EQ(mapping.lookup("B"), std::optional<size_t>(1));
    EXPECT_EQ(mapping.lookup("C"), std::optional<size_t>(2));
    EXPECT_FALSE(mapping.lookup("D").has_value());
    EXPECT_EQ(mapping.int_to_node_id(), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(EdgeListExporterTest, SharedIdentifierKeepsLaterInteger) {
    IdMapping shared = IdMapping::from_name_to_id(
        names({{"heart", "H"}, {"lung", "L"}, {"cor", "H"}}));

    EXPECT_EQ(shared.size(), 3u);
    EXPECT_EQ(shared.int_to_node_id(), (std::vector<std::string>{"H", "L", "H"}));
    EXPECT_EQ(shared.lookup("H"), std::optional<size_t>(2));

    // First-numbered order is kept in the JSON object
    EXPECT_EQ(shared.node_to_int_json().dump(), "{\"H\":2,\"L\":1}");
}

TEST_F(EdgeListExporterTest, SaveWritesBothFiles) {
    std::string kb_dir = (dir.path() / "kbs" / "demo").string();
    mapping.save(kb_dir);

    EXPECT_EQ(dir.read("kbs/demo/int_to_node_id.json"),
              "{\n    \"0\": \"A\",\n    \"1\": \"B\",\n    \"2\": \"C\"\n}");
    EXPECT_EQ(dir.read("kbs/demo/node_id_to_int.json"),
              "{\n    \"A\": 0,\n    \"B\": 1,\n    \"C\": 2\n}");
}

TEST_F(EdgeListExporterTest, LoadRestoresMapping) {
    std::string kb_dir = (dir.path() / "demo").string();
    mapping.save(kb_dir);

    IdMapping loaded = IdMapping::load(kb_dir);
    EXPECT_EQ(loaded.int_to_node_id(), mapping.int_to_node_id());
    EXPECT_EQ(loaded.lookup("C"), std::optional<size_t>(2));
}

TEST_F(EdgeListExporterTest, LoadRebuildsIntToNodeWhenAbsent) {
    dir.write("demo/node_id_to_int.json", "{\"X\": 1, \"Y\": 0}");

    IdMapping loaded = IdMapping::load((dir.path() / "demo").string());
    EXPECT_EQ(loaded.int_to_node_id(), (std::vector<std::string>{"Y", "X"}));
}

TEST_F(EdgeListExporterTest, LoadWithoutMappingThrows) {
    EXPECT_THROW(IdMapping::load((dir.path() / "nowhere").string()), MissingFileError);
}

TEST_F(EdgeListExporterTest, LoadRejectsInvalidJson) {
    dir.write("broken/node_id_to_int.json", "{not json");
    EXPECT_THROW(IdMapping::load((dir.path() / "broken").string()), std::runtime_error);
}

// ==========================================
// Edge List Tests
// ==========================================

TEST_F(EdgeListExporterTest, CycleScenario) {
    std::vector<Edge> edges = {{"A", "B"}, {"B", "C"}, {"C", "B"}};
    std::string path = (dir.path() / "graph" / "demo.edgelist").string();

    ExportStatistics stats = exporter.write(edges, mapping, path);

    EXPECT_EQ(dir.read("graph/demo.edgelist"), "0 1\n1 2\n2 1\n");
    EXPECT_EQ(stats.edges_written, 3u);
    EXPECT_EQ(stats.edges_dropped, 0u);
}

TEST_F(EdgeListExporterTest, UnmappedEndpointsDroppedInOrder) {
    std::vector<Edge> edges = {
        {"A", "B"}, {"A", "X"}, {"C", "A"}, {"Y", "C"}, {"B", "C"}
    };

    ExportStatistics stats;
    std::string rendered = exporter.render(edges, mapping, &stats);

    EXPECT_EQ(rendered, "0 1\n2 0\n1 2\n");
    EXPECT_EQ(stats.edges_total, 5u);
    EXPECT_EQ(stats.edges_written, 3u);
    EXPECT_EQ(stats.edges_dropped, 2u);
}

TEST_F(EdgeListExporterTest, EmptyEdgeListWritesEmptyFile) {
    std::string path = (dir.path() / "empty.edgelist").string();
    exporter.write({}, mapping, path);

    EXPECT_TRUE(dir.exists("empty.edgelist"));
    EXPECT_EQ(dir.read("empty.edgelist"), "");
}

TEST_F(EdgeListExporterTest, StatisticsJson) {
    ExportStatistics stats{4, 3, 1};
    auto j = stats.to_json();
    EXPECT_EQ(j["edges_total"], 4);
    EXPECT_EQ(j["edges_dropped"], 1);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
