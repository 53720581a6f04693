#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "config/source_profile.hpp"
#include "extract/tabular_extractors.hpp"
#include "model/knowledge_base.hpp"
#include "temp_dir.hpp"

using namespace kbg;
using kbg::test_support::TempDir;

class TextExtractorTest : public ::testing::Test {
protected:
    TempDir dir;
    SourceProfile profile = SourceProfileRegistry::defaults().resolve("custom", "txt");

    ExtractionResult extract(const std::string& terms, const std::string& edges) {
        SourceFiles files;
        files.terms = dir.write("terms.txt", terms);
        files.edges = dir.write("edges.txt", edges);
        TextExtractor extractor(profile, files);
        return extractor.extract();
    }
};

TEST_F(TextExtractorTest, BlankLineInTermsSkipped) {
    ExtractionResult result = extract(
        "T1\tfirst\n"
        "T2\tsecond\n"
        "\n"
        "T3\tthird\n"
        "T4\tfourth\n",
        "T2\tT1\n");

    ASSERT_EQ(result.concepts.size(), 4u);
    EXPECT_EQ(result.concepts[0].id, "T1");
    EXPECT_EQ(result.concepts[1].name, "second");
    EXPECT_EQ(result.concepts[2].id, "T3");
    EXPECT_EQ(result.concepts[3].name, "fourth");
    EXPECT_EQ(result.stats.records_read, 4u);
}

TEST_F(TextExtractorTest, SynonymsSplitOnSemicolon) {
    ExtractionResult result = extract(
        "T1\tfirst\tone;uno;;eins\n"
        "T2\tsecond\n",
        "");

    ASSERT_EQ(result.concepts.size(), 2u);
    EXPECT_EQ(result.concepts[0].synonyms, (std::vector<std::string>{"one", "uno", "eins"}));
    EXPECT_TRUE(result.concepts[1].synonyms.empty());
    EXPECT_TRUE(result.edges.empty());
}

TEST_F(TextExtractorTest, EdgesInFileOrderWithBlankLines) {
    ExtractionResult result = extract(
        "A\talpha\nB\tbeta\nC\tgamma\n",
        "A\tB\n"
        "\n"
        "B\tC\n"
        "C\tB\n"
        "\n");

    std::vector<Edge> expected = {{"A", "B"}, {"B", "C"}, {"C", "B"}};
    EXPECT_EQ(result.edges, expected);
}

TEST_F(TextExtractorTest, CrlfTermsParsed) {
    ExtractionResult result = extract("T1\tfirst\r\n\r\nT2\tsecond\r\n", "T2\tT1\r\n");

    ASSERT_EQ(result.concepts.size(), 2u);
    EXPECT_EQ(result.concepts[0].name, "first");
    EXPECT_EQ(result.edges[0].target, "T1");
}

TEST_F(TextExtractorTest, TermWithoutNameAborts) {
    try {
        extract("T1\tfirst\nT2\n", "");
        FAIL() << "expected MalformedRecordError";
    } catch (const MalformedRecordError& e) {
        EXPECT_EQ(e.line(), 2u);
    }
}

TEST_F(TextExtractorTest, EdgeWithoutParentAborts) {
    EXPECT_THROW(extract("T1\tfirst\n", "T1\n"), MalformedRecordError);
}

TEST_F(TextExtractorTest, MissingEdgesFile) {
    SourceFiles files;
    files.terms = dir.write("terms.txt", "T1\tfirst\n");
    files.edges = (dir.path() / "missing.txt").string();
    TextExtractor extractor(profile, files);

    EXPECT_THROW(extractor.extract(), MissingFileError);
}

TEST_F(TextExtractorTest, BuiltModelKeepsTermsWithoutEdges) {
    ExtractionResult result = extract(
        "A\talpha\nB\tbeta\nZ\tlonely\n",
        "A\tB\n");
    KnowledgeBase kb = KnowledgeBase::build(result, profile);

    EXPECT_TRUE(kb.name_to_id().contains("lonely"));
    EXPECT_FALSE(kb.id_to_info().contains("Z"));
    EXPECT_EQ(kb.id_to_info().at("A").num_descendants, 1u);
    // Plain-text edges are standalone, so no single-parent shortcut
    EXPECT_TRUE(kb.child_to_parent().empty());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
