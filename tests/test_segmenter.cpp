/**
 * @file test_segmenter.cpp
 * @brief Header detection and two-pass block segmentation
 */

#include <gtest/gtest.h>

#include "segmenter.hpp"
#include "parser.hpp"
#include "validation.hpp"

#include <string>
#include <vector>

namespace {

std::string fixture(const std::string& name) {
    std::string content;
    EXPECT_TRUE(read_text_file(std::string(TEST_DATA_DIR) + "/" + name, content));
    return content;
}

} // namespace

// =============================================================================
// Parcours (header) detection
// =============================================================================

TEST(ParcoursInfoTest, FullHeader) {
    AppConfig cfg;
    ParcoursInfo p = extract_parcours_info(fixture("transcript_m1.txt"), cfg);
    EXPECT_EQ(p.track, "API");
    EXPECT_EQ(p.semester, "7");
    EXPECT_EQ(p.academic_year, "2022-2023");
    EXPECT_TRUE(p.header_complete);
    EXPECT_TRUE(p.defaulted_fields.empty());
}

TEST(ParcoursInfoTest, SessionFormYear) {
    AppConfig cfg;
    ParcoursInfo p = extract_parcours_info(fixture("transcript_session.txt"), cfg);
    EXPECT_EQ(p.academic_year, "2023-2024");
    EXPECT_EQ(p.semester, "8");
    EXPECT_EQ(p.track, "IDU");
    EXPECT_TRUE(p.header_complete);
}

TEST(ParcoursInfoTest, PlaceholdersWhenNothingMatches) {
    AppConfig cfg;
    ParcoursInfo p = extract_parcours_info("Relevé de notes\n", cfg);
    EXPECT_EQ(p.track, "M1 API");
    EXPECT_EQ(p.semester, "7");
    EXPECT_EQ(p.academic_year, "2022-2023");
    EXPECT_FALSE(p.header_complete);
    EXPECT_EQ(p.defaulted_fields.size(), 3u);
}

TEST(ParcoursInfoTest, PlaceholdersComeFromConfig) {
    AppConfig cfg;
    cfg.default_year = "2030-2031";
    ParcoursInfo p = extract_parcours_info("inscrit en Semestre 9 API\n", cfg);
    EXPECT_EQ(p.semester, "9");
    EXPECT_EQ(p.academic_year, "2030-2031");
    ASSERT_EQ(p.defaulted_fields.size(), 1u);
    EXPECT_EQ(p.defaulted_fields[0], "academic_year");
}

// =============================================================================
// Segmentation
// =============================================================================

TEST(SegmenterTest, AnchorsAreNameLinesAboveStudentNumbers) {
    std::vector<std::string> lines = {
        "Relevé",                      // 0
        "",                            // 1
        "DUPONT Jean",                 // 2
        "N° Etudiant : 1 INE : X",     // 3
        "UE401 A 10/20",               // 4
        "",                            // 5
        "N° Etudiant : 2 INE : Y",     // 6  no name above: ignored
        "MARTIN Paul",                 // 7
        "N° Etudiant : 3 INE : Z",     // 8
    };
    auto anchors = find_block_anchors(lines);
    ASSERT_EQ(anchors.size(), 2u);
    EXPECT_EQ(anchors[0], 2u);
    EXPECT_EQ(anchors[1], 7u);
}

TEST(SegmenterTest, BlocksStopAtPageHeader) {
    std::vector<std::string> lines = {
        "DUPONT Jean",
        "N° Etudiant : 1 INE : X",
        "UE401 A 10/20",
        "",
        "Université Savoie Mont Blanc Année universitaire 2022/2023",
        "page 2",
        "",
        "MARTIN Paul",
        "N° Etudiant : 3 INE : Z",
        "UE401 A 12/20",
        "",
    };
    AppConfig cfg;
    auto blocks = slice_blocks(lines, find_block_anchors(lines), cfg.page_header_marker);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "DUPONT Jean\nN° Etudiant : 1 INE : X\nUE401 A 10/20");
    EXPECT_EQ(blocks[0].first_line, 1);
    EXPECT_EQ(blocks[1].text, "MARTIN Paul\nN° Etudiant : 3 INE : Z\nUE401 A 12/20");
    EXPECT_EQ(blocks[1].first_line, 8);
}

TEST(SegmenterTest, FixtureDocument) {
    AppConfig cfg;
    SegmentedDocument doc = segment_document(fixture("transcript_m1.txt"), cfg);
    ASSERT_EQ(doc.blocks.size(), 3u);

    EXPECT_TRUE(starts_with(doc.blocks[0].text, "DUPONT Jean\n"));
    EXPECT_TRUE(starts_with(doc.blocks[1].text, "DE LA CRUZ Marie-Hélène\n"));
    EXPECT_TRUE(starts_with(doc.blocks[2].text, "LÉGER Éloïse\n"));

    // the page break between the second and third student is not part of either block
    EXPECT_EQ(doc.blocks[1].text.find("Université"), std::string::npos);
    EXPECT_EQ(doc.blocks[1].text.find("page 2"), std::string::npos);
}

TEST(SegmenterTest, EmptyDocument) {
    AppConfig cfg;
    SegmentedDocument doc = segment_document("", cfg);
    EXPECT_TRUE(doc.blocks.empty());
    EXPECT_FALSE(doc.parcours.header_complete);
}
