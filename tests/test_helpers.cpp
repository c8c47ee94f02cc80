/**
 * @file test_helpers.cpp
 * @brief Listing format and CSV export
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

TEST(FormatTest, ScoreKeepsSignificantDecimalsOnly) {
    EXPECT_EQ(format_score(14.5), "14.5");
    EXPECT_EQ(format_score(12.0), "12");
    EXPECT_EQ(format_score(13.25), "13.25");
    EXPECT_EQ(format_score(0.0), "0");
}

TEST(FormatTest, CsvEscape) {
    EXPECT_EQ(csv_escape("Réseaux"), "Réseaux");
    EXPECT_EQ(csv_escape("Algèbre, analyse"), "\"Algèbre, analyse\"");
    EXPECT_EQ(csv_escape("dit \"TP\""), "\"dit \"\"TP\"\"\"");
}

TEST(FormatTest, DimensionNames) {
    Dimension d;
    ASSERT_TRUE(parse_dimension("years", d));
    EXPECT_EQ(d, Dimension::Year);
    ASSERT_TRUE(parse_dimension("ues", d));
    EXPECT_EQ(d, Dimension::Unit);
    ASSERT_TRUE(parse_dimension("courses", d));
    EXPECT_EQ(d, Dimension::Course);
    EXPECT_FALSE(parse_dimension("students", d));
    EXPECT_FALSE(parse_dimension("", d));
}

TEST(FormatTest, DescribeFilters) {
    Filters f;
    EXPECT_EQ(describe_filters(f), "(none)");
    f.academic_year = "2022-2023";
    f.semester = "7";
    EXPECT_EQ(describe_filters(f), "annee=2022-2023, semestre=7");
}

TEST(ListingTest, StudentGradesIndentCourses) {
    GradeRow unit;
    unit.student_id = 1;
    unit.student.family_name = "DUPONT";
    unit.student.given_name = "Jean";
    unit.grade.unit_code = "UE401";
    unit.grade.course_name = "UE401";
    unit.grade.score = 14.5;
    unit.grade.is_unit = true;

    GradeRow course = unit;
    course.grade.course_name = "Réseaux";
    course.grade.score = 14.0;
    course.grade.is_unit = false;

    std::ostringstream out;
    print_student_grades(out, { unit, course });
    const std::string text = out.str();

    EXPECT_NE(text.find("Jean DUPONT"), std::string::npos);
    EXPECT_NE(text.find("\n  UE401  14.5/20\n"), std::string::npos);
    EXPECT_NE(text.find("\n      Réseaux  14/20\n"), std::string::npos);
}

TEST(ExportCsvTest, HeaderAndRows) {
    ExportRow r;
    r.student.family_name = "DE LA CRUZ";
    r.student.given_name = "Marie-Hélène";
    r.student.student_number = "22334455";
    r.student.track = "API";
    r.student.academic_year = "2022-2023";
    r.student.semester = "7";
    r.grade.unit_code = "UE402";
    r.grade.course_name = "Algèbre, linéaire";
    r.grade.score = 9.0;
    r.grade.is_unit = false;

    const std::string path = ::testing::TempDir() + "apogee_export_test.csv";
    ASSERT_TRUE(write_export_csv({ r }, path));

    std::ifstream in(path);
    std::string header, line, extra;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, header)));
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_FALSE(static_cast<bool>(std::getline(in, extra)));

    EXPECT_EQ(header, "Nom,Prenom,NumeroEtudiant,Parcours,Annee,Semestre,UE,Cours,Note,EstUE");
    EXPECT_EQ(line, "DE LA CRUZ,Marie-Hélène,22334455,API,2022-2023,7,UE402,\"Algèbre, linéaire\",9,0");

    in.close();
    std::remove(path.c_str());
}

TEST(ExportCsvTest, UnwritablePath) {
    EXPECT_FALSE(write_export_csv({}, "/nonexistent-dir/out.csv"));
}
