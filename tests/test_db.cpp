/**
 * @file test_db.cpp
 * @brief SQLite store: idempotent inserts, queries, filtered delete
 */

#include <gtest/gtest.h>

#include "db.hpp"

#include <string>
#include <vector>

namespace {

StudentRecord make_student(const std::string& family, const std::string& given,
    const std::string& year = "2022-2023", const std::string& track = "API", const std::string& semester = "7")
{
    StudentRecord s;
    s.family_name = family;
    s.given_name = given;
    s.student_number = "1000";
    s.track = track;
    s.academic_year = year;
    s.semester = semester;
    return s;
}

GradeEntry make_grade(const std::string& unit, const std::string& course, double score, bool is_unit) {
    GradeEntry g;
    g.unit_code = unit;
    g.course_name = course;
    g.score = score;
    g.is_unit = is_unit;
    return g;
}

class StoreTest : public ::testing::Test {
protected:
    StoreTest() : handle_(":memory:") {}

    void SetUp() override {
        ASSERT_TRUE(handle_.ok());
        ASSERT_TRUE(db_init_schema(db()));
    }

    sqlite3* db() const { return handle_.get(); }

    // One student with one unit and two courses.
    long long seed(const StudentRecord& s, const std::string& unit) {
        long long id = 0;
        EXPECT_EQ(db_insert_student(db(), s, id), InsertResult::Inserted);
        EXPECT_EQ(db_insert_grade(db(), id, make_grade(unit, unit, 12.0, true)), InsertResult::Inserted);
        EXPECT_EQ(db_insert_grade(db(), id, make_grade(unit, "Cours " + unit + " a", 11.0, false)), InsertResult::Inserted);
        EXPECT_EQ(db_insert_grade(db(), id, make_grade(unit, "Cours " + unit + " b", 13.0, false)), InsertResult::Inserted);
        return id;
    }

private:
    DbHandle handle_;
};

} // namespace

// =============================================================================
// Inserts
// =============================================================================

TEST_F(StoreTest, SchemaCreationIsRepeatable) {
    EXPECT_TRUE(db_init_schema(db()));
}

TEST_F(StoreTest, DuplicateStudentReturnsExistingId) {
    long long first = 0, second = 0;
    ASSERT_EQ(db_insert_student(db(), make_student("DUPONT", "Jean"), first), InsertResult::Inserted);
    ASSERT_EQ(db_insert_student(db(), make_student("DUPONT", "Jean"), second), InsertResult::Duplicate);
    EXPECT_EQ(first, second);

    // same person, other semester: a distinct identity
    long long other = 0;
    ASSERT_EQ(db_insert_student(db(), make_student("DUPONT", "Jean", "2022-2023", "API", "8"), other),
        InsertResult::Inserted);
    EXPECT_NE(other, first);
}

TEST_F(StoreTest, DuplicateGradeIsSkipped) {
    long long id = 0;
    ASSERT_EQ(db_insert_student(db(), make_student("DUPONT", "Jean"), id), InsertResult::Inserted);
    EXPECT_EQ(db_insert_grade(db(), id, make_grade("UE401", "Réseaux", 14.0, false)), InsertResult::Inserted);
    EXPECT_EQ(db_insert_grade(db(), id, make_grade("UE401", "Réseaux", 9.0, false)), InsertResult::Duplicate);

    std::vector<GradeRow> rows;
    ASSERT_TRUE(db_get_student_grades(db(), "DUPONT", "Jean", Filters{}, rows));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].grade.score, 14.0);
}

TEST_F(StoreTest, ScoreOutsideRangeIsAConstraintViolation) {
    long long id = 0;
    ASSERT_EQ(db_insert_student(db(), make_student("DUPONT", "Jean"), id), InsertResult::Inserted);
    EXPECT_EQ(db_insert_grade(db(), id, make_grade("UE401", "Réseaux", 25.0, false)), InsertResult::Constraint);
    EXPECT_EQ(db_insert_grade(db(), id, make_grade("UE401", "Maths", -1.0, false)), InsertResult::Constraint);
}

TEST_F(StoreTest, GradeForUnknownStudentIsAConstraintViolation) {
    EXPECT_EQ(db_insert_grade(db(), 4242, make_grade("UE401", "Réseaux", 10.0, false)), InsertResult::Constraint);
}

TEST_F(StoreTest, SavepointRollbackKeepsEarlierWork) {
    ASSERT_TRUE(db_begin(db()));
    seed(make_student("DUPONT", "Jean"), "UE401");
    {
        SavepointScope sp(db(), "import_student");
        ASSERT_TRUE(sp.ok());
        long long id = 0;
        ASSERT_EQ(db_insert_student(db(), make_student("MARTIN", "Paul"), id), InsertResult::Inserted);
        // destructor rolls back: never released
    }
    ASSERT_TRUE(db_commit(db()));

    DbCounts counts;
    ASSERT_TRUE(db_get_counts(db(), counts));
    EXPECT_EQ(counts.students, 1);
    EXPECT_EQ(counts.grades, 3);
    EXPECT_EQ(counts.units, 1);
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(StoreTest, ListDistinctPerDimension) {
    seed(make_student("DUPONT", "Jean", "2022-2023", "API", "7"), "UE401");
    seed(make_student("MARTIN", "Paul", "2023-2024", "IDU", "8"), "UE801");
    seed(make_student("LEGER", "Eloise", "2022-2023", "API", "8"), "UE402");

    std::vector<std::string> values;
    ASSERT_TRUE(db_list_distinct(db(), Dimension::Year, Filters{}, values));
    EXPECT_EQ(values, (std::vector<std::string>{ "2022-2023", "2023-2024" }));

    ASSERT_TRUE(db_list_distinct(db(), Dimension::Track, Filters{}, values));
    EXPECT_EQ(values, (std::vector<std::string>{ "API", "IDU" }));

    Filters api;
    api.track = "API";
    ASSERT_TRUE(db_list_distinct(db(), Dimension::Semester, api, values));
    EXPECT_EQ(values, (std::vector<std::string>{ "7", "8" }));

    ASSERT_TRUE(db_list_distinct(db(), Dimension::Unit, api, values));
    EXPECT_EQ(values, (std::vector<std::string>{ "UE401", "UE402" }));

    Filters one_unit;
    one_unit.unit_code = "UE801";
    ASSERT_TRUE(db_list_distinct(db(), Dimension::Course, one_unit, values));
    EXPECT_EQ(values, (std::vector<std::string>{ "Cours UE801 a", "Cours UE801 b" }));
}

TEST_F(StoreTest, FiltersCombineWithAnd) {
    seed(make_student("DUPONT", "Jean", "2022-2023", "API", "7"), "UE401");
    seed(make_student("MARTIN", "Paul", "2023-2024", "API", "7"), "UE401");

    Filters f;
    f.academic_year = "2023-2024";
    f.track = "API";
    std::vector<StudentRecord> students;
    ASSERT_TRUE(db_list_students(db(), f, students));
    ASSERT_EQ(students.size(), 1u);
    EXPECT_EQ(students[0].family_name, "MARTIN");

    f.track = "IDU";
    ASSERT_TRUE(db_list_students(db(), f, students));
    EXPECT_TRUE(students.empty());
}

TEST_F(StoreTest, StudentGradesInImportOrder) {
    long long id = seed(make_student("DUPONT", "Jean"), "UE401");

    std::vector<GradeRow> rows;
    ASSERT_TRUE(db_get_student_grades(db(), "DUPONT", "Jean", Filters{}, rows));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].student_id, id);
    EXPECT_TRUE(rows[0].grade.is_unit);
    EXPECT_EQ(rows[1].grade.course_name, "Cours UE401 a");
    EXPECT_EQ(rows[2].student.academic_year, "2022-2023");

    ASSERT_TRUE(db_get_student_grades(db(), "DUPONT", "Marie", Filters{}, rows));
    EXPECT_TRUE(rows.empty());
}

TEST_F(StoreTest, ExportJoinsStudentsAndGrades) {
    seed(make_student("DUPONT", "Jean"), "UE401");
    seed(make_student("MARTIN", "Paul", "2023-2024"), "UE801");

    std::vector<ExportRow> rows;
    ASSERT_TRUE(db_export(db(), Filters{}, rows));
    ASSERT_EQ(rows.size(), 6u);
    EXPECT_EQ(rows[0].student.family_name, "DUPONT");
    EXPECT_EQ(rows[5].student.family_name, "MARTIN");
    EXPECT_EQ(rows[5].grade.unit_code, "UE801");

    Filters f;
    f.academic_year = "2023-2024";
    ASSERT_TRUE(db_export(db(), f, rows));
    EXPECT_EQ(rows.size(), 3u);
}

// =============================================================================
// Delete
// =============================================================================

TEST_F(StoreTest, DeleteWhereRemovesMatchingStudentsAndGrades) {
    seed(make_student("DUPONT", "Jean", "2022-2023"), "UE401");
    seed(make_student("LEGER", "Eloise", "2022-2023"), "UE401");
    seed(make_student("MARTIN", "Paul", "2023-2024"), "UE401");

    Filters f;
    f.academic_year = "2022-2023";
    int deleted = -1;
    ASSERT_TRUE(db_delete_where(db(), f, deleted));
    EXPECT_EQ(deleted, 2);

    DbCounts counts;
    ASSERT_TRUE(db_get_counts(db(), counts));
    EXPECT_EQ(counts.students, 1);
    EXPECT_EQ(counts.grades, 3);
}

TEST_F(StoreTest, DeleteWithoutMatchDeletesNothing) {
    seed(make_student("DUPONT", "Jean"), "UE401");

    Filters f;
    f.track = "IDU";
    int deleted = -1;
    ASSERT_TRUE(db_delete_where(db(), f, deleted));
    EXPECT_EQ(deleted, 0);
}

TEST_F(StoreTest, DeleteWithEmptyCriteriaIsRefused) {
    seed(make_student("DUPONT", "Jean"), "UE401");

    Filters only_unit;
    only_unit.unit_code = "UE401";   // not a delete criterion
    int deleted = -1;
    ASSERT_TRUE(db_delete_where(db(), only_unit, deleted));
    EXPECT_EQ(deleted, 0);

    DbCounts counts;
    ASSERT_TRUE(db_get_counts(db(), counts));
    EXPECT_EQ(counts.students, 1);
}
