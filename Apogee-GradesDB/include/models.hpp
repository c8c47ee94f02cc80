#pragma once
#include <string>
#include <vector>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain structs
-------------------------------------------------------------------------------
Plain data structures shared by the parser, the importer and the store:
  - ParcoursInfo   (document header: track, academic year, semester)
  - StudentRecord  (one identity row)
  - GradeEntry     (one unit or course score)
  - ParsedStudent / ParsedDocument (parser output, importer input)
  - Filters / Dimension / GradeRow / ExportRow (query surface)

These are simple value types with public fields. Records are produced fresh
for every import run and are never updated in place.
-------------------------------------------------------------------------------
*/

// Document-level metadata, extracted once per document.
struct ParcoursInfo {
    std::string track;          // e.g. "M1", "L3-INFO"
    std::string academic_year;  // normalized "YYYY-YYYY"
    std::string semester;       // e.g. "7"

    // False when at least one field fell back to a placeholder.
    bool header_complete{ true };
    std::vector<std::string> defaulted_fields;
};

// A student identity row.
// Identity key = (family_name, given_name, track, academic_year, semester).
struct StudentRecord {
    std::string family_name;
    std::string given_name;
    std::string student_number;
    std::string track;
    std::string academic_year;
    std::string semester;
};

// One score line. Units (is_unit) come before their nested courses and
// carry course_name == unit_code.
struct GradeEntry {
    std::string unit_code;   // owning UE, e.g. UE401
    std::string course_name;
    double score{ 0.0 };     // 0..20
    bool is_unit{ false };
};

// A student block that made it through field extraction.
struct ParsedStudent {
    StudentRecord record;
    std::vector<GradeEntry> grades;
    int source_line{ 0 };    // 1-based line of the block anchor
};

// Everything the parser extracted from one document.
struct ParsedDocument {
    std::string source;      // file path or caller-provided label
    ParcoursInfo parcours;
    std::vector<ParsedStudent> students;
    int blocks_found{ 0 };
    int blocks_skipped{ 0 };
};

// Optional equality filters. Empty string = no filter.
struct Filters {
    std::string academic_year;
    std::string track;
    std::string semester;
    std::string unit_code;   // course listing and export only

    bool empty() const {
        return academic_year.empty() && track.empty() && semester.empty() && unit_code.empty();
    }
};

// Columns that list_distinct can enumerate.
enum class Dimension { Year, Track, Semester, Unit, Course };

// One grade row of a single student (student columns repeated per row).
struct GradeRow {
    long long student_id{ 0 };
    StudentRecord student;
    GradeEntry grade;
};

// One row of the denormalized students x grades export.
struct ExportRow {
    StudentRecord student;
    GradeEntry grade;
};
