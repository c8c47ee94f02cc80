#pragma once
#include <string>

/*
-------------------------------------------------------------------------------
 extractor.hpp — Field matchers for APOGEE transcript exports
-------------------------------------------------------------------------------
Two groups of low-level matchers:
  - header metadata (semester + track declaration, academic year), searched
    anywhere in the document;
  - per-student identity fields, read from one raw student block as cut by
    the segmenter.

None of these functions throw. A failed match returns false; for student
blocks a human-readable cause is filled in so the caller can log it and
skip the student.
-------------------------------------------------------------------------------
*/

/// Identity fields and notes text of one student block.
struct StudentFields {
    std::string family_name;
    std::string given_name;
    std::string student_number;
    std::string notes;   // starts at the first UE line
};

/// Finds the first "inscrit(e) en Semestre N <track>" declaration.
bool match_semester_track(const std::string& text, std::string& semester, std::string& track);

/// Finds "Année universitaire YYYY/YYYY" or, failing that, the abbreviated
/// "Session S<n> YYYY/YY". Both are normalized to "YYYY-YYYY".
bool match_academic_year(const std::string& text, std::string& year);

/// True for the "N° Etudiant ..." line that follows every student name.
/// Loose on purpose: the value itself is validated by extract_student_fields.
bool is_student_number_line(const std::string& line);

/// Splits "FAMILY NAME Given Names" into its two parts.
bool split_name_line(const std::string& line, std::string& family, std::string& given);

/// Splits and trims one raw student block. On failure `cause` says which
/// required field is missing and `out` is left partially filled.
bool extract_student_fields(const std::string& block, StudentFields& out, std::string& cause);
