#pragma once
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 grade_tree.hpp — Units (UE) and their nested courses from a notes section
-------------------------------------------------------------------------------
Output is flat and ordered: each unit entry (is_unit = true, course_name =
unit code) is followed by the courses found between it and the next unit
line. Every course therefore refers to a unit emitted before it.
-------------------------------------------------------------------------------
*/

/// Parses "14,5" or "14.5". On failure `out` is 0 and false is returned;
/// callers keep the entry and log the coercion.
bool parse_score(const std::string& text, double& out);

/// Builds the unit/course list of one student. `context` (student identity
/// and source file) only appears in log lines. Scores above 20 are stored
/// as 0 and logged, so a single bad entry never costs the student.
std::vector<GradeEntry> build_grade_tree(const std::string& notes, const std::string& context);
