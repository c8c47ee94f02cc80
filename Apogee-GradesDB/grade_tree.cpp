/*
-------------------------------------------------------------------------------
 grade_tree.cpp — Two-level grade extraction
-------------------------------------------------------------------------------
Lines are examined one at a time:
  - a line starting with "UE<digits>" opens a new unit scope. If it carries
    a "<score>/20" it becomes a unit entry, otherwise the scope has no unit
    and its courses are dropped (they would have no parent);
  - any other line ending its match with "<score>/20" is a course of the
    current unit, unless it is a leftover table header ("Note/Barème",
    "Note :");
  - everything else (result codes, credits, page furniture) is ignored.

A score is one or two digits with an optional decimal part, and "/20" must
not be followed by another digit: "2022/2023" or "12/200" are not scores.
A score that parses but falls outside 0..20 is stored as 0 with a warning,
like an unparsable one, so the rest of the student still imports.
-------------------------------------------------------------------------------
*/

#include "grade_tree.hpp"
#include "validation.hpp"
#include "logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <regex>
#include <set>

namespace {

// UE401 Systèmes d'exploitation 14,5/20 ...
const std::regex& unit_re() {
    static const std::regex re("^(UE\\d+[A-Za-z0-9_]*)(.*?)\\s+(\\d{1,2}(?:[.,][\\d.,]*)?)\\s*/\\s*20(?!\\d)");
    return re;
}

// Algorithmique 12/20 ...
const std::regex& course_re() {
    static const std::regex re("^([^/].*?)\\s+(\\d{1,2}(?:[.,][\\d.,]*)?)\\s*/\\s*20(?!\\d)");
    return re;
}

bool is_unit_marker(const std::string& line) {
    return line.size() > 2 && starts_with(line, "UE") &&
        std::isdigit(static_cast<unsigned char>(line[2]));
}

bool is_header_remnant(const std::string& name) {
    return name.find("Note/Barème") != std::string::npos ||
        name.find("Note :") != std::string::npos;
}

} // namespace

bool parse_score(const std::string& text, double& out) {
    out = 0.0;
    std::string s = trim(text);
    if (s.empty()) return false;
    for (auto& c : s)
        if (c == ',') c = '.';

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

std::vector<GradeEntry> build_grade_tree(const std::string& notes, const std::string& context) {
    std::vector<GradeEntry> entries;
    std::set<std::string> seen;   // course names already emitted for this student
    std::string current_unit;     // empty = no open unit scope
    int line_no = 0;

    auto score_of = [&](const std::string& raw, const std::string& what) {
        double v = 0.0;
        if (!parse_score(raw, v)) {
            LOG_WARN("{}: unparsable score '{}' for {}, stored as 0", context, raw, what);
        } else if (v > 20.0) {
            LOG_WARN("{}: score {} for {} is above 20, stored as 0", context, raw, what);
            v = 0.0;
        }
        return v;
    };

    for (const auto& raw_line : split_lines(notes)) {
        ++line_no;
        std::string line = trim(raw_line);
        if (line.empty()) continue;

        std::smatch m;
        if (is_unit_marker(line)) {
            if (!std::regex_search(line, m, unit_re())) {
                current_unit.clear();
                LOG_WARN("{}: unit line without a score, its courses are skipped: '{}'", context, line);
                continue;
            }
            current_unit = m[1].str();
            if (!seen.insert(current_unit).second) {
                LOG_DEBUG("{}: unit {} listed twice, keeping the first", context, current_unit);
                continue;
            }

            GradeEntry unit;
            unit.unit_code = current_unit;
            unit.course_name = current_unit;
            unit.score = score_of(m[3].str(), current_unit);
            unit.is_unit = true;
            entries.push_back(unit);
            continue;
        }

        // Lines starting with "UE" never describe a course
        if (starts_with(line, "UE")) continue;
        if (!std::regex_search(line, m, course_re())) continue;

        std::string name = trim(m[1].str());
        if (name.empty() || is_header_remnant(name)) continue;

        if (current_unit.empty()) {
            LOG_DEBUG("{}: notes line {} '{}' is outside any unit, skipped", context, line_no, name);
            continue;
        }
        if (!seen.insert(name).second) {
            LOG_DEBUG("{}: course '{}' listed twice, keeping the first", context, name);
            continue;
        }

        GradeEntry course;
        course.unit_code = current_unit;
        course.course_name = name;
        course.score = score_of(m[2].str(), name);
        course.is_unit = false;
        entries.push_back(course);
    }

    return entries;
}
