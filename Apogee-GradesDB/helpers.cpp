#include "helpers.hpp"
#include "logging.hpp"

#include <cstdio>
#include <fstream>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Formatting for listings and the CSV export
-------------------------------------------------------------------------------
The CSV layout keeps the column names of the spreadsheet the dashboards were
built against (Nom, Prenom, ..., EstUE), so an export can replace it as is.
-------------------------------------------------------------------------------
*/

bool parse_dimension(const std::string& name, Dimension& out) {
    if (name == "years" || name == "annees") { out = Dimension::Year; return true; }
    if (name == "parcours" || name == "tracks") { out = Dimension::Track; return true; }
    if (name == "semestres" || name == "semesters") { out = Dimension::Semester; return true; }
    if (name == "ues" || name == "units") { out = Dimension::Unit; return true; }
    if (name == "courses" || name == "cours") { out = Dimension::Course; return true; }
    return false;
}

const char* dimension_title(Dimension dim) {
    switch (dim) {
    case Dimension::Year: return "Academic years";
    case Dimension::Track: return "Tracks";
    case Dimension::Semester: return "Semesters";
    case Dimension::Unit: return "Teaching units";
    case Dimension::Course: return "Courses";
    }
    return "";
}

std::string describe_filters(const Filters& f) {
    std::string out;
    auto add = [&](const char* key, const std::string& v) {
        if (v.empty()) return;
        if (!out.empty()) out += ", ";
        out += key;
        out += '=';
        out += v;
    };
    add("annee", f.academic_year);
    add("parcours", f.track);
    add("semestre", f.semester);
    add("ue", f.unit_code);
    return out.empty() ? "(none)" : out;
}

std::string format_score(double score) {
    char buf[32];
    std::snprintf(buf, sizeof buf, "%.2f", score);
    std::string s = buf;
    // 14.50 -> 14.5, 12.00 -> 12
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void print_values(std::ostream& os, const std::string& title, const std::vector<std::string>& values) {
    os << title << ":\n";
    if (values.empty()) { os << "  (nothing)\n"; return; }
    for (const auto& v : values) os << "  - " << v << "\n";
}

void print_students(std::ostream& os, const std::vector<StudentRecord>& rows) {
    if (rows.empty()) { os << "No students.\n"; return; }
    for (const auto& s : rows) {
        os << s.family_name << " " << s.given_name
            << " - " << s.student_number
            << " - " << s.track
            << " - " << s.academic_year
            << " - S" << s.semester << "\n";
    }
}

void print_student_grades(std::ostream& os, const std::vector<GradeRow>& rows) {
    if (rows.empty()) { os << "No grades found.\n"; return; }

    long long current = -1;
    for (const auto& r : rows) {
        if (r.student_id != current) {
            current = r.student_id;
            os << r.student.given_name << " " << r.student.family_name
                << " (" << r.student.student_number << ") "
                << r.student.track << " " << r.student.academic_year
                << " S" << r.student.semester << "\n";
        }
        if (r.grade.is_unit)
            os << "  " << r.grade.unit_code << "  " << format_score(r.grade.score) << "/20\n";
        else
            os << "      " << r.grade.course_name << "  " << format_score(r.grade.score) << "/20\n";
    }
}

bool write_export_csv(const std::vector<ExportRow>& rows, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("Cannot write {}", path);
        return false;
    }

    out << "Nom,Prenom,NumeroEtudiant,Parcours,Annee,Semestre,UE,Cours,Note,EstUE\n";
    for (const auto& r : rows) {
        out << csv_escape(r.student.family_name) << ','
            << csv_escape(r.student.given_name) << ','
            << csv_escape(r.student.student_number) << ','
            << csv_escape(r.student.track) << ','
            << csv_escape(r.student.academic_year) << ','
            << csv_escape(r.student.semester) << ','
            << csv_escape(r.grade.unit_code) << ','
            << csv_escape(r.grade.course_name) << ','
            << format_score(r.grade.score) << ','
            << (r.grade.is_unit ? 1 : 0) << '\n';
    }
    out.flush();
    if (!out) {
        LOG_ERROR("Write error on {}", path);
        return false;
    }
    LOG_INFO("{} rows written to {}", rows.size(), path);
    return true;
}
