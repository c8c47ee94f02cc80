/*
-------------------------------------------------------------------------------
 extractor.cpp — Header and identity field matchers
-------------------------------------------------------------------------------
Patterns are std::regex over the raw UTF-8 bytes. Accented literals in the
patterns ("Année", "N°", "Né") are plain byte sequences, so they match as
long as the export is UTF-8 (the only encoding we accept).

Name lines are split by hand rather than by regex: the family name is a run
of upper-case words and "upper case" has to cover the Latin-1 capitals
(É, È, Ç, ...), which are two bytes each in UTF-8. When every word is upper
case ("MARTIN JEAN PIERRE") nothing marks where the given name starts; the
last word is taken as the given name and the split is logged at debug level.
-------------------------------------------------------------------------------
*/

#include "extractor.hpp"
#include "validation.hpp"
#include "logging.hpp"

#include <regex>
#include <sstream>
#include <vector>

namespace {

const std::regex& semester_track_re() {
    static const std::regex re("inscrite?[ \\t]+en[ \\t]+Semestre[ \\t]+(\\d+)[ \\t]+([^\\s]+)");
    return re;
}

const std::regex& full_year_re() {
    static const std::regex re("Année universitaire[ \\t]+(\\d{4})/(\\d{4})");
    return re;
}

const std::regex& session_year_re() {
    static const std::regex re("Session[ \\t]+S\\d+[ \\t]+(\\d{4})/(\\d{2})(?!\\d)");
    return re;
}

const std::regex& student_number_re() {
    static const std::regex re("^N°\\s*(?:Etudiant|Étudiant)\\s*:\\s*(\\d+)\\s*INE\\s*:\\s*[^\\s]+");
    return re;
}

const std::regex& birth_re() {
    static const std::regex re("^Née?\\s+le\\s*:");
    return re;
}

const std::regex& enrolment_re() {
    static const std::regex re("^inscrite?\\s+en\\s+Semestre\\s+\\d+");
    return re;
}

// Upper-case letter at w[i]: ASCII A-Z, Latin-1 capitals (C3 80..9E except
// the multiplication sign C3 97), or Œ (C5 92). `len` gets the byte count.
bool upper_letter_at(const std::string& w, size_t i, size_t& len) {
    unsigned char c = static_cast<unsigned char>(w[i]);
    len = 1;
    if (c >= 'A' && c <= 'Z') return true;
    if (i + 1 >= w.size()) return false;
    unsigned char n = static_cast<unsigned char>(w[i + 1]);
    len = 2;
    if (c == 0xC3 && n >= 0x80 && n <= 0x9E && n != 0x97) return true;
    if (c == 0xC5 && n == 0x92) return true;
    return false;
}

// FAMILY-NAME word: upper-case letters, apostrophes and hyphens only.
bool is_upper_word(const std::string& w) {
    bool letter = false;
    size_t i = 0;
    while (i < w.size()) {
        size_t len = 1;
        if (upper_letter_at(w, i, len)) { letter = true; i += len; continue; }
        if (w[i] == '\'' || w[i] == '-') { ++i; continue; }
        return false;
    }
    return letter;
}

// Given-name word: letters of either case, apostrophes, hyphens. Any other
// non-ASCII byte is accepted as part of a letter we do not classify.
bool is_name_word(const std::string& w) {
    bool letter = false;
    for (unsigned char c : w) {
        if (std::isalpha(c) || c >= 0x80) { letter = true; continue; }
        if (c == '\'' || c == '-') continue;
        return false;
    }
    return letter;
}

std::string join(const std::vector<std::string>& words, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

// Optional headers printed between the enrolment line and the first UE.
bool is_notes_header(const std::string& line) {
    return starts_with(line, "Notes et résultats") || starts_with(line, "Note/Barème");
}

} // namespace

bool match_semester_track(const std::string& text, std::string& semester, std::string& track) {
    std::smatch m;
    if (!std::regex_search(text, m, semester_track_re())) return false;
    semester = m[1].str();
    track = m[2].str();
    return true;
}

bool match_academic_year(const std::string& text, std::string& year) {
    std::smatch m;
    if (std::regex_search(text, m, full_year_re())) {
        year = m[1].str() + "-" + m[2].str();
        return true;
    }
    // Abbreviated form: 2022/23 -> 2022-2023
    if (std::regex_search(text, m, session_year_re())) {
        year = m[1].str() + "-20" + m[2].str();
        return true;
    }
    return false;
}

bool is_student_number_line(const std::string& line) {
    std::string t = trim(line);
    return starts_with(t, "N°") &&
        (t.find("Etudiant") != std::string::npos || t.find("Étudiant") != std::string::npos);
}

bool split_name_line(const std::string& line, std::string& family, std::string& given) {
    std::vector<std::string> words;
    std::istringstream in(trim(line));
    std::string w;
    while (in >> w) words.push_back(w);
    if (words.size() < 2) return false;

    size_t n_upper = 0;
    while (n_upper < words.size() && is_upper_word(words[n_upper])) ++n_upper;
    if (n_upper == 0) return false;

    // "DUPONT JEAN": no mixed-case word at all, the last one is the given name
    if (n_upper == words.size()) {
        n_upper = words.size() - 1;
        if (words.size() > 2)
            LOG_DEBUG("Name line '{}' is all upper case, given name taken as '{}'", trim(line), words.back());
    }

    for (size_t i = n_upper; i < words.size(); ++i)
        if (!is_name_word(words[i])) return false;

    family = join(words, 0, n_upper);
    given = join(words, n_upper, words.size());
    return true;
}

bool extract_student_fields(const std::string& block, StudentFields& out, std::string& cause) {
    std::vector<std::string> lines = split_lines(block);
    size_t i = 0;

    auto next_non_blank = [&]() -> bool {
        while (i < lines.size() && is_blank(lines[i])) ++i;
        return i < lines.size();
    };

    if (!next_non_blank()) { cause = "empty block"; return false; }
    if (!split_name_line(lines[i], out.family_name, out.given_name)) {
        cause = "unparsable name line '" + trim(lines[i]) + "'";
        return false;
    }
    ++i;

    std::smatch m;
    std::string line;
    if (!next_non_blank()) { cause = "missing student number line"; return false; }
    line = trim(lines[i]);
    if (!std::regex_search(line, m, student_number_re())) {
        cause = "missing or invalid student number in '" + line + "'";
        return false;
    }
    out.student_number = m[1].str();
    ++i;

    if (!next_non_blank() || !std::regex_search(trim(lines[i]), birth_re())) {
        cause = "missing birth date line";
        return false;
    }
    ++i;

    if (!next_non_blank() || !std::regex_search(trim(lines[i]), enrolment_re())) {
        cause = "missing semester enrolment line";
        return false;
    }
    ++i;

    while (i < lines.size() && (is_blank(lines[i]) || is_notes_header(trim(lines[i])))) ++i;
    if (i >= lines.size()) { cause = "missing notes section"; return false; }
    if (!starts_with(trim(lines[i]), "UE")) {
        cause = "notes section does not start with a UE line";
        return false;
    }

    size_t end = lines.size();
    while (end > i && is_blank(lines[end - 1])) --end;

    out.notes.clear();
    for (size_t k = i; k < end; ++k) {
        if (k > i) out.notes += '\n';
        out.notes += lines[k];
    }
    return true;
}
