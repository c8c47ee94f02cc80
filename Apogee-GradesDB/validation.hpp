#pragma once
#include <string>
#include <regex>
#include <vector>
#include <algorithm>
#include <iostream>
#include <limits>
#include <cctype>   // for std::isspace

/*
-------------------------------------------------------------------------------
 validation.hpp - Text helpers, filter validators and console prompts
-------------------------------------------------------------------------------
What this file provides:
  - trim / starts_with: small string helpers shared by the parser modules.
  - Validators for operator input: academic year, semester, track, names.
  - Prompt helpers for the interactive console:
      * prompt_until_valid_or_back    -> loop until validator passes
      * prompt_filter_or_back         -> optional value (Enter = no filter)
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace (CR included, transcripts come from
// Windows exports as often as not).
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Split on '\n', dropping a trailing '\r' from every line.
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start <= text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = nl + 1;
    }
    // "a\n" is one line, not two
    if (!lines.empty() && lines.back().empty() && !text.empty() && text.back() == '\n')
        lines.pop_back();
    return lines;
}

inline bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// e.g. 2022-2023
inline bool is_valid_year(const std::string& x) {
    static const std::regex re("^\\d{4}-\\d{4}$");
    return std::regex_match(x, re);
}

// 1..2 digits, e.g. 7
inline bool is_valid_semester(const std::string& x) {
    static const std::regex re("^\\d{1,2}$");
    return std::regex_match(x, re);
}

// "API" as read from the header, or a configured value such as "M1 API"
inline bool is_valid_track(const std::string& x) {
    return !trim(x).empty() && x.size() <= 40;
}

// non-empty, max 60 (accented letters are multi-byte, so no charset check)
inline bool is_valid_person_name(const std::string& x) {
    return !trim(x).empty() && x.size() <= 60;
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

inline bool is_back(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::string v;
        std::cout << label << " (0=Back, x=Exit): ";
        if (!std::getline(std::cin >> std::ws, v)) {
            if (std::cin.eof()) return InputCtl::Exit;
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            continue;
        }
        v = trim(v);
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Optional filter prompt: Enter = no filter (out cleared),
// 0/b = Back, x/q = Exit, otherwise validate the value.
inline InputCtl prompt_filter_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::cout << label << " [Enter=any] (0=Back, x=Exit): ";
        std::string v;
        if (!std::getline(std::cin, v)) {
            if (std::cin.eof()) return InputCtl::Exit;
            std::cin.clear();
            continue;
        }
        v = trim(v);
        if (v.empty()) { out.clear(); return InputCtl::Ok; }
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(const std::string& msg) {
    for (;;) {
        std::string v;
        std::cout << msg << " [y/N] (0=Back, x=Exit): ";
        if (!std::getline(std::cin, v)) {
            if (std::cin.eof()) return InputCtl::Exit;
            std::cin.clear();
            continue;
        }
        v = trim(v);
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y" || v == "o" || v == "O") return InputCtl::Ok;
        std::cout << "  -> Please enter y or n.\n";
    }
}
