#pragma once
#include <string>
#include "models.hpp"
#include "config.hpp"

/*
-------------------------------------------------------------------------------
 parser.hpp — Transcript document -> ParsedDocument
-------------------------------------------------------------------------------
Runs segmenter, extractor and grade tree builder in one sequential pass.
Malformed student blocks are counted and logged, never fatal. The only
failure reported to the caller is an unreadable input file.
-------------------------------------------------------------------------------
*/

/// Reads the whole file into `out`. Logs and returns false if it cannot.
bool read_text_file(const std::string& path, std::string& out);

/// Parses an in-memory document. `source` labels log lines (usually the path).
ParsedDocument parse_document(const std::string& content, const std::string& source, const AppConfig& cfg);

/// read_text_file + parse_document.
bool parse_document_file(const std::string& path, const AppConfig& cfg, ParsedDocument& out);
