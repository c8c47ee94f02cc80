#pragma once
#include <string>
#include <vector>
#include "models.hpp"
#include "config.hpp"

/*
-------------------------------------------------------------------------------
 segmenter.hpp — Split a transcript export into header + student blocks
-------------------------------------------------------------------------------
Student blocks have no terminator and their length depends on how many
units and courses a student has, so segmentation runs in two passes:

  pass 1  find_block_anchors: every non-blank line immediately followed by a
          "N° Etudiant" line starts a block (that line is the name line);
  pass 2  segment_document: slice the lines between consecutive anchors
          (the last block runs to the end of the document), then cut each
          slice at the first blank line followed by the page header.

Blocks are returned raw; field validation is the extractor's job.
-------------------------------------------------------------------------------
*/

/// One raw student block and where it came from.
struct StudentBlock {
    std::string text;
    int first_line{ 0 };   // 1-based line number of the name line
};

struct SegmentedDocument {
    ParcoursInfo parcours;
    std::vector<StudentBlock> blocks;
};

/// Header metadata with placeholder fallback. Each placeholder used is
/// logged and listed in ParcoursInfo::defaulted_fields.
ParcoursInfo extract_parcours_info(const std::string& content, const AppConfig& cfg);

/// Pass 1: zero-based indices of the name lines that open a student block.
std::vector<size_t> find_block_anchors(const std::vector<std::string>& lines);

/// Pass 2: slice `lines` between anchors, honoring the page header marker.
std::vector<StudentBlock> slice_blocks(const std::vector<std::string>& lines,
    const std::vector<size_t>& anchors,
    const std::string& page_header_marker);

/// Both passes plus header extraction.
SegmentedDocument segment_document(const std::string& content, const AppConfig& cfg);
