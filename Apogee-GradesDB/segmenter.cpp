/*
-------------------------------------------------------------------------------
 segmenter.cpp — Two-pass student block segmentation
-------------------------------------------------------------------------------
A student's notes end at whichever comes first: a blank line followed by
the next student, a blank line followed by the page header, or the end of
the text. The passes map onto those three cases:
  - slicing at the next anchor covers "next student";
  - the page header check covers "page header";
  - the last slice covers "end of text".
Trailing blank lines are dropped so the block ends on its last notes line.
-------------------------------------------------------------------------------
*/

#include "segmenter.hpp"
#include "extractor.hpp"
#include "validation.hpp"
#include "logging.hpp"

ParcoursInfo extract_parcours_info(const std::string& content, const AppConfig& cfg) {
    ParcoursInfo info;

    if (!match_semester_track(content, info.semester, info.track)) {
        info.semester = cfg.default_semester;
        info.track = cfg.default_track;
        info.defaulted_fields.push_back("semester");
        info.defaulted_fields.push_back("track");
        LOG_WARN("No 'inscrit en Semestre' declaration found, using placeholders semester={} track={}",
            info.semester, info.track);
    }

    if (!match_academic_year(content, info.academic_year)) {
        info.academic_year = cfg.default_year;
        info.defaulted_fields.push_back("academic_year");
        LOG_WARN("No academic year declaration found, using placeholder {}", info.academic_year);
    }

    info.header_complete = info.defaulted_fields.empty();

    LOG_INFO("Parcours detected: track={}, year={}, semester={}",
        info.track, info.academic_year, info.semester);
    return info;
}

std::vector<size_t> find_block_anchors(const std::vector<std::string>& lines) {
    std::vector<size_t> anchors;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (!is_student_number_line(lines[i])) continue;
        if (is_blank(lines[i - 1])) {
            LOG_DEBUG("Line {}: student number line without a name line above, ignored", i + 1);
            continue;
        }
        anchors.push_back(i - 1);
    }
    return anchors;
}

std::vector<StudentBlock> slice_blocks(const std::vector<std::string>& lines,
    const std::vector<size_t>& anchors,
    const std::string& page_header_marker)
{
    std::vector<StudentBlock> blocks;
    blocks.reserve(anchors.size());

    for (size_t a = 0; a < anchors.size(); ++a) {
        size_t begin = anchors[a];
        size_t end = (a + 1 < anchors.size()) ? anchors[a + 1] : lines.size();

        // blank line followed by the page header ends the notes
        if (!page_header_marker.empty()) {
            for (size_t k = begin + 1; k < end; ++k) {
                if (is_blank(lines[k - 1]) && starts_with(trim(lines[k]), page_header_marker)) {
                    end = k - 1;
                    break;
                }
            }
        }

        while (end > begin && is_blank(lines[end - 1])) --end;

        StudentBlock block;
        block.first_line = static_cast<int>(begin) + 1;
        for (size_t k = begin; k < end; ++k) {
            if (k > begin) block.text += '\n';
            block.text += lines[k];
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

SegmentedDocument segment_document(const std::string& content, const AppConfig& cfg) {
    SegmentedDocument doc;
    doc.parcours = extract_parcours_info(content, cfg);

    std::vector<std::string> lines = split_lines(content);
    std::vector<size_t> anchors = find_block_anchors(lines);
    doc.blocks = slice_blocks(lines, anchors, cfg.page_header_marker);

    LOG_INFO("Student blocks found: {}", doc.blocks.size());
    return doc;
}
