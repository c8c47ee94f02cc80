#include "parser.hpp"
#include "segmenter.hpp"
#include "extractor.hpp"
#include "grade_tree.hpp"
#include "logging.hpp"

#include <fstream>
#include <sstream>

bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_ERROR("Cannot open {}", path);
        return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        LOG_ERROR("Read error on {}", path);
        return false;
    }
    out = buf.str();

    // UTF-8 BOM from Windows editors
    if (out.size() >= 3 && out.compare(0, 3, "\xEF\xBB\xBF") == 0) out.erase(0, 3);

    LOG_INFO("File loaded: {}, size: {} bytes", path, out.size());
    return true;
}

ParsedDocument parse_document(const std::string& content, const std::string& source, const AppConfig& cfg) {
    ParsedDocument doc;
    doc.source = source;

    SegmentedDocument seg = segment_document(content, cfg);
    doc.parcours = seg.parcours;
    doc.blocks_found = static_cast<int>(seg.blocks.size());

    for (const auto& block : seg.blocks) {
        StudentFields fields;
        std::string cause;
        if (!extract_student_fields(block.text, fields, cause)) {
            ++doc.blocks_skipped;
            LOG_WARN("{}:{}: student skipped ({})", source, block.first_line, cause);
            continue;
        }

        ParsedStudent st;
        st.source_line = block.first_line;
        st.record.family_name = fields.family_name;
        st.record.given_name = fields.given_name;
        st.record.student_number = fields.student_number;
        st.record.track = doc.parcours.track;
        st.record.academic_year = doc.parcours.academic_year;
        st.record.semester = doc.parcours.semester;

        std::string context = source + ":" + std::to_string(block.first_line) + " " +
            fields.given_name + " " + fields.family_name;
        st.grades = build_grade_tree(fields.notes, context);

        LOG_DEBUG("{}: {} units/courses", context, st.grades.size());
        doc.students.push_back(std::move(st));
    }

    if (doc.students.empty())
        LOG_WARN("{}: no student could be extracted", source);
    else
        LOG_INFO("{}: {} students extracted, {} skipped", source, doc.students.size(), doc.blocks_skipped);

    return doc;
}

bool parse_document_file(const std::string& path, const AppConfig& cfg, ParsedDocument& out) {
    std::string content;
    if (!read_text_file(path, content)) return false;
    out = parse_document(content, path, cfg);
    return true;
}
