#include "importer.hpp"
#include "db.hpp"
#include "parser.hpp"
#include "logging.hpp"

#include <vector>

namespace {

enum class StudentOutcome { Committed, Unchanged, RolledBack, StoreFailure };

Filters term_filters(const ParcoursInfo& term) {
    Filters f;
    f.academic_year = term.academic_year;
    f.track = term.track;
    f.semester = term.semester;
    return f;
}

std::string describe(const ParsedDocument& doc, const ParsedStudent& st) {
    return st.record.given_name + " " + st.record.family_name + " (" + st.record.student_number + ", " +
        doc.source + ":" + std::to_string(st.source_line) + ")";
}

// Writes one student inside its own savepoint.
StudentOutcome import_one(sqlite3* db, const ParsedDocument& doc, const ParsedStudent& st, int& new_grades) {
    SavepointScope sp(db, "import_student");
    if (!sp.ok()) return StudentOutcome::StoreFailure;

    long long student_id = 0;
    InsertResult r = db_insert_student(db, st.record, student_id);
    if (r == InsertResult::Error) return StudentOutcome::StoreFailure;
    if (r == InsertResult::Constraint) {
        LOG_WARN("Student skipped {}: identity row rejected: {}", describe(doc, st), sqlite3_errmsg(db));
        return sp.rollback() ? StudentOutcome::RolledBack : StudentOutcome::StoreFailure;
    }

    bool any_new = (r == InsertResult::Inserted);
    int added = 0;
    for (const auto& g : st.grades) {
        InsertResult gr = db_insert_grade(db, student_id, g);
        if (gr == InsertResult::Error) return StudentOutcome::StoreFailure;
        if (gr == InsertResult::Constraint) {
            LOG_WARN("Student skipped {}: grade '{}' = {} rejected: {}",
                describe(doc, st), g.course_name, g.score, sqlite3_errmsg(db));
            return sp.rollback() ? StudentOutcome::RolledBack : StudentOutcome::StoreFailure;
        }
        if (gr == InsertResult::Inserted) ++added;
    }

    if (!sp.release()) return StudentOutcome::StoreFailure;

    new_grades += added;
    any_new = any_new || added > 0;
    LOG_DEBUG("Student {}: {} new grade rows", describe(doc, st), added);
    return any_new ? StudentOutcome::Committed : StudentOutcome::Unchanged;
}

} // namespace

bool import_students(sqlite3* db, const ParsedDocument& doc, ImportStats& stats) {
    stats = ImportStats{};
    if (doc.students.empty()) {
        LOG_WARN("{}: no student to import", doc.source);
        return true;
    }

    if (!db_begin(db)) {
        LOG_ERROR("{}: cannot start import transaction", doc.source);
        return false;
    }

    for (const auto& st : doc.students) {
        ++stats.attempted;
        int new_grades = 0;
        switch (import_one(db, doc, st, new_grades)) {
        case StudentOutcome::Committed:
            ++stats.committed;
            stats.new_grades += new_grades;
            break;
        case StudentOutcome::Unchanged:
            ++stats.unchanged;
            break;
        case StudentOutcome::RolledBack:
            ++stats.rolled_back;
            break;
        case StudentOutcome::StoreFailure:
            LOG_ERROR("{}: store failure while importing {}, whole document rolled back",
                doc.source, describe(doc, st));
            // SQLite may already have ended the transaction on its own
            if (!sqlite3_get_autocommit(db)) db_rollback(db);
            stats.committed = 0;
            stats.new_grades = 0;
            return false;
        }
    }

    if (!db_commit(db)) {
        LOG_ERROR("{}: commit failed, whole document rolled back", doc.source);
        if (!sqlite3_get_autocommit(db)) db_rollback(db);
        stats.committed = 0;
        stats.new_grades = 0;
        return false;
    }

    LOG_INFO("{}: {} students imported ({} unchanged, {} rolled back, {} new grade rows)",
        doc.source, stats.committed, stats.unchanged, stats.rolled_back, stats.new_grades);
    return true;
}

bool count_term_students(sqlite3* db, const ParcoursInfo& term, int& existing) {
    existing = 0;
    std::vector<StudentRecord> rows;
    if (!db_list_students(db, term_filters(term), rows)) return false;
    existing = static_cast<int>(rows.size());
    return true;
}

bool import_document(sqlite3* db, const std::string& path, const AppConfig& cfg, int& imported, bool replace) {
    imported = 0;

    ParsedDocument doc;
    if (!parse_document_file(path, cfg, doc)) return false;

    if (!doc.parcours.header_complete && cfg.strict_header) {
        std::string missing;
        for (const auto& f : doc.parcours.defaulted_fields)
            missing += (missing.empty() ? "" : ", ") + f;
        LOG_ERROR("{}: header incomplete ({}), import refused in strict mode", path, missing);
        return false;
    }

    int existing = 0;
    if (!count_term_students(db, doc.parcours, existing)) {
        LOG_ERROR("{}: cannot check for students already stored", path);
        return false;
    }
    if (existing > 0 && replace) {
        int deleted = 0;
        if (!db_delete_where(db, term_filters(doc.parcours), deleted)) {
            LOG_ERROR("{}: could not remove the students being replaced", path);
            return false;
        }
        LOG_INFO("{}: replacing {} students of {} {} semester {}", path, deleted,
            doc.parcours.track, doc.parcours.academic_year, doc.parcours.semester);
    } else if (existing > 0) {
        LOG_WARN("{}: {} students of {} {} semester {} already stored, their existing rows are kept "
            "(import with replace to overwrite)", path, existing,
            doc.parcours.track, doc.parcours.academic_year, doc.parcours.semester);
    }

    ImportStats stats;
    if (!import_students(db, doc, stats)) return false;
    imported = stats.committed;
    return true;
}
