/*
-------------------------------------------------------------------------------
 db.cpp — SQLite persistence layer for imported transcripts
-------------------------------------------------------------------------------
Purpose
  - Implements all database I/O for students and grades using SQLite3.
  - Exposes small, purpose-specific functions called by the importer and
    the service facade.

Design notes
  - Foreign key cascades are enabled per-connection (PRAGMA foreign_keys=ON).
  - Write ops use prepared statements with bound parameters; filter values
    are always bound, never spliced into SQL text.
  - Idempotent inserts use "ON CONFLICT DO NOTHING", which only absorbs
    uniqueness conflicts. CHECK / NOT NULL / FK violations still fail and
    are reported as InsertResult::Constraint so the importer can roll the
    student back.
  - Reads that stream many rows use sqlite3_prepare_v2 / sqlite3_step loops.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "logging.hpp"

#include <utility>

namespace {

// Run a raw SQL string with sqlite3_exec and report errors.
bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SQL error: {} ({})", err ? err : sqlite3_errstr(rc), sql);
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool prepare(sqlite3* db, const std::string& sql, sqlite3_stmt*& st) {
    st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        LOG_ERROR("Prepare failed: {} ({})", sqlite3_errmsg(db), sql);
        sqlite3_finalize(st);
        st = nullptr;
        return false;
    }
    return true;
}

std::string col_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : std::string();
}

bool is_constraint(int rc) {
    return (rc & 0xff) == SQLITE_CONSTRAINT;
}

// Appends "<alias>.col = ?" conditions for every non-empty filter.
void add_filters(const Filters& f, const char* alias, bool with_unit,
    std::vector<std::string>& conds, std::vector<std::string>& params)
{
    std::string a = alias;
    if (!f.academic_year.empty()) { conds.push_back(a + ".academic_year = ?"); params.push_back(f.academic_year); }
    if (!f.track.empty()) { conds.push_back(a + ".track = ?"); params.push_back(f.track); }
    if (!f.semester.empty()) { conds.push_back(a + ".semester = ?"); params.push_back(f.semester); }
    if (with_unit && !f.unit_code.empty()) { conds.push_back("g.unit_code = ?"); params.push_back(f.unit_code); }
}

std::string where_clause(const std::vector<std::string>& conds) {
    std::string out;
    for (size_t i = 0; i < conds.size(); ++i)
        out += (i == 0 ? " WHERE " : " AND ") + conds[i];
    return out;
}

void bind_params(sqlite3_stmt* st, const std::vector<std::string>& params, int first = 1) {
    for (size_t i = 0; i < params.size(); ++i)
        sqlite3_bind_text(st, first + static_cast<int>(i), params[i].c_str(), -1, SQLITE_TRANSIENT);
}

// Columns 0..5 of every student projection below.
StudentRecord read_student(sqlite3_stmt* st, int first) {
    StudentRecord s;
    s.family_name = col_text(st, first + 0);
    s.given_name = col_text(st, first + 1);
    s.student_number = col_text(st, first + 2);
    s.track = col_text(st, first + 3);
    s.academic_year = col_text(st, first + 4);
    s.semester = col_text(st, first + 5);
    return s;
}

GradeEntry read_grade(sqlite3_stmt* st, int first) {
    GradeEntry g;
    g.unit_code = col_text(st, first + 0);
    g.course_name = col_text(st, first + 1);
    g.score = sqlite3_column_double(st, first + 2);
    g.is_unit = sqlite3_column_int(st, first + 3) != 0;
    return g;
}

const char* const STUDENT_COLS = "s.family_name, s.given_name, s.student_number, s.track, s.academic_year, s.semester";
const char* const GRADE_COLS = "g.unit_code, g.course_name, g.score, g.is_unit";

} // namespace

// Open (or create) the SQLite database file at `path` and enable FK
// constraints for this connection. Returns false if the DB cannot be opened.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to open DB {}: {}", path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    if (!exec_sql(db, "PRAGMA foreign_keys = ON;")) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    LOG_DEBUG("Opened DB {}", path);
    return true;
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

// Create tables if they don't exist yet. Deleting a student removes its grades.
bool db_init_schema(sqlite3* db) {
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS students ("
        "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  family_name    TEXT NOT NULL,"
        "  given_name     TEXT NOT NULL,"
        "  student_number TEXT,"
        "  track          TEXT NOT NULL,"
        "  academic_year  TEXT NOT NULL,"
        "  semester       TEXT NOT NULL,"
        "  UNIQUE (family_name, given_name, track, academic_year, semester)"
        ");"

        "CREATE TABLE IF NOT EXISTS grades ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  student_id  INTEGER NOT NULL,"
        "  unit_code   TEXT NOT NULL,"
        "  course_name TEXT NOT NULL,"
        "  score       REAL NOT NULL CHECK (score BETWEEN 0 AND 20),"
        "  is_unit     INTEGER NOT NULL DEFAULT 0 CHECK (is_unit IN (0, 1)),"
        "  UNIQUE (student_id, course_name),"
        "  FOREIGN KEY (student_id) REFERENCES students(id) ON DELETE CASCADE"
        ");";
    if (!exec_sql(db, ddl)) return false;
    LOG_DEBUG("Schema ready");
    return true;
}

/* =========================
   Transactions
   ========================= */

bool db_begin(sqlite3* db) { return exec_sql(db, "BEGIN;"); }
bool db_commit(sqlite3* db) { return exec_sql(db, "COMMIT;"); }
bool db_rollback(sqlite3* db) { return exec_sql(db, "ROLLBACK;"); }

SavepointScope::SavepointScope(sqlite3* db, std::string name)
    : db_(db), name_(std::move(name)) {
    open_ = exec_sql(db_, ("SAVEPOINT " + name_ + ";").c_str());
}

SavepointScope::~SavepointScope() {
    if (open_) rollback();
}

// Merge the savepoint into the enclosing transaction.
bool SavepointScope::release() {
    if (!open_) return false;
    if (!exec_sql(db_, ("RELEASE " + name_ + ";").c_str())) return false;
    open_ = false;
    return true;
}

// Undo everything since the savepoint, then pop it. The enclosing
// transaction stays open.
bool SavepointScope::rollback() {
    if (!open_) return false;
    open_ = false;
    bool ok = exec_sql(db_, ("ROLLBACK TO " + name_ + ";").c_str());
    return exec_sql(db_, ("RELEASE " + name_ + ";").c_str()) && ok;
}

/* =========================
   Inserts
   ========================= */

InsertResult db_insert_student(sqlite3* db, const StudentRecord& s, long long& id) {
    const char* sql =
        "INSERT INTO students(family_name,given_name,student_number,track,academic_year,semester) "
        "VALUES(?,?,?,?,?,?) ON CONFLICT DO NOTHING;";
    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return InsertResult::Error;
    sqlite3_bind_text(st, 1, s.family_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, s.given_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, s.student_number.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 4, s.track.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 5, s.academic_year.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 6, s.semester.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) {
        if (is_constraint(rc)) return InsertResult::Constraint;
        LOG_ERROR("Insert student failed: {}", sqlite3_errmsg(db));
        return InsertResult::Error;
    }
    if (sqlite3_changes(db) > 0) {
        id = sqlite3_last_insert_rowid(db);
        return InsertResult::Inserted;
    }

    // Existing identity row: fetch its id so grades can attach to it.
    const char* find =
        "SELECT id FROM students "
        "WHERE family_name=? AND given_name=? AND track=? AND academic_year=? AND semester=?;";
    if (!prepare(db, find, st)) return InsertResult::Error;
    sqlite3_bind_text(st, 1, s.family_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, s.given_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, s.track.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 4, s.academic_year.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 5, s.semester.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) id = sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);

    if (rc != SQLITE_ROW) {
        LOG_ERROR("Student {} {} neither inserted nor found: {}", s.given_name, s.family_name, sqlite3_errmsg(db));
        return InsertResult::Error;
    }
    return InsertResult::Duplicate;
}

InsertResult db_insert_grade(sqlite3* db, long long student_id, const GradeEntry& g) {
    const char* sql =
        "INSERT INTO grades(student_id,unit_code,course_name,score,is_unit) "
        "VALUES(?,?,?,?,?) ON CONFLICT DO NOTHING;";
    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return InsertResult::Error;
    sqlite3_bind_int64(st, 1, student_id);
    sqlite3_bind_text(st, 2, g.unit_code.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, g.course_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st, 4, g.score);
    sqlite3_bind_int(st, 5, g.is_unit ? 1 : 0);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) {
        if (is_constraint(rc)) return InsertResult::Constraint;
        LOG_ERROR("Insert grade failed: {}", sqlite3_errmsg(db));
        return InsertResult::Error;
    }
    return sqlite3_changes(db) > 0 ? InsertResult::Inserted : InsertResult::Duplicate;
}

/* =========================
   Queries
   ========================= */

bool db_list_distinct(sqlite3* db, Dimension dim, const Filters& f, std::vector<std::string>& out) {
    out.clear();
    std::vector<std::string> conds, params;
    std::string sql;

    switch (dim) {
    case Dimension::Year:
    case Dimension::Track:
    case Dimension::Semester: {
        const char* col = dim == Dimension::Year ? "s.academic_year"
            : dim == Dimension::Track ? "s.track" : "s.semester";
        add_filters(f, "s", false, conds, params);
        sql = std::string("SELECT DISTINCT ") + col + " FROM students s" + where_clause(conds) +
            " ORDER BY 1;";
        break;
    }
    case Dimension::Unit:
        conds.push_back("g.is_unit = 1");
        add_filters(f, "s", false, conds, params);
        sql = "SELECT DISTINCT g.unit_code FROM grades g JOIN students s ON g.student_id = s.id" +
            where_clause(conds) + " ORDER BY 1;";
        break;
    case Dimension::Course:
        conds.push_back("g.is_unit = 0");
        add_filters(f, "s", true, conds, params);
        sql = "SELECT DISTINCT g.course_name FROM grades g JOIN students s ON g.student_id = s.id" +
            where_clause(conds) + " ORDER BY 1;";
        break;
    }

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return false;
    bind_params(st, params);
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(col_text(st, 0));
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_get_student_grades(sqlite3* db, const std::string& family_name, const std::string& given_name,
    const Filters& f, std::vector<GradeRow>& out)
{
    out.clear();
    std::vector<std::string> conds{ "s.family_name = ?", "s.given_name = ?" };
    std::vector<std::string> params{ family_name, given_name };
    add_filters(f, "s", true, conds, params);

    std::string sql = std::string("SELECT s.id, ") + STUDENT_COLS + ", " + GRADE_COLS +
        " FROM students s JOIN grades g ON g.student_id = s.id" + where_clause(conds) +
        " ORDER BY s.id, g.id;";

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return false;
    bind_params(st, params);
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        GradeRow r;
        r.student_id = sqlite3_column_int64(st, 0);
        r.student = read_student(st, 1);
        r.grade = read_grade(st, 7);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_list_students(sqlite3* db, const Filters& f, std::vector<StudentRecord>& out) {
    out.clear();
    std::vector<std::string> conds, params;
    add_filters(f, "s", false, conds, params);

    std::string sql = std::string("SELECT ") + STUDENT_COLS + " FROM students s" + where_clause(conds) +
        " ORDER BY s.family_name, s.given_name;";

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return false;
    bind_params(st, params);
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(read_student(st, 0));
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_export(sqlite3* db, const Filters& f, std::vector<ExportRow>& out) {
    out.clear();
    std::vector<std::string> conds, params;
    add_filters(f, "s", true, conds, params);

    std::string sql = std::string("SELECT ") + STUDENT_COLS + ", " + GRADE_COLS +
        " FROM students s JOIN grades g ON g.student_id = s.id" + where_clause(conds) +
        " ORDER BY s.id, g.id;";

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, sql, st)) return false;
    bind_params(st, params);
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        ExportRow r;
        r.student = read_student(st, 0);
        r.grade = read_grade(st, 6);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return false;
    LOG_INFO("{} rows exported", out.size());
    return true;
}

/* =========================
   Delete
   ========================= */

// Grades go first so the count is right even on a DB created without the
// cascade; then the students themselves.
bool db_delete_where(sqlite3* db, const Filters& f, int& deleted_students) {
    deleted_students = 0;
    Filters student_filters = f;
    student_filters.unit_code.clear();

    std::vector<std::string> conds, params;
    add_filters(student_filters, "students", false, conds, params);
    if (conds.empty()) {
        LOG_WARN("Delete refused: no criteria given");
        return true;
    }
    std::string where = where_clause(conds);

    if (!db_begin(db)) return false;

    sqlite3_stmt* st = nullptr;
    std::string del_grades = "DELETE FROM grades WHERE student_id IN (SELECT students.id FROM students" + where + ");";
    if (!prepare(db, del_grades, st)) { db_rollback(db); return false; }
    bind_params(st, params);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("Delete grades failed: {}", sqlite3_errmsg(db));
        db_rollback(db);
        return false;
    }
    int grades_deleted = sqlite3_changes(db);

    std::string del_students = "DELETE FROM students" + where + ";";
    if (!prepare(db, del_students, st)) { db_rollback(db); return false; }
    bind_params(st, params);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("Delete students failed: {}", sqlite3_errmsg(db));
        db_rollback(db);
        return false;
    }
    int students_deleted = sqlite3_changes(db);

    if (!db_commit(db)) { db_rollback(db); return false; }

    deleted_students = students_deleted;
    LOG_INFO("{} students and {} grades deleted", students_deleted, grades_deleted);
    return true;
}

// Quick counts for the menu. One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM students) AS s, "
        " (SELECT COUNT(*) FROM grades)   AS g, "
        " (SELECT COUNT(*) FROM grades WHERE is_unit = 1) AS u;";

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, SQL, st)) return false;

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out.students = sqlite3_column_int(st, 0);
        out.grades = sqlite3_column_int(st, 1);
        out.units = sqlite3_column_int(st, 2);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok;
}
