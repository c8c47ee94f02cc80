#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite persistence layer
-------------------------------------------------------------------------------

This header declares all functions that interact with the SQLite database.
They provide a small API so the importer and the front end never deal with
raw sqlite3_* calls.

Schema (two tables, nothing else is persisted):
  students(id, family_name, given_name, student_number, track,
           academic_year, semester,
           UNIQUE(family_name, given_name, track, academic_year, semester))
  grades(id, student_id -> students.id ON DELETE CASCADE, unit_code,
         course_name, score CHECK 0..20, is_unit,
         UNIQUE(student_id, course_name))

Design:
  - Each function returns `bool` to indicate success/failure; results go to
    out-parameters. Inserts return an InsertResult so the importer can tell
    a skipped duplicate from a constraint violation from a dead store.
  - The connection is passed explicitly. DbHandle owns its lifetime for the
    duration of one operation (open, use, release).

Usage convention:
  - DbHandle h(path); if (!h.ok()) ...; db_init_schema(h.get());
  - Everything else takes h.get().
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Scoped connection: opens in the constructor, closes in the destructor.
class DbHandle {
public:
    explicit DbHandle(const std::string& path) { db_open(db_, path); }
    ~DbHandle() { db_close(db_); }

    DbHandle(const DbHandle&) = delete;
    DbHandle& operator=(const DbHandle&) = delete;

    bool ok() const { return db_ != nullptr; }
    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

/// Create tables if missing. Safe to call on every startup.
bool db_init_schema(sqlite3* db);

// ==========================
// Transactions
// ==========================

bool db_begin(sqlite3* db);
bool db_commit(sqlite3* db);
bool db_rollback(sqlite3* db);

/// Nested transaction scope. Rolls back to the savepoint on destruction
/// unless release() succeeded first.
class SavepointScope {
public:
    SavepointScope(sqlite3* db, std::string name);
    ~SavepointScope();

    SavepointScope(const SavepointScope&) = delete;
    SavepointScope& operator=(const SavepointScope&) = delete;

    bool ok() const { return open_; }
    bool release();
    bool rollback();

private:
    sqlite3* db_;
    std::string name_;
    bool open_ = false;
};

// ==========================
// INSERT operations
// ==========================

enum class InsertResult {
    Inserted,   // new row written
    Duplicate,  // identity key already present, row skipped
    Constraint, // any other constraint violation (CHECK, NOT NULL, FK)
    Error       // the store itself failed
};

/// Insert-or-skip on the 5-column identity key. `id` receives the row id of
/// the new or existing student (Inserted and Duplicate only).
InsertResult db_insert_student(sqlite3* db, const StudentRecord& s, long long& id);

/// Insert-or-skip on (student_id, course_name).
InsertResult db_insert_grade(sqlite3* db, long long student_id, const GradeEntry& g);

// ==========================
// Queries
// ==========================

/// Distinct values of one dimension, ascending. Unit and course dimensions
/// only look at unit rows / course rows respectively; `f.unit_code`
/// narrows the course dimension.
bool db_list_distinct(sqlite3* db, Dimension dim, const Filters& f, std::vector<std::string>& out);

/// All grade rows of one student (family + given name), in import order.
bool db_get_student_grades(sqlite3* db, const std::string& family_name, const std::string& given_name,
    const Filters& f, std::vector<GradeRow>& out);

/// Identity rows, ordered by family then given name.
bool db_list_students(sqlite3* db, const Filters& f, std::vector<StudentRecord>& out);

/// Denormalized students x grades join. Empty filters = everything.
bool db_export(sqlite3* db, const Filters& f, std::vector<ExportRow>& out);

// ==========================
// DELETE operations
// ==========================

/// Delete students matching year/track/semester (all given ones must match)
/// and their grades. An empty filter set deletes nothing.
bool db_delete_where(sqlite3* db, const Filters& f, int& deleted_students);

// ==========================
// Counts (for menus)
// ==========================

struct DbCounts {
    int students = 0;
    int grades = 0;   // unit + course rows
    int units = 0;    // rows with is_unit = 1
};

bool db_get_counts(sqlite3* db, DbCounts& out);
