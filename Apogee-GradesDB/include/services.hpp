#pragma once
#include <string>
#include <vector>
#include "models.hpp"
#include "config.hpp"
#include "db.hpp"
#include "importer.hpp"
#include "logging.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - Operations offered to front ends (menu, batch CLI, exports)
-------------------------------------------------------------------------------
This is the whole contract downstream tools rely on:
  - import_document      file -> number of students imported (optionally
                         replacing the students of the same term)
  - export_all           students x grades join
  - list_distinct        year / track / semester / unit / course values
  - get_student_grades   every grade row of one student
  - delete_where         students (and grades) of a year/track/semester
plus list_students and get_counts for the console menu.

Design notes
  - Every operation takes the store handle explicitly. The caller opens it
    (DbHandle) for the duration of the operation and releases it after;
    nothing here keeps a connection.
  - Return values follow the db layer: bool for success, results in
    out-parameters. A false return means the store failed and nothing was
    changed by that call.
-------------------------------------------------------------------------------
*/

// import_document is declared in importer.hpp and used as is.

inline bool export_all(sqlite3* db, std::vector<ExportRow>& rows) {
    return db_export(db, Filters{}, rows);
}

inline bool export_filtered(sqlite3* db, const Filters& f, std::vector<ExportRow>& rows) {
    return db_export(db, f, rows);
}

inline bool list_distinct(sqlite3* db, Dimension dim, const Filters& f, std::vector<std::string>& values) {
    return db_list_distinct(db, dim, f, values);
}

inline bool get_student_grades(sqlite3* db, const std::string& family_name, const std::string& given_name,
    const Filters& f, std::vector<GradeRow>& rows)
{
    if (!db_get_student_grades(db, family_name, given_name, f, rows)) {
        LOG_ERROR("Could not read grades of {} {}", given_name, family_name);
        return false;
    }
    LOG_INFO("Grades read for {} {} ({} rows)", given_name, family_name, rows.size());
    return true;
}

inline bool delete_where(sqlite3* db, const Filters& f, int& deleted_students) {
    return db_delete_where(db, f, deleted_students);
}

inline bool list_students(sqlite3* db, const Filters& f, std::vector<StudentRecord>& rows) {
    return db_list_students(db, f, rows);
}

inline bool get_counts(sqlite3* db, DbCounts& out) {
    return db_get_counts(db, out);
}
