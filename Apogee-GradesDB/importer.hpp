#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"
#include "config.hpp"

/*
-------------------------------------------------------------------------------
 importer.hpp — Savepoint-per-student import of parsed transcripts
-------------------------------------------------------------------------------
One outer transaction per document, one SAVEPOINT per student:
  - a student whose rows all insert (or are skipped as duplicates) is
    released into the outer transaction;
  - a constraint violation rolls back that student only and the batch
    goes on;
  - a store failure rolls back the whole document and returns false.

The batch is not atomic on purpose: as much of a partly malformed document
as possible ends up in the database.

Inserts never overwrite. Importing a corrected transcript for a year /
track / semester already stored keeps the old scores unless the caller
asks for a replace, which first deletes the students of that term.
-------------------------------------------------------------------------------
*/

struct ImportStats {
    int attempted = 0;    // students handed to the importer
    int committed = 0;    // released with at least one new row
    int unchanged = 0;    // released, every row already present
    int rolled_back = 0;  // integrity violation, savepoint undone
    int new_grades = 0;
};

/// Persists every student of `doc`. Returns false only on a store failure,
/// in which case nothing from this document is committed.
bool import_students(sqlite3* db, const ParsedDocument& doc, ImportStats& stats);

/// Number of stored students of the year / track / semester of `term`.
bool count_term_students(sqlite3* db, const ParcoursInfo& term, int& existing);

/// Reads, parses and imports one file. `imported` receives the number of
/// committed students. Fails on unreadable input, on a store failure, and
/// (strict mode only) on a document whose header had to be defaulted.
/// With `replace`, students already stored for the document's term are
/// deleted before the import; otherwise they are kept and a warning says so.
bool import_document(sqlite3* db, const std::string& path, const AppConfig& cfg, int& imported,
    bool replace = false);
