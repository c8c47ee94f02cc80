/*
-------------------------------------------------------------------------------
 Apogee-GradesDB.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end of the APOGEE grade database. Transcript exports (the
   text version of the APOGEE "relevé de notes" PDF) are parsed and imported
   into SQLite; the same binary lists, queries, deletes and exports what was
   imported. This file contains main().

 Two ways in:
   - Batch: `apogee_grades [--db PATH] <command> ...` (see cl_args.hpp).
     Exit code 0 on success, 1 on a store or I/O failure, 2 on usage error.
   - Interactive: no command starts the menu loop below.

 Data flow:
   - Persistent store: SQLite (db.hpp / services.hpp)
   - Every operation opens the database, does its work and closes it again;
     no connection outlives a menu choice or a batch command.
   - Import runs one transaction per file with one savepoint per student
     (importer.hpp), so a bad student never blocks the rest of the file.

 User input model (menu):
   - Text fields are validated with helpers in validation.hpp
   - Every prompt accepts the InputCtl controls:
       * Back  (0 / b) -> cancel current action and return to the menu
       * Exit  (x / q) -> leave the application
   - Filters are optional: Enter means "any".

 Build:
   - Requires SQLite3, spdlog and argparse, and a C++17 compiler.
-------------------------------------------------------------------------------
*/

#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "services.hpp"     // import/export/list/query/delete operations
#include "cl_args.hpp"      // batch command line
#include "validation.hpp"   // Input validation helpers and InputCtl enum
#include "helpers.hpp"      // Listing and CSV output
#include "logging.hpp"
using namespace std;         // OK for this small console app; avoid in headers

// Prints the welcome banner once when the menu starts.
static void showWelcome() {
    cout << "=====================================================\n";
    cout << "                        WELCOME                      \n";
    cout << "=====================================================\n";
    cout << "               APOGEE Grades Database                \n";
    cout << "-----------------------------------------------------\n";
    cout << "      Transcript import, queries and CSV export      \n";
    cout << "=====================================================\n\n";
}

// Opens the store and makes sure the schema exists.
static bool open_store(DbHandle& h, const AppConfig& cfg) {
    if (!h.ok()) {
        cout << "Could not open database " << cfg.db_path << ".\n";
        return false;
    }
    if (!db_init_schema(h.get())) {
        cout << "Could not initialize database " << cfg.db_path << ".\n";
        return false;
    }
    return true;
}

//-----------------------------------------
// Operations shared by the batch commands and the menu
//-----------------------------------------

static bool run_import(const AppConfig& cfg, const vector<string>& files, bool replace) {
    DbHandle h(cfg.db_path);
    if (!open_store(h, cfg)) return false;

    bool all_ok = true;
    int total = 0;
    for (const auto& path : files) {
        int imported = 0;
        if (import_document(h.get(), path, cfg, imported, replace)) {
            cout << path << ": " << imported << " students imported.\n";
            total += imported;
        } else {
            cout << path << ": import failed (see log).\n";
            all_ok = false;
        }
    }
    if (files.size() > 1) cout << "Total: " << total << " students imported.\n";
    return all_ok;
}

static bool run_delete(const AppConfig& cfg, const Filters& f, bool assume_yes) {
    Filters scope = f;
    scope.unit_code.clear();
    if (scope.empty()) {
        cout << "Refusing to delete without --annee, --parcours or --semestre.\n";
        return false;
    }

    if (!assume_yes) {
        auto c = confirm_or_back("Delete every student matching " + describe_filters(scope) + " and their grades?");
        if (c != InputCtl::Ok) { cout << "Nothing deleted.\n"; return true; }
    }

    DbHandle h(cfg.db_path);
    if (!open_store(h, cfg)) return false;

    int deleted = 0;
    if (!delete_where(h.get(), scope, deleted)) {
        cout << "Delete failed (DB error), nothing was removed.\n";
        return false;
    }
    cout << deleted << " students deleted.\n";
    return true;
}

static bool run_list(const AppConfig& cfg, const string& type, const Filters& f) {
    DbHandle h(cfg.db_path);
    if (!open_store(h, cfg)) return false;

    if (type == "students") {
        vector<StudentRecord> rows;
        if (!list_students(h.get(), f, rows)) { cout << "Query failed.\n"; return false; }
        print_students(cout, rows);
        return true;
    }

    Dimension dim;
    if (!parse_dimension(type, dim)) { cout << "Unknown list type '" << type << "'.\n"; return false; }

    vector<string> values;
    if (!list_distinct(h.get(), dim, f, values)) { cout << "Query failed.\n"; return false; }
    print_values(cout, dimension_title(dim), values);
    return true;
}

static bool run_grades(const AppConfig& cfg, const string& family, const string& given, const Filters& f) {
    DbHandle h(cfg.db_path);
    if (!open_store(h, cfg)) return false;

    vector<GradeRow> rows;
    if (!get_student_grades(h.get(), family, given, f, rows)) { cout << "Query failed.\n"; return false; }
    print_student_grades(cout, rows);
    return true;
}

static bool run_export(const AppConfig& cfg, const Filters& f, const string& output) {
    DbHandle h(cfg.db_path);
    if (!open_store(h, cfg)) return false;

    vector<ExportRow> rows;
    if (!export_filtered(h.get(), f, rows)) { cout << "Export query failed.\n"; return false; }
    if (!write_export_csv(rows, output)) { cout << "Could not write " << output << ".\n"; return false; }
    cout << rows.size() << " rows exported to " << output << ".\n";
    return true;
}

//-----------------------------------------
// Interactive menu
//-----------------------------------------

static bool is_non_empty(const string& v) { return !v.empty(); }

static bool is_list_choice(const string& v) {
    Dimension unused;
    return v == "students" || parse_dimension(v, unused);
}

// Asks for year, track and semester filters in that order.
static InputCtl prompt_filters(Filters& f) {
    auto a = prompt_filter_or_back("Academic year (e.g. 2022-2023)", f.academic_year, is_valid_year,
        "Use YYYY-YYYY, e.g. 2022-2023.");
    if (a != InputCtl::Ok) return a;

    auto b = prompt_filter_or_back("Track (e.g. M1 API)", f.track, is_valid_track,
        "Track required (max 40 chars).");
    if (b != InputCtl::Ok) return b;

    return prompt_filter_or_back("Semester (e.g. 7)", f.semester, is_valid_semester,
        "Semester is a number, e.g. 7.");
}

static void run_menu(const AppConfig& cfg) {
    showWelcome();

    int choice = -1;

    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        DbCounts counts;
        {
            DbHandle h(cfg.db_path);
            if (!open_store(h, cfg) || !get_counts(h.get(), counts)) return;
        }

        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "  Students: " << counts.students
            << "   Grades: " << counts.grades
            << "   Units: " << counts.units << "\n"
            << "  Database: " << cfg.db_path << "\n"
            << "-----------------------------------------------------\n"
            << "  [1]  Import transcript   [2]  List values          \n"
            << "  [3]  List students       [4]  Student grades       \n"
            << "  [5]  Export CSV                                    \n"
            << "-----------------------------------------------------\n"
            << " DELETE:                                             \n"
            << "  [6]  Delete year / track / semester                \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }
        clear_input();

        // ---- 1) Import transcript ------------------------------------------
        if (choice == 1) {
            std::string path;
            auto p = prompt_until_valid_or_back("Transcript file", path, is_non_empty, "A file path is required.");
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            // Back or "n" keeps what is stored, only new rows are added
            auto r = confirm_or_back("Replace students already stored for the same year / track / semester?");
            if (r == InputCtl::Exit) { choice = 0; break; }

            run_import(cfg, { path }, r == InputCtl::Ok);
        }

        // ---- 2) List distinct values ---------------------------------------
        else if (choice == 2) {
            std::string type;
            auto t = prompt_until_valid_or_back("What (years, parcours, semestres, ues, courses)", type,
                is_list_choice, "Unknown list type.");
            if (t == InputCtl::Back) continue;
            if (t == InputCtl::Exit) { choice = 0; break; }

            Filters f;
            auto r = prompt_filters(f);
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            if (type == "courses" || type == "cours") {
                auto u = prompt_filter_or_back("Unit code (e.g. UE401)", f.unit_code, is_non_empty, "");
                if (u == InputCtl::Back) continue;
                if (u == InputCtl::Exit) { choice = 0; break; }
            }

            run_list(cfg, type, f);
        }

        // ---- 3) List students ----------------------------------------------
        else if (choice == 3) {
            Filters f;
            auto r = prompt_filters(f);
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            run_list(cfg, "students", f);
        }

        // ---- 4) Student grades ---------------------------------------------
        else if (choice == 4) {
            std::string family, given;
            auto n1 = prompt_until_valid_or_back("Family name (NOM)", family, is_valid_person_name,
                "Name required (max 60 chars).");
            if (n1 == InputCtl::Back) continue;
            if (n1 == InputCtl::Exit) { choice = 0; break; }

            auto n2 = prompt_until_valid_or_back("Given name (Prénom)", given, is_valid_person_name,
                "Name required (max 60 chars).");
            if (n2 == InputCtl::Back) continue;
            if (n2 == InputCtl::Exit) { choice = 0; break; }

            run_grades(cfg, family, given, Filters{});
        }

        // ---- 5) Export CSV -------------------------------------------------
        else if (choice == 5) {
            std::string output;
            auto o = prompt_until_valid_or_back("Output file (e.g. data_tdb.csv)", output, is_non_empty,
                "A file name is required.");
            if (o == InputCtl::Back) continue;
            if (o == InputCtl::Exit) { choice = 0; break; }

            run_export(cfg, Filters{}, output);
        }

        // ---- 6) Delete year / track / semester -----------------------------
        else if (choice == 6) {
            Filters f;
            auto r = prompt_filters(f);
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            // Confirmation is asked inside run_delete.
            run_delete(cfg, f, false);
        }

        else if (choice != 0) {
            std::cout << "Unknown option.\n";
        }
    }
}

//-----------------------------------------
int main(int argc, char* argv[]) {
    init_loggers();

    AppConfig cfg = AppConfig::loadFromEnv();
    set_log_level(cfg.log_level);

    CliOptions opts;
    std::string usage_error;
    if (!parse_cli(argc, argv, opts, usage_error)) {
        std::cerr << usage_error;
        return 2;
    }
    if (!opts.db_path.empty()) cfg.db_path = opts.db_path;

    LOG_DEBUG("Database: {}", cfg.db_path);

    bool ok = true;
    switch (opts.command) {
    case Command::Menu:
        run_menu(cfg);
        break;
    case Command::Import:
        ok = run_import(cfg, opts.files, opts.replace);
        break;
    case Command::Delete:
        ok = run_delete(cfg, opts.filters, opts.assume_yes);
        break;
    case Command::List:
        ok = run_list(cfg, opts.list_type, opts.filters);
        break;
    case Command::Grades:
        ok = run_grades(cfg, opts.family_name, opts.given_name, opts.filters);
        break;
    case Command::Export:
        ok = run_export(cfg, opts.filters, opts.output);
        break;
    }

    return ok ? 0 : 1;
}
