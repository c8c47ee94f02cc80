#pragma once
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 cl_args.hpp — Command line of apogee_grades
-------------------------------------------------------------------------------
  apogee_grades [--db PATH] import [--replace] FILE...
  apogee_grades [--db PATH] delete [--annee Y] [--parcours T] [--semestre S] [--yes]
  apogee_grades [--db PATH] list --type years|parcours|semestres|ues|courses|students [filters]
  apogee_grades [--db PATH] grades NOM PRENOM [filters]
  apogee_grades [--db PATH] export [--output FILE] [filters]
  apogee_grades [--db PATH]                      (interactive menu)

Filters are --annee, --parcours, --semestre and, for list/export, --ue.
-------------------------------------------------------------------------------
*/

enum class Command { Menu, Import, Delete, List, Grades, Export };

struct CliOptions {
    Command command = Command::Menu;
    std::string db_path;                // empty = keep the configured one

    std::vector<std::string> files;     // import
    Filters filters;                    // delete, list, grades, export
    bool assume_yes = false;            // delete
    bool replace = false;               // import

    std::string list_type;              // list
    std::string family_name;            // grades
    std::string given_name;
    std::string output = "data_tdb.csv"; // export
};

/// Parses argv into `out`. On a usage error returns false and fills `error`
/// with the message followed by the help text.
bool parse_cli(int argc, const char* const argv[], CliOptions& out, std::string& error);
