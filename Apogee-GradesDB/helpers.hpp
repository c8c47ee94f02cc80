#pragma once
#include <string>
#include <vector>
#include <ostream>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp — Presentation helpers for the console front end
-------------------------------------------------------------------------------
These functions format query results; they never touch SQLite. The menu and
the batch commands share them so both print the same way.

Naming convention:
  - parse_*   -> operator text to typed value, false when unknown.
  - print_*   -> human-readable listing on the given stream.
  - write_*   -> file output, false (and logged) on I/O failure.
-------------------------------------------------------------------------------
*/

/// "years", "parcours", "semestres", "ues", "courses" (French or English
/// spellings) -> Dimension.
bool parse_dimension(const std::string& name, Dimension& out);

/// Heading used above a listing of that dimension.
const char* dimension_title(Dimension dim);

/// "annee=2022-2023, parcours=M1" or "(none)".
std::string describe_filters(const Filters& f);

/// Score with at most two decimals, dot separator: 14.5, 12, 13.25.
std::string format_score(double score);

/// Quotes a CSV field when it holds a separator, a quote or a line break.
std::string csv_escape(const std::string& field);

void print_values(std::ostream& os, const std::string& title, const std::vector<std::string>& values);
void print_students(std::ostream& os, const std::vector<StudentRecord>& rows);

/// Units flush left, their courses indented below them.
void print_student_grades(std::ostream& os, const std::vector<GradeRow>& rows);

/// Writes the export with a header row:
/// Nom,Prenom,NumeroEtudiant,Parcours,Annee,Semestre,UE,Cours,Note,EstUE
bool write_export_csv(const std::vector<ExportRow>& rows, const std::string& path);
