#include "cl_args.hpp"
#include "helpers.hpp"
#include "logging.hpp"

#include <argparse/argparse.hpp>

#include <exception>
#include <stdexcept>

namespace {

void add_filter_args(argparse::ArgumentParser& p, bool with_unit) {
    p.add_argument("--annee")
        .default_value(std::string{})
        .metavar("YYYY-YYYY")
        .help("academic year, e.g. 2022-2023");
    p.add_argument("--parcours")
        .default_value(std::string{})
        .metavar("TRACK")
        .help("track, e.g. \"M1 API\"");
    p.add_argument("--semestre")
        .default_value(std::string{})
        .metavar("N")
        .help("semester number");
    if (with_unit) {
        p.add_argument("--ue")
            .default_value(std::string{})
            .metavar("CODE")
            .help("teaching unit code, e.g. UE401");
    }
}

Filters read_filters(const argparse::ArgumentParser& p, bool with_unit) {
    Filters f;
    f.academic_year = p.get<std::string>("--annee");
    f.track = p.get<std::string>("--parcours");
    f.semester = p.get<std::string>("--semestre");
    if (with_unit) f.unit_code = p.get<std::string>("--ue");
    return f;
}

bool is_list_type(const std::string& t) {
    Dimension unused;
    return t == "students" || parse_dimension(t, unused);
}

} // namespace

bool parse_cli(int argc, const char* const argv[], CliOptions& out, std::string& error) {
    out = CliOptions{};

    argparse::ArgumentParser program("apogee_grades", "1.0");
    program.add_description("Imports APOGEE transcript exports into a SQLite grade database and queries it.\n"
                            "Without a command, starts the interactive menu.");
    program.add_argument("--db")
        .default_value(std::string{})
        .metavar("PATH")
        .help("SQLite database file (default: APOGEE_DB or academic_data.db)");

    // clang-format off
    argparse::ArgumentParser import_cmd("import", "", argparse::default_arguments::help);
    import_cmd.add_description("Import one or more transcript text files");
    import_cmd.add_argument("files")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("FILE")
        .help("transcript exports (UTF-8 text)");
    import_cmd.add_argument("--replace")
        .flag()
        .help("first delete the students already stored for each file's year / track / semester");

    argparse::ArgumentParser delete_cmd("delete", "", argparse::default_arguments::help);
    delete_cmd.add_description("Delete the students of a year / track / semester and their grades");
    add_filter_args(delete_cmd, false);
    delete_cmd.add_argument("-y", "--yes")
        .flag()
        .help("do not ask for confirmation");

    argparse::ArgumentParser list_cmd("list", "", argparse::default_arguments::help);
    list_cmd.add_description("List the distinct values of a column, or the students");
    list_cmd.add_argument("--type")
        .required()
        .metavar("TYPE")
        .help("years, parcours, semestres, ues, courses or students");
    add_filter_args(list_cmd, true);

    argparse::ArgumentParser grades_cmd("grades", "", argparse::default_arguments::help);
    grades_cmd.add_description("Show every grade of one student");
    grades_cmd.add_argument("nom").help("family name, as printed on the transcript");
    grades_cmd.add_argument("prenom").help("given name");
    add_filter_args(grades_cmd, false);

    argparse::ArgumentParser export_cmd("export", "", argparse::default_arguments::help);
    export_cmd.add_description("Write the students x grades table as CSV");
    export_cmd.add_argument("-o", "--output")
        .default_value(std::string{"data_tdb.csv"})
        .metavar("FILE")
        .help("CSV file to write");
    add_filter_args(export_cmd, true);
    // clang-format on

    program.add_subparser(import_cmd);
    program.add_subparser(delete_cmd);
    program.add_subparser(list_cmd);
    program.add_subparser(grades_cmd);
    program.add_subparser(export_cmd);

    try {
        program.parse_args(argc, argv);

        out.db_path = program.get<std::string>("--db");

        if (program.is_subcommand_used(import_cmd)) {
            out.command = Command::Import;
            out.files = import_cmd.get<std::vector<std::string>>("files");
            out.replace = import_cmd.get<bool>("--replace");
        } else if (program.is_subcommand_used(delete_cmd)) {
            out.command = Command::Delete;
            out.filters = read_filters(delete_cmd, false);
            out.assume_yes = delete_cmd.get<bool>("--yes");
        } else if (program.is_subcommand_used(list_cmd)) {
            out.command = Command::List;
            out.list_type = list_cmd.get<std::string>("--type");
            out.filters = read_filters(list_cmd, true);
            if (!is_list_type(out.list_type))
                throw std::invalid_argument("Unknown list type '" + out.list_type + "'");
        } else if (program.is_subcommand_used(grades_cmd)) {
            out.command = Command::Grades;
            out.family_name = grades_cmd.get<std::string>("nom");
            out.given_name = grades_cmd.get<std::string>("prenom");
            out.filters = read_filters(grades_cmd, false);
        } else if (program.is_subcommand_used(export_cmd)) {
            out.command = Command::Export;
            out.output = export_cmd.get<std::string>("--output");
            out.filters = read_filters(export_cmd, true);
        }
    } catch (const std::exception& err) {
        error = std::string(err.what()) + "\n" + program.help().str();
        return false;
    }

    LOG_DEBUG("Parsed command line: command={}, db='{}', filters={}",
        static_cast<int>(out.command), out.db_path, describe_filters(out.filters));
    return true;
}
