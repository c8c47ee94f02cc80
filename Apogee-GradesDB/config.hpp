#pragma once
#include <cstdlib> // For getenv
#include <string>

/*
-------------------------------------------------------------------------------
 config.hpp — Runtime configuration read from the environment
-------------------------------------------------------------------------------
  APOGEE_DB                database file (default academic_data.db)
  APOGEE_PAGE_HEADER       page header repeated on every transcript page
  APOGEE_DEFAULT_TRACK     placeholders used when the document header does
  APOGEE_DEFAULT_YEAR      not declare the track / year / semester
  APOGEE_DEFAULT_SEMESTER
  APOGEE_STRICT_HEADER     "1" = refuse documents with an incomplete header
  APOGEE_LOG_LEVEL         spdlog level name (SPDLOG_LEVEL also works)

The command line can still override db_path after loading.
-------------------------------------------------------------------------------
*/

struct AppConfig {
    std::string db_path = "academic_data.db";
    std::string page_header_marker = "Université Savoie Mont Blanc Année universitaire";

    std::string default_track = "M1 API";
    std::string default_year = "2022-2023";
    std::string default_semester = "7";

    bool strict_header = false;
    std::string log_level;

    static AppConfig loadFromEnv() {
        AppConfig config;

        auto read = [](const char* name, std::string& into) {
            const char* v = std::getenv(name);
            if (v && *v) into = v;
        };

        read("APOGEE_DB", config.db_path);
        read("APOGEE_PAGE_HEADER", config.page_header_marker);
        read("APOGEE_DEFAULT_TRACK", config.default_track);
        read("APOGEE_DEFAULT_YEAR", config.default_year);
        read("APOGEE_DEFAULT_SEMESTER", config.default_semester);
        read("APOGEE_LOG_LEVEL", config.log_level);

        std::string strict;
        read("APOGEE_STRICT_HEADER", strict);
        config.strict_header = (strict == "1" || strict == "true" || strict == "yes");

        return config;
    }
};
