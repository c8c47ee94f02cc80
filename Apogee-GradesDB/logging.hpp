#pragma once

/*
-------------------------------------------------------------------------------
 logging.hpp — spdlog setup and LOG_* wrappers
-------------------------------------------------------------------------------
All diagnostics (parse fallbacks, skipped students, rolled back savepoints,
SQLite errors) go through these macros and end up on stderr. Console output
meant for the operator (menus, listings) still uses std::cout.

Level selection:
  - compile time: DEBUG -> trace, RELEASE -> warn, otherwise debug.
    Handled failures are logged as warnings, so no build drops them
  - run time: SPDLOG_LEVEL environment variable (e.g. SPDLOG_LEVEL=debug), or
    set_log_level() with a level name from the configuration
-------------------------------------------------------------------------------
*/

// Needs to be done before including spdlog
#ifdef DEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

inline void init_loggers() {
#if defined(DEBUG)
    spdlog::set_level(spdlog::level::trace);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::warn);
#else
    spdlog::set_level(spdlog::level::info);
#endif

    // Log to stderr so listings on stdout stay clean
    if (!spdlog::get("apogee")) {
        spdlog::set_default_logger(spdlog::stderr_color_st("apogee"));
    }

    // Pattern:
    //   time - [HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   message - "foo bar"
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] %v");

    // Override any previously set level with SPDLOG_LEVEL, if set
    spdlog::cfg::load_env_levels();
}

// Apply a level name ("trace", "debug", "info", "warn", "error", "off").
// Unknown names leave the current level untouched.
inline void set_log_level(const std::string& name) {
    if (name.empty()) return;
    auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") {
        LOG_WARN("Unknown log level '{}', keeping {}", name,
            spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(lvl);
}
