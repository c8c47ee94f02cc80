/**
 * @file test_logging.cpp
 * @brief Handled failures reach the log in every build configuration
 */

#include <gtest/gtest.h>

#include "logging.hpp"
#include "parser.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

namespace {

// Routes the default logger into a string for the lifetime of the object.
class LogCapture {
public:
    LogCapture()
        : saved_(spdlog::default_logger()), saved_level_(spdlog::get_level()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(out_);
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
        spdlog::set_level(spdlog::level::warn);
    }

    ~LogCapture() {
        spdlog::set_default_logger(saved_);
        spdlog::set_level(saved_level_);
    }

    std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> saved_;
    spdlog::level::level_enum saved_level_;
};

} // namespace

TEST(LoggingTest, WarningsAreCompiledIn) {
    EXPECT_LE(SPDLOG_ACTIVE_LEVEL, SPDLOG_LEVEL_WARN);
}

TEST(LoggingTest, InitLeavesWarningsEnabled) {
    if (std::getenv("SPDLOG_LEVEL")) GTEST_SKIP() << "level forced by SPDLOG_LEVEL";

    auto saved_level = spdlog::get_level();
    init_loggers();
    EXPECT_LE(spdlog::get_level(), spdlog::level::warn);
    spdlog::set_level(saved_level);
}

TEST(LoggingTest, SkippedStudentsAndPlaceholdersAreLogged) {
    std::string text;
    {
        LogCapture capture;
        AppConfig cfg;
        ParsedDocument doc;
        ASSERT_TRUE(parse_document_file(std::string(TEST_DATA_DIR) + "/transcript_malformed.txt", cfg, doc));
        EXPECT_EQ(doc.blocks_skipped, 2);
        text = capture.text();
    }

    EXPECT_NE(text.find("student skipped"), std::string::npos) << text;
    EXPECT_NE(text.find("No academic year declaration found"), std::string::npos) << text;
}
