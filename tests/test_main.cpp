#include <gtest/gtest.h>

#include "logging.hpp"

int main(int argc, char** argv) {
    init_loggers();
    // Keep test output readable; SPDLOG_LEVEL=debug brings the details back
    spdlog::set_level(spdlog::level::err);
    spdlog::cfg::load_env_levels();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
