#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

namespace cfgstore {

// ── parse_log_level ───────────────────────────────────────────────────────────

TEST(LoggerTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"),    spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"),    spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"),     spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"),     spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"),    spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
    EXPECT_EQ(parse_log_level(""),     spdlog::level::info);
}

// ── Loggers ───────────────────────────────────────────────────────────────────

TEST(LoggerTest, ComponentLoggerIsCreatedOnce) {
    auto first  = make_component_logger("logger_test_component", spdlog::level::debug);
    auto second = make_component_logger("logger_test_component", spdlog::level::err);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "logger_test_component");
    EXPECT_EQ(first->level(), spdlog::level::debug);
}

TEST(LoggerTest, InitDefaultLoggerInstallsCfgstoreLogger) {
    init_default_logger(spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->name(), "cfgstore");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);

    init_default_logger(spdlog::level::debug); // idempotent
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST(LoggerTest, LoggerOrDefaultPrefersGivenLogger) {
    auto mine = make_component_logger("logger_test_mine");
    EXPECT_EQ(logger_or_default(mine), mine);
    EXPECT_EQ(logger_or_default(nullptr), spdlog::default_logger());
}

} // namespace cfgstore
