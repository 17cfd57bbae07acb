//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger.cpp
// Purpose: Logger level filtering and host sink routing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "logging/Logger.h"

namespace {
struct SinkCapture {
    std::vector<std::pair<std::string, std::string>> records;

    SinkCapture() {
        Logger::setSink([this](const char* level, const std::string& msg) { records.emplace_back(level, msg); });
    }
    ~SinkCapture() {
        Logger::setSink(nullptr);
        Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    }
};
} // namespace

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::LOG_INFO_LEVEL);
}

TEST(Logger, SinkReceivesFormattedRecords) {
    SinkCapture cap;
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    LOG_INFO("session '{}' has {} tools", "calc", 3);
    LOG_DEBUG("debug {}", 1);
    ASSERT_EQ(cap.records.size(), 2u);
    EXPECT_EQ(cap.records[0].first, "INFO");
    EXPECT_EQ(cap.records[0].second, "session 'calc' has 3 tools");
    EXPECT_EQ(cap.records[1].first, "DEBUG");
}

TEST(Logger, LevelFiltersRecords) {
    SinkCapture cap;
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    LOG_INFO("hidden");
    LOG_WARN("shown");
    LOG_ERROR("also shown");
    ASSERT_EQ(cap.records.size(), 2u);
    EXPECT_EQ(cap.records[0].first, "WARN");
    EXPECT_EQ(cap.records[1].first, "ERROR");
}

TEST(Logger, BadFormatDoesNotThrow) {
    SinkCapture cap;
    LOG_INFO("missing arg {} {}", 1);
    ASSERT_EQ(cap.records.size(), 1u);
    EXPECT_NE(cap.records[0].second.find("Format error"), std::string::npos);
}
