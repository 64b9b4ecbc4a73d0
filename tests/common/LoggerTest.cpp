// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/Logger.h"
#include <gtest/gtest.h>
#include <mutex>
#include <utility>
#include <vector>

using namespace CLE;

namespace {

struct CapturedRecords {
    std::mutex mutex;
    std::vector<std::pair<LogLevel, std::string>> records;
};

class CapturingBackend : public ILoggerBackend {
public:
    explicit CapturingBackend(std::shared_ptr<CapturedRecords> sink) : sink_(std::move(sink)) {}

    void log(LogLevel level, const std::string &message, const std::source_location &) override {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        sink_->records.emplace_back(level, message);
    }

    void setLevel(LogLevel) override {}

    void flush() override {}

private:
    std::shared_ptr<CapturedRecords> sink_;
};

void emitFromNamedFunction() {
    LOG_WARN("value={} name={}", 42, "cle");
}

}  // anonymous namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured_ = std::make_shared<CapturedRecords>();
        Logger::setBackend(std::make_unique<CapturingBackend>(captured_));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<CapturedRecords> captured_;
};

TEST_F(LoggerTest, MacrosFormatAndPrefixFunctionName) {
    emitFromNamedFunction();

    ASSERT_EQ(captured_->records.size(), 1u);
    EXPECT_EQ(captured_->records[0].first, LogLevel::Warn);
    EXPECT_NE(captured_->records[0].second.find("emitFromNamedFunction() - value=42 name=cle"), std::string::npos)
        << captured_->records[0].second;
}

TEST_F(LoggerTest, LevelHelpersForwardLevel) {
    Logger::debug("d");
    Logger::error("e");

    ASSERT_EQ(captured_->records.size(), 2u);
    EXPECT_EQ(captured_->records[0].first, LogLevel::Debug);
    EXPECT_EQ(captured_->records[1].first, LogLevel::Error);
}

TEST(LoggerLevelTest, ParseLevelAcceptsKnownNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("err"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
}
