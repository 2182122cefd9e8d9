// SPDX-License-Identifier: MIT

// tests/log_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lib/stream/log.hpp"

using namespace multistream;

namespace {

struct Record {
    LogLevel level;
    std::string component;
    std::string message;
};

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = GetLogLevel();
        SetLogHandler([this](LogLevel level, std::string_view component,
                             std::string_view message) {
            records_.push_back(Record{level, std::string(component), std::string(message)});
        });
    }

    void TearDown() override {
        SetLogHandler(nullptr);
        SetLogLevel(saved_level_);
    }

    std::vector<Record> records_;
    LogLevel saved_level_ = LogLevel::Warn;
};

}  // namespace

TEST_F(LogTest, FormatsWithFmt) {
    SetLogLevel(LogLevel::Debug);

    Log(LogLevel::Info, "test", "wrote {} of {} bytes", 10, 20);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Info);
    EXPECT_EQ(records_[0].component, "test");
    EXPECT_EQ(records_[0].message, "wrote 10 of 20 bytes");
}

TEST_F(LogTest, RecordsBelowThresholdAreDropped) {
    SetLogLevel(LogLevel::Warn);

    Log(LogLevel::Debug, "test", "hidden");
    Log(LogLevel::Info, "test", "hidden");
    Log(LogLevel::Warn, "test", "shown");
    Log(LogLevel::Error, "test", "shown");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].level, LogLevel::Warn);
    EXPECT_EQ(records_[1].level, LogLevel::Error);
}

TEST_F(LogTest, OffSuppressesEverything) {
    SetLogLevel(LogLevel::Off);

    Log(LogLevel::Error, "test", "hidden");

    EXPECT_TRUE(records_.empty());
    EXPECT_FALSE(LogEnabled(LogLevel::Error));
}

TEST_F(LogTest, OffIsNeverARecordLevel) {
    SetLogLevel(LogLevel::Debug);

    EXPECT_FALSE(LogEnabled(LogLevel::Off));
    EXPECT_TRUE(LogEnabled(LogLevel::Debug));
}

TEST_F(LogTest, HandlerMayLog) {
    SetLogLevel(LogLevel::Debug);
    int depth = 0;
    SetLogHandler([&](LogLevel, std::string_view, std::string_view) {
        if (++depth == 1) {
            Log(LogLevel::Info, "nested", "again");
        }
    });

    Log(LogLevel::Info, "test", "once");

    EXPECT_EQ(depth, 2);
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_name(LogLevel::Debug), "debug");
    EXPECT_EQ(log_level_name(LogLevel::Info), "info");
    EXPECT_EQ(log_level_name(LogLevel::Warn), "warn");
    EXPECT_EQ(log_level_name(LogLevel::Error), "error");
    EXPECT_EQ(log_level_name(LogLevel::Off), "off");
}
