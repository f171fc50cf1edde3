/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Logging tests
 */

#include "libxdrtraj/xdr_log.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace xdrtraj;

namespace {

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    saved = log_level();
    set_log_callback([this](LogLevel level, const std::string &message) {
      received.emplace_back(level, message);
    });
  }

  void TearDown() override {
    set_log_callback(nullptr);
    set_log_level(saved);
  }

  LogLevel saved = LogLevel::Warning;
  std::vector<std::pair<LogLevel, std::string>> received;
};

} // namespace

TEST_F(LogTest, DebugLevelReceivesEverything) {
  set_log_level(LogLevel::Debug);
  EXPECT_EQ(log_level(), LogLevel::Debug);
  log::debug("frame {} of {} atoms", 3, 120);
  log::warning("skipping {}", "energies");

  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0].first, LogLevel::Debug);
  EXPECT_EQ(received[0].second, "frame 3 of 120 atoms");
  EXPECT_EQ(received[1].first, LogLevel::Warning);
  EXPECT_EQ(received[1].second, "skipping energies");
}

TEST_F(LogTest, WarningLevelDropsDebug) {
  set_log_level(LogLevel::Warning);
  EXPECT_EQ(log_level(), LogLevel::Warning);
  log::debug("not shown");
  log::warning("shown");

  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].first, LogLevel::Warning);
  EXPECT_EQ(received[0].second, "shown");
}

TEST_F(LogTest, OffDropsWarnings) {
  set_log_level(LogLevel::Off);
  EXPECT_EQ(log_level(), LogLevel::Off);
  log::debug("not shown");
  log::warning("not shown either");
  EXPECT_TRUE(received.empty());
}

TEST_F(LogTest, BracesInArgumentsAreKept) {
  set_log_level(LogLevel::Warning);
  log::warning("file '{}'", "run_{1}.xtc");

  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].second, "file 'run_{1}.xtc'");
}

TEST_F(LogTest, EmptyCallbackRestoresDefaultSink) {
  set_log_level(LogLevel::Warning);
  set_log_callback(nullptr);
  testing::internal::CaptureStderr();
  log::warning("to stderr");
  std::string output = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(received.empty());
  EXPECT_NE(output.find("to stderr"), std::string::npos);
  EXPECT_NE(output.find("xdrtraj"), std::string::npos);
}
