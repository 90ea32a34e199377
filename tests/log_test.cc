#include <gtest/gtest.h>

#include <string>

#include "dupfind/log.hh"
#include "test_util.hh"

using namespace dupfind;

TEST(LogTest, EnabledLevelReachesSink) {
  test::log_capture_t log;
  oss(log_to(log_lvl_t::warn)) << "[warn] skip file: a.bin" << '\n';
  EXPECT_EQ(log.str(), "[warn] skip file: a.bin\n");
}

TEST(LogTest, LevelBelowThresholdDropped) {
  test::log_capture_t log;
  set_log_level(log_lvl_t::warn);
  oss(log_to(log_lvl_t::verbose)) << "[log] exclude: /proc" << '\n';
  oss(log_to(log_lvl_t::log)) << "[log] list files..." << '\n';
  oss(log_to(log_lvl_t::err)) << "[err] verify failed" << '\n';
  EXPECT_EQ(log.str(), "[err] verify failed\n");
}

TEST(LogTest, StatementInsideUnbracedIf) {
  test::log_capture_t log;
  set_log_level(log_lvl_t::log);
  const bool skipped = false;
  if (skipped)
    oss(log_to(log_lvl_t::warn)) << "[warn] skipped" << '\n';
  else
    oss(log_to(log_lvl_t::log)) << "[log] kept" << '\n';
  EXPECT_EQ(log.str(), "[log] kept\n");
}
