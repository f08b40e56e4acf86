/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using filetx::log::Error;
using filetx::log::Level;
using filetx::log::str2lvl;

TEST(Str2LvlTest, KnownNames) {
  ASSERT_OUTCOME_SUCCESS(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  ASSERT_OUTCOME_SUCCESS(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);

  auto bad = str2lvl("loud");
  ASSERT_TRUE(bad.has_error());
  EXPECT_EQ(bad.error(), Error::WRONG_LEVEL);
}

class TuneLoggingSystemTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    logsys = testutil::prepareLoggers();
  }

  void TearDown() override {
    std::ignore = logsys->resetLevelOfGroup("uow");
    std::ignore = logsys->resetLevelOfGroup("storage");
    testutil::prepareLoggers();
  }

  std::shared_ptr<filetx::log::LoggingSystem> logsys;
};

/**
 * @given bare level and per-group chunks
 * @when logging system is tuned
 * @then the levels of the named groups change
 */
TEST_F(TuneLoggingSystemTest, AppliesChunks) {
  ASSERT_OUTCOME_SUCCESS(
      logsys->tuneLoggingSystem({"debug", "uow=trace", "storage=error"}));

  auto &soralog = logsys->getSoralog();
  EXPECT_EQ(soralog->getGroup("filetx")->level(), Level::DEBUG);
  EXPECT_EQ(soralog->getGroup("uow")->level(), Level::TRACE);
  EXPECT_EQ(soralog->getGroup("storage")->level(), Level::ERROR);
}

/**
 * @given chunks naming unknown group and unknown level
 * @when logging system is tuned
 * @then the first problem is returned, and valid chunks are still applied
 */
TEST_F(TuneLoggingSystemTest, ReportsFirstProblem) {
  auto res = logsys->tuneLoggingSystem(
      {"nosuchgroup=info", "uow=loud", "storage=warn"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Error::WRONG_GROUP);
  EXPECT_EQ(logsys->getSoralog()->getGroup("storage")->level(), Level::WARN);

  auto bad_level = logsys->tuneLoggingSystem({"uow=loud"});
  ASSERT_TRUE(bad_level.has_error());
  EXPECT_EQ(bad_level.error(), Error::WRONG_LEVEL);
}
