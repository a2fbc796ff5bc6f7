/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

using xrpcodec::log::createLogger;
using xrpcodec::log::Level;
using xrpcodec::log::setLevelOfGroup;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given configured logging system
 * @when level of the group a logger belongs to is changed
 * @then the logger follows the group level
 */
TEST_F(LoggerTest, LoggerFollowsGroupLevel) {
  auto logger = createLogger("GroupLevelTest", "codec");

  ASSERT_TRUE(setLevelOfGroup("codec", Level::DEBUG));
  EXPECT_EQ(logger->level(), Level::DEBUG);

  ASSERT_TRUE(setLevelOfGroup("codec", Level::ERROR));
  EXPECT_EQ(logger->level(), Level::ERROR);
}

/**
 * @given configured logging system
 * @when level of the root group is changed
 * @then loggers of the child groups inherit it
 */
TEST_F(LoggerTest, ChildGroupInheritsLevel) {
  auto logger = createLogger("InheritTest", "crypto");

  ASSERT_TRUE(setLevelOfGroup(xrpcodec::log::kCodecGroupName, Level::TRACE));
  EXPECT_EQ(logger->level(), Level::TRACE);
}

/**
 * @given configured logging system
 * @when level of an unknown group is set
 * @then nothing is changed and false is returned
 */
TEST_F(LoggerTest, UnknownGroup) {
  EXPECT_FALSE(setLevelOfGroup("nonexistent", Level::TRACE));
}
