/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "log/configurator.hpp"

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using base58check::log::Configurator;
using base58check::log::Error;
using base58check::log::Level;
using base58check::log::str2lvl;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names and their short forms
 * @when they are parsed
 * @then corresponding levels are returned
 */
TEST_F(LoggerTest, LevelNames) {
  std::pair<std::string_view, Level> names[]{
      {"trace", Level::TRACE},
      {"debug", Level::DEBUG},
      {"verbose", Level::VERBOSE},
      {"info", Level::INFO},
      {"inf", Level::INFO},
      {"warning", Level::WARN},
      {"warn", Level::WARN},
      {"error", Level::ERROR},
      {"err", Level::ERROR},
      {"critical", Level::CRITICAL},
      {"crit", Level::CRITICAL},
      {"off", Level::OFF},
      {"no", Level::OFF},
  };
  for (auto &[name, level] : names) {
    EXPECT_OUTCOME_TRUE(parsed, str2lvl(name));
    EXPECT_EQ(parsed, level) << name;
  }
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given configured logging system
 * @when levels of groups are tuned by command line chunks
 * @then loggers of the groups get these levels, wrong chunks are skipped
 */
TEST_F(LoggerTest, TuneGroups) {
  auto logger = base58check::log::createLogger("Test", "application");

  base58check::log::tuneLoggingSystem(
      {"application=trace", "nogroup=info", "x"});
  EXPECT_EQ(logger->level(), Level::TRACE);

  base58check::log::tuneLoggingSystem({"application=error"});
  EXPECT_EQ(logger->level(), Level::ERROR);

  EXPECT_TRUE(base58check::log::resetLevelOfGroup("application"));
  EXPECT_EQ(logger->level(), Level::INFO);
}

/**
 * @given command lines with and without logging config path
 * @when the path is looked up before the rest of arguments are parsed
 * @then path is found at any position, missing value gives no path
 */
TEST_F(LoggerTest, LogConfigFile) {
  {
    char const *args[] = {
        "base58check", "--logcfg", "log.yaml", "decode", "2g"};
    auto path = Configurator::getLogConfigFile(std::size(args), args);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), std::filesystem::path("log.yaml"));
  }
  {
    char const *args[] = {"base58check", "decode", "-ldebug", "2g"};
    EXPECT_FALSE(
        Configurator::getLogConfigFile(std::size(args), args).has_value());
  }
  {
    char const *args[] = {"base58check", "decode", "2g", "--logcfg"};
    std::optional<std::filesystem::path> path;
    EXPECT_NO_THROW(
        path = Configurator::getLogConfigFile(std::size(args), args));
    EXPECT_FALSE(path.has_value());
  }
}
