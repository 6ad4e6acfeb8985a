/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "application/impl/app_configuration_impl.hpp"
#include "codec/alphabet.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using base58check::application::AppConfigurationImpl;
using base58check::application::Command;
using base58check::application::commandFromString;
using base58check::application::commandName;
using base58check::application::InputFormat;
using base58check::codec::kBitcoinAlphabet;
using base58check::codec::kRippleAlphabet;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    app_config_ = std::make_shared<AppConfigurationImpl>(
        base58check::log::createLogger("AppConfigTest", "testing"));
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given command line names of all commands
 * @when they are looked up
 * @then every name maps to its command and back
 */
TEST_F(AppConfigurationTest, CommandNames) {
  for (auto command : {Command::Encode,
                       Command::EncodeInteger,
                       Command::Decode,
                       Command::CheckEncode,
                       Command::CheckDecode,
                       Command::CheckValid}) {
    EXPECT_EQ(commandFromString(commandName(command)), command);
  }
  EXPECT_EQ(commandFromString("encode-int"), Command::EncodeInteger);
  EXPECT_EQ(commandFromString("check-valid"), Command::CheckValid);
  EXPECT_EQ(commandFromString("verify"), std::nullopt);
}

/**
 * @given command and input only
 * @when configuration is initialized from them
 * @then other values are the defaults
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  char const *args[] = {"base58check", "encode", "00ff"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->command(), Command::Encode);
  EXPECT_EQ(app_config_->input(), "00ff");
  EXPECT_EQ(app_config_->inputFormat(), InputFormat::Hex);
  EXPECT_EQ(app_config_->alphabet(), kBitcoinAlphabet);
  EXPECT_EQ(app_config_->addressVersion(), 0);
  EXPECT_TRUE(app_config_->log().empty());
}

/**
 * @given every codec option in the command line
 * @when configuration is initialized
 * @then values are taken from the command line
 */
TEST_F(AppConfigurationTest, CodecOptionsTest) {
  char const *args[] = {"base58check",
                        "check-encode",
                        "--text",
                        "-v",
                        "111",
                        "--ripple",
                        "hello",
                        "-lcodec=debug",
                        "--log",
                        "trace"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->command(), Command::CheckEncode);
  EXPECT_EQ(app_config_->input(), "hello");
  EXPECT_EQ(app_config_->inputFormat(), InputFormat::Text);
  EXPECT_EQ(app_config_->alphabet(), kRippleAlphabet);
  EXPECT_EQ(app_config_->addressVersion(), 111);
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"codec=debug", "trace"}));
}

/**
 * @given custom alphabet in the command line
 * @when configuration is initialized
 * @then alphabet is stored as is, validation is left to the codec
 */
TEST_F(AppConfigurationTest, CustomAlphabetTest) {
  char const *args[] = {"base58check", "decode", "--alphabet", "abc", "cba"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->command(), Command::Decode);
  EXPECT_EQ(app_config_->alphabet(), "abc");
  EXPECT_EQ(app_config_->input(), "cba");
}

/**
 * @given wrong command lines
 * @when configuration is initialized
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, WrongArgumentsTest) {
  {
    char const *args[] = {"base58check", "verify", "00"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {"base58check", "encode"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {"base58check", "--text"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {
        "base58check", "decode", "--ripple", "--alphabet", "abc", "2g"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {"base58check", "decode", "--unknown", "2g"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {"base58check", "check-encode", "-v", "x", "00"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
}

/**
 * @given help option
 * @when configuration is initialized
 * @then the application must not run, help is reported as requested
 */
TEST_F(AppConfigurationTest, HelpTest) {
  char const *args[] = {"base58check", "decode", "--help"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  EXPECT_TRUE(app_config_->helpRequested());
}

/**
 * @given wrong arguments without help option
 * @when configuration is initialized
 * @then it fails without help reported as requested
 */
TEST_F(AppConfigurationTest, NoHelpOnError) {
  char const *args[] = {"base58check", "verify", "00"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  EXPECT_FALSE(app_config_->helpRequested());
}
