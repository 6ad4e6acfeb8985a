/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

namespace base58check::application {

  // clang-format off
  /**
   * Reads app configuration from the command line:
   *
   *   base58check <command> [options] <input>
   *
   * Options missing from the command line keep their default values.
   */
  // clang-format on
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = default;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = default;

    /**
     * @return false if the application must not run: help was requested or
     * arguments are wrong
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    /// @return true if usage was printed instead of reading the arguments
    bool helpRequested() const {
      return help_requested_;
    }

    Command command() const override {
      return command_;
    }
    const std::string &input() const override {
      return input_;
    }
    InputFormat inputFormat() const override {
      return input_format_;
    }
    const std::string &alphabet() const override {
      return alphabet_;
    }
    int addressVersion() const override {
      return address_version_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    log::Logger logger_;

    Command command_ = Command::Encode;
    std::string input_;
    InputFormat input_format_ = InputFormat::Hex;
    std::string alphabet_;
    int address_version_;
    std::vector<std::string> logger_tuning_config_;
    bool help_requested_ = false;
  };

}  // namespace base58check::application
