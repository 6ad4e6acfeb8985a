/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/base58check_application_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using base58check::application::AppConfigurationImpl;
using base58check::application::Base58CheckApplicationImpl;

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Available commands: encode encode-int decode check-encode "
                 "check-decode check-valid\n"
                 "Run with `--help' argument to print usage\n";
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        base58check::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<base58check::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<base58check::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  base58check::log::setLoggingSystem(logging_system);

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto configuration = std::make_shared<AppConfigurationImpl>(
      base58check::log::createLogger("AppConfiguration", "application"));
  if (not configuration->initializeFromArgs(argc, argv)) {
    return configuration->helpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  base58check::log::tuneLoggingSystem(configuration->log());

  auto app = std::make_shared<Base58CheckApplicationImpl>(
      configuration,
      std::make_shared<base58check::crypto::HasherImpl>(),
      std::cout);

  auto exit_code = app->run();

  auto logger = base58check::log::createLogger(
      "Main", base58check::log::defaultGroupName);
  SL_DEBUG(logger, "Finished with exit code {}", exit_code);
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
