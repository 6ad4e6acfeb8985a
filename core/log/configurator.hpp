/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace base58check::log {

  /**
   * Logging configuration from YAML. Without explicit config the embedded
   * one is used: console sink on stderr and the `base58check` group tree.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    /// Looks for `--logcfg <path>` among the command line arguments
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace base58check::log
