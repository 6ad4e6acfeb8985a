/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/base58check_application.hpp"

#include <memory>
#include <ostream>

#include "application/app_configuration.hpp"
#include "common/buffer.hpp"
#include "log/logger.hpp"

namespace base58check::crypto {
  class Hasher;
}

namespace base58check::application {

  class Base58CheckApplicationImpl final : public Base58CheckApplication {
   public:
    /// What a command prints and whether it counts as success
    struct CommandOutput {
      std::string text;
      bool success = true;
    };

    Base58CheckApplicationImpl(std::shared_ptr<AppConfiguration> app_config,
                               std::shared_ptr<crypto::Hasher> hasher,
                               std::ostream &out);

    int run() override;

    outcome::result<CommandOutput> execute() const;

   private:
    outcome::result<common::Buffer> readInput() const;

    std::shared_ptr<AppConfiguration> app_config_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::ostream &out_;
    log::Logger logger_;
  };

}  // namespace base58check::application
