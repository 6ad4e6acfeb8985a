/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/base58check_application_impl.hpp"

#include <cstdlib>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include "codec/base58_codec.hpp"
#include "codec/base58check_codec.hpp"
#include "crypto/hasher.hpp"

namespace base58check::application {

  Base58CheckApplicationImpl::Base58CheckApplicationImpl(
      std::shared_ptr<AppConfiguration> app_config,
      std::shared_ptr<crypto::Hasher> hasher,
      std::ostream &out)
      : app_config_{std::move(app_config)},
        hasher_{std::move(hasher)},
        out_{out},
        logger_{log::createLogger("Base58Check", "application")} {
    BOOST_ASSERT(app_config_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  int Base58CheckApplicationImpl::run() {
    auto command = commandName(app_config_->command());
    SL_DEBUG(logger_,
             "Running {} with alphabet {}",
             command,
             app_config_->alphabet());

    auto res = execute();
    if (res.has_error()) {
      SL_ERROR(
          logger_, "Command {} failed: {}", command, res.error().message());
      return EXIT_FAILURE;
    }

    auto &output = res.value();
    out_ << output.text << std::endl;
    return output.success ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  outcome::result<Base58CheckApplicationImpl::CommandOutput>
  Base58CheckApplicationImpl::execute() const {
    const auto &charset = app_config_->alphabet();
    const auto &input = app_config_->input();

    switch (app_config_->command()) {
      case Command::Encode: {
        OUTCOME_TRY(bytes, readInput());
        OUTCOME_TRY(encoded, codec::encodeBase58(bytes, charset));
        return CommandOutput{.text = std::move(encoded)};
      }

      case Command::EncodeInteger: {
        OUTCOME_TRY(bytes, readInput());
        OUTCOME_TRY(encoded, codec::encodeBase58Integer(bytes, charset));
        return CommandOutput{.text = std::move(encoded)};
      }

      case Command::Decode: {
        OUTCOME_TRY(decoded, codec::decodeBase58(input, charset));
        SL_DEBUG(logger_,
                 "Decoded {} bytes: {:s}",
                 decoded.size(),
                 decoded.view());
        return CommandOutput{.text = decoded.toHex()};
      }

      case Command::CheckEncode: {
        OUTCOME_TRY(bytes, readInput());
        OUTCOME_TRY(address,
                    codec::encodeBase58Check(bytes,
                                             app_config_->addressVersion(),
                                             *hasher_,
                                             charset));
        return CommandOutput{.text = std::move(address)};
      }

      case Command::CheckDecode: {
        OUTCOME_TRY(alphabet, codec::Alphabet::create(charset));
        OUTCOME_TRY(
            decoded,
            codec::decodeBase58CheckVersioned(input, *hasher_, alphabet));
        SL_INFO(logger_, "Address version: {}", decoded.version);
        return CommandOutput{.text = decoded.content.toHex()};
      }

      case Command::CheckValid: {
        OUTCOME_TRY(valid, codec::isValidBase58Check(input, *hasher_, charset));
        return CommandOutput{.text = valid ? "valid" : "invalid",
                             .success = valid};
      }
    }
    BOOST_UNREACHABLE_RETURN(CommandOutput{});
  }

  outcome::result<common::Buffer> Base58CheckApplicationImpl::readInput()
      const {
    const auto &input = app_config_->input();
    if (app_config_->inputFormat() == InputFormat::Text) {
      return common::Buffer::fromString(input);
    }
    if (input.starts_with("0x")) {
      OUTCOME_TRY(bytes, common::unhexWith0x(input));
      return common::Buffer{std::move(bytes)};
    }
    return common::Buffer::fromHex(input);
  }

}  // namespace base58check::application
