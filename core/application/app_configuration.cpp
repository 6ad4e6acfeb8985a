/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/app_configuration.hpp"

#include <array>
#include <utility>

namespace base58check::application {

  namespace {
    constexpr std::array<std::pair<Command, std::string_view>, 6> kCommands{{
        {Command::Encode, "encode"},
        {Command::EncodeInteger, "encode-int"},
        {Command::Decode, "decode"},
        {Command::CheckEncode, "check-encode"},
        {Command::CheckDecode, "check-decode"},
        {Command::CheckValid, "check-valid"},
    }};
  }  // namespace

  std::optional<Command> commandFromString(std::string_view name) {
    for (auto &[command, command_name] : kCommands) {
      if (command_name == name) {
        return command;
      }
    }
    return std::nullopt;
  }

  std::string_view commandName(Command command) {
    for (auto &[known, command_name] : kCommands) {
      if (known == command) {
        return command_name;
      }
    }
    return "unknown";
  }

}  // namespace base58check::application
