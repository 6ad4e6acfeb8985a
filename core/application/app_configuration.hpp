/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace base58check::application {

  enum class Command {
    Encode,
    EncodeInteger,
    Decode,
    CheckEncode,
    CheckDecode,
    CheckValid,
  };

  /// @return command for its command line name, nullopt if there is none
  std::optional<Command> commandFromString(std::string_view name);

  std::string_view commandName(Command command);

  enum class InputFormat { Hex, Text };

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    virtual Command command() const = 0;

    /**
     * @return input exactly as given in the command line: hex or text bytes
     * for encoders, an encoded string for decoders
     */
    virtual const std::string &input() const = 0;

    /**
     * @return how input of the encoders is given
     */
    virtual InputFormat inputFormat() const = 0;

    /**
     * @return symbols of the alphabet, not validated yet
     */
    virtual const std::string &alphabet() const = 0;

    /**
     * @return version byte of encoded addresses
     */
    virtual int addressVersion() const = 0;

    /**
     * @return log configuration, each entry is a level or `<group>=<level>`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace base58check::application
