/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace base58check::common {

  class BufferView;

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace base58check::common

OUTCOME_HPP_DECLARE_ERROR(base58check::common, UnhexError);

namespace base58check::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes bytes
   * @return hexstring in lower case
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace base58check::common
