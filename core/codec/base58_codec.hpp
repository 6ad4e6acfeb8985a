/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "codec/alphabet.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace base58check::codec {

  enum class Base58Error { INVALID_SYMBOL = 1 };

  /**
   * Encode bytes as Base58. Every leading zero byte becomes one zero symbol,
   * the rest is written as a big-endian base-58 number. Nothing but the zero
   * symbols is emitted when no non-zero byte follows them, so an empty input
   * gives an empty string.
   */
  std::string encodeBase58(common::BufferView bytes,
                           const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<std::string> encodeBase58(common::BufferView bytes,
                                            std::string_view charset);

  /**
   * Encode a big-endian unsigned integer as Base58. Leading zero bytes of
   * {@param value} are not significant; zero value gives exactly one zero
   * symbol.
   */
  std::string encodeBase58Integer(
      common::BufferView value, const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<std::string> encodeBase58Integer(common::BufferView value,
                                                   std::string_view charset);

  /**
   * Decode Base58 symbols to bytes. Every leading zero symbol becomes one
   * zero byte.
   * @return decoded bytes or Base58Error::INVALID_SYMBOL if some symbol is not
   * in the alphabet
   */
  outcome::result<common::Buffer> decodeBase58(
      common::BufferView encoded,
      const Alphabet &alphabet = Alphabet::bitcoin());

  /// Text input is taken byte per character, same as the bytes overload
  outcome::result<common::Buffer> decodeBase58(
      std::string_view encoded, const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<common::Buffer> decodeBase58(common::BufferView encoded,
                                               std::string_view charset);

  outcome::result<common::Buffer> decodeBase58(std::string_view encoded,
                                               std::string_view charset);

}  // namespace base58check::codec

OUTCOME_HPP_DECLARE_ERROR(base58check::codec, Base58Error);
