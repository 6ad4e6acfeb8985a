/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>

#include <boost/assert.hpp>

#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"

namespace base58check::codec {

  enum class ConfigError {
    INVALID_LENGTH = 1,
    DUPLICATE_SYMBOL,
    VERSION_OUT_OF_RANGE
  };

  constexpr size_t kBase58Radix = 58;

  /** All alphanumeric characters except for "0", "I", "O", and "l" */
  constexpr std::string_view kBitcoinAlphabet =
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  constexpr std::string_view kRippleAlphabet =
      "rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz";

  /**
   * Validated table of 58 distinct symbols. Symbol at index 0 stands for the
   * zero digit and for every leading zero byte.
   */
  class Alphabet {
   public:
    static outcome::result<Alphabet> create(std::string_view symbols);

    static outcome::result<Alphabet> create(common::BufferView symbols);

    /// Alphabet used by Bitcoin addresses, the default everywhere
    static const Alphabet &bitcoin();

    static const Alphabet &ripple();

    char symbol(size_t digit) const {
      BOOST_ASSERT(digit < kBase58Radix);
      return symbols_[digit];
    }

    char zero() const {
      return symbols_[0];
    }

    /// @return digit the symbol stands for, -1 if it is not in the alphabet
    int digit(uint8_t symbol) const {
      return digits_[symbol];
    }

    std::string_view symbols() const {
      return {symbols_.data(), symbols_.size()};
    }

    bool operator==(const Alphabet &other) const {
      return symbols_ == other.symbols_;
    }

   private:
    Alphabet() = default;

    std::array<char, kBase58Radix> symbols_{};
    std::array<int8_t, 256> digits_{};
  };

}  // namespace base58check::codec

OUTCOME_HPP_DECLARE_ERROR(base58check::codec, ConfigError);
