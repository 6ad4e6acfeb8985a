/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// BASED ON BITCOIN IMPLEMENTATION WITH THE FOLLOWING COPYRIGHT:
//
// Copyright (c) 2014-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/base58_codec.hpp"

#include <algorithm>
#include <vector>

OUTCOME_CPP_DEFINE_CATEGORY(base58check::codec, Base58Error, e) {
  using E = base58check::codec::Base58Error;
  switch (e) {
    case E::INVALID_SYMBOL:
      return "Invalid symbol in a Base58 string";
  }
  return "Unknown error in base58 decoder";
}

namespace base58check::codec {

  namespace {
    /**
     * Base-58 digits of a big-endian number, most significant first.
     * Zero has no digits at all.
     */
    std::vector<uint8_t> toBase58Digits(common::BufferView input) {
      // Allocate enough space in big-endian base58 representation.
      size_t size =
          input.size() * 138 / 100 + 1;  // log(256) / log(58), rounded up.
      std::vector<uint8_t> b58(size);
      size_t length = 0;

      for (auto byte : input) {
        unsigned carry = byte;
        size_t i = 0;
        // Apply "b58 = b58 * 256 + ch".
        for (auto it = b58.rbegin();
             (carry != 0 || i < length) && (it != b58.rend());
             ++it, ++i) {
          carry += 256 * (*it);
          *it = carry % kBase58Radix;
          carry /= kBase58Radix;
        }
        BOOST_ASSERT(carry == 0);
        length = i;
      }

      // Skip leading zeroes in base58 result.
      auto it = std::find_if(b58.end() - static_cast<ptrdiff_t>(length),
                             b58.end(),
                             [](auto digit) { return digit != 0; });
      return {it, b58.end()};
    }

    size_t countLeading(common::BufferView bytes, uint8_t value) {
      auto it = std::find_if(bytes.begin(), bytes.end(), [value](auto b) {
        return b != value;
      });
      return static_cast<size_t>(it - bytes.begin());
    }
  }  // namespace

  std::string encodeBase58(common::BufferView bytes,
                           const Alphabet &alphabet) {
    auto zeroes = countLeading(bytes, 0);
    bytes.dropFirst(zeroes);

    auto digits = toBase58Digits(bytes);

    std::string str;
    str.reserve(zeroes + digits.size());
    str.assign(zeroes, alphabet.zero());
    for (auto digit : digits) {
      str += alphabet.symbol(digit);
    }
    return str;
  }

  outcome::result<std::string> encodeBase58(common::BufferView bytes,
                                            std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return encodeBase58(bytes, alphabet);
  }

  std::string encodeBase58Integer(common::BufferView value,
                                  const Alphabet &alphabet) {
    auto digits = toBase58Digits(value);
    if (digits.empty()) {
      return std::string(1, alphabet.zero());
    }

    std::string str;
    str.reserve(digits.size());
    for (auto digit : digits) {
      str += alphabet.symbol(digit);
    }
    return str;
  }

  outcome::result<std::string> encodeBase58Integer(common::BufferView value,
                                                   std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return encodeBase58Integer(value, alphabet);
  }

  outcome::result<common::Buffer> decodeBase58(common::BufferView encoded,
                                               const Alphabet &alphabet) {
    // Skip and count leading zero symbols.
    auto zeroes = countLeading(encoded, static_cast<uint8_t>(alphabet.zero()));
    encoded.dropFirst(zeroes);

    // Allocate enough space in big-endian base256 representation.
    size_t size =
        encoded.size() * 733 / 1000 + 1;  // log(58) / log(256), rounded up.
    std::vector<uint8_t> b256(size);
    size_t length = 0;

    for (auto symbol : encoded) {
      auto digit = alphabet.digit(symbol);
      if (digit < 0) {
        return Base58Error::INVALID_SYMBOL;
      }
      auto carry = static_cast<unsigned>(digit);
      size_t i = 0;
      // Apply "b256 = b256 * 58 + digit".
      for (auto it = b256.rbegin();
           (carry != 0 || i < length) && (it != b256.rend());
           ++it, ++i) {
        carry += kBase58Radix * (*it);
        *it = carry % 256;
        carry /= 256;
      }
      BOOST_ASSERT(carry == 0);
      length = i;
    }

    // Skip leading zeroes in b256.
    auto it = std::find_if(b256.end() - static_cast<ptrdiff_t>(length),
                           b256.end(),
                           [](auto byte) { return byte != 0; });

    common::Buffer res;
    res.reserve(zeroes + static_cast<size_t>(b256.end() - it));
    res.insert(res.end(), zeroes, 0);
    res.insert(res.end(), it, b256.end());
    return res;
  }

  outcome::result<common::Buffer> decodeBase58(std::string_view encoded,
                                               const Alphabet &alphabet) {
    return decodeBase58(common::BufferView::fromStringView(encoded), alphabet);
  }

  outcome::result<common::Buffer> decodeBase58(common::BufferView encoded,
                                               std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58(encoded, alphabet);
  }

  outcome::result<common::Buffer> decodeBase58(std::string_view encoded,
                                               std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58(encoded, alphabet);
  }

}  // namespace base58check::codec
