/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/alphabet.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(base58check::codec, ConfigError, e) {
  using E = base58check::codec::ConfigError;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Base58 alphabet must consist of exactly 58 symbols";
    case E::DUPLICATE_SYMBOL:
      return "Base58 alphabet contains a repeated symbol";
    case E::VERSION_OUT_OF_RANGE:
      return "Base58Check address version must be in range [0, 255]";
  }
  return "Unknown base58 configuration error";
}

namespace base58check::codec {

  outcome::result<Alphabet> Alphabet::create(std::string_view symbols) {
    return create(common::BufferView::fromStringView(symbols));
  }

  outcome::result<Alphabet> Alphabet::create(common::BufferView symbols) {
    if (symbols.size() != kBase58Radix) {
      return ConfigError::INVALID_LENGTH;
    }

    Alphabet alphabet;
    alphabet.digits_.fill(-1);
    for (size_t digit = 0; digit < kBase58Radix; ++digit) {
      auto symbol = symbols[digit];
      if (alphabet.digits_[symbol] != -1) {
        return ConfigError::DUPLICATE_SYMBOL;
      }
      alphabet.digits_[symbol] = static_cast<int8_t>(digit);
      alphabet.symbols_[digit] = static_cast<char>(symbol);
    }
    return alphabet;
  }

  const Alphabet &Alphabet::bitcoin() {
    static const Alphabet alphabet = create(kBitcoinAlphabet).value();
    return alphabet;
  }

  const Alphabet &Alphabet::ripple() {
    static const Alphabet alphabet = create(kRippleAlphabet).value();
    return alphabet;
  }

}  // namespace base58check::codec
