/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "codec/alphabet.hpp"
#include "testutil/outcome.hpp"

using base58check::codec::Alphabet;
using base58check::codec::ConfigError;
using base58check::codec::kBitcoinAlphabet;
using base58check::codec::kRippleAlphabet;

/**
 * @given predefined alphabets
 * @when their symbols are requested
 * @then symbols are the well-known charsets, zero symbol is the first one
 */
TEST(AlphabetTest, Predefined) {
  EXPECT_EQ(Alphabet::bitcoin().symbols(), kBitcoinAlphabet);
  EXPECT_EQ(Alphabet::bitcoin().zero(), '1');
  EXPECT_EQ(Alphabet::ripple().symbols(), kRippleAlphabet);
  EXPECT_EQ(Alphabet::ripple().zero(), 'r');
  EXPECT_NE(Alphabet::bitcoin(), Alphabet::ripple());
}

/**
 * @given bitcoin alphabet
 * @when symbols are looked up
 * @then every alphabet symbol maps back to its digit, excluded look-alike
 * characters are absent
 */
TEST(AlphabetTest, DigitLookup) {
  const auto &alphabet = Alphabet::bitcoin();
  for (size_t digit = 0; digit < kBitcoinAlphabet.size(); ++digit) {
    EXPECT_EQ(alphabet.symbol(digit), kBitcoinAlphabet[digit]);
    EXPECT_EQ(alphabet.digit(kBitcoinAlphabet[digit]),
              static_cast<int>(digit));
  }
  for (uint8_t absent : {'0', 'I', 'O', 'l', '+', ' ', '\0', '\xff'}) {
    EXPECT_EQ(alphabet.digit(absent), -1) << "symbol " << int(absent);
  }
}

/**
 * @given a custom charset of 58 distinct symbols
 * @when alphabet is created from it as text and as bytes
 * @then both alphabets are equal to the predefined one
 */
TEST(AlphabetTest, CreateCustom) {
  EXPECT_OUTCOME_TRUE(from_text, Alphabet::create(kRippleAlphabet));
  EXPECT_EQ(from_text, Alphabet::ripple());

  auto bytes =
      base58check::common::BufferView::fromStringView(kRippleAlphabet);
  EXPECT_OUTCOME_TRUE(from_bytes, Alphabet::create(bytes));
  EXPECT_EQ(from_bytes, Alphabet::ripple());
}

/**
 * @given charsets shorter and longer than 58 symbols
 * @when alphabet is created
 * @then INVALID_LENGTH is returned
 */
TEST(AlphabetTest, WrongLength) {
  EXPECT_EC(Alphabet::create(""), ConfigError::INVALID_LENGTH);
  EXPECT_EC(Alphabet::create(kBitcoinAlphabet.substr(1)),
            ConfigError::INVALID_LENGTH);
  EXPECT_EC(Alphabet::create(std::string(kBitcoinAlphabet) + "0"),
            ConfigError::INVALID_LENGTH);
}

/**
 * @given 58-symbol charset with a repeated symbol
 * @when alphabet is created
 * @then DUPLICATE_SYMBOL is returned
 */
TEST(AlphabetTest, DuplicateSymbol) {
  std::string charset(kBitcoinAlphabet);
  charset.back() = charset.front();
  EXPECT_EC(Alphabet::create(charset), ConfigError::DUPLICATE_SYMBOL);
}
