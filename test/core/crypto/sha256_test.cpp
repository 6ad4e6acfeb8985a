/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "testutil/literals.hpp"

using base58check::common::Buffer;
using base58check::common::Hash256;
using base58check::crypto::HasherImpl;
using base58check::crypto::sha256;
using base58check::crypto::sha256d;

/**
 * @given some well-known source
 * @when hashing it with sha256
 * @then resulting hash is as expected
 */
TEST(Sha256, Valid) {
  auto expected = Hash256::fromHex(
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff6"
                      "1f20015ad")
                      .value();
  ASSERT_EQ(sha256(Buffer::fromString("abc")), expected);
}

/**
 * @given empty source
 * @when hashing it once and twice
 * @then resulting hashes are as expected
 */
TEST(Sha256, Empty) {
  ASSERT_EQ(sha256(Buffer{}).toHex(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  ASSERT_EQ(sha256d(Buffer{}).toHex(),
            "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

/**
 * @given hasher
 * @when some data is hashed with it
 * @then the same hashes as of free functions are returned
 */
TEST(Sha256, Hasher) {
  HasherImpl hasher;
  auto data = "0005ff"_hex2buf;
  ASSERT_EQ(hasher.sha2_256(data), sha256(data));
  ASSERT_EQ(hasher.sha2_256d(data), sha256d(data));
  ASSERT_EQ(hasher.sha2_256d(data), sha256(sha256(data)));
}
