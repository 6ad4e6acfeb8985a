/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace base58check::crypto {
  common::Hash256 sha256(common::BufferView input) {
    common::Hash256 out;
    SHA256(input.data(), input.size(), out.data());
    return out;
  }

  common::Hash256 sha256d(common::BufferView input) {
    auto first = sha256(input);
    return sha256(common::BufferView(first));
  }
}  // namespace base58check::crypto
