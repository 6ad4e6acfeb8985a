/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace base58check::crypto {
  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(common::BufferView input);

  /**
   * Take a double SHA-256 hash, i.e. SHA-256(SHA-256(input))
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256d(common::BufferView input);
}  // namespace base58check::crypto
