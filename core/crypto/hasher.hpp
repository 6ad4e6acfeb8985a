/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace base58check::crypto {
  class Hasher {
   protected:
    using Hash256 = common::Hash256;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256(common::BufferView data) const = 0;

    /**
     * @brief sha2_256d function calculates sha2-256 of sha2-256 of the data,
     * the digest Base58Check checksums are cut from
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256d(common::BufferView data) const = 0;
  };
}  // namespace base58check::crypto
