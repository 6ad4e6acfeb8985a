/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace base58check::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(common::BufferView data) const override;

    Hash256 sha2_256d(common::BufferView data) const override;
  };

}  // namespace base58check::crypto
