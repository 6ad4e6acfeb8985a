/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

#include <gmock/gmock.h>

namespace base58check::crypto {
  class HasherMock : public Hasher {
   public:
    ~HasherMock() override = default;

    MOCK_METHOD(Hash256, sha2_256, (common::BufferView), (const, override));

    MOCK_METHOD(Hash256, sha2_256d, (common::BufferView), (const, override));
  };
}  // namespace base58check::crypto
