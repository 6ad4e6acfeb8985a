/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "common/hexutil.hpp"

using namespace base58check::common::literals;

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return base58check::common::unhex(std::string_view(c, s)).value();
}
