/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(base58check::common, BlobError, e) {
  using base58check::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace base58check::common {

  template class Blob<32ul>;

}  // namespace base58check::common
