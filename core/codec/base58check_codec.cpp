/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/base58check_codec.hpp"

#include <openssl/crypto.h>

#include "codec/base58_codec.hpp"
#include "crypto/hasher.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(base58check::codec, AddressError, e) {
  using E = base58check::codec::AddressError;
  switch (e) {
    case E::INVALID_ADDRESS:
      return "Invalid Base58Check address: checksum mismatch or no version";
  }
  return "Unknown Base58Check codec error";
}

namespace base58check::codec {

  namespace {
    common::Buffer calculateChecksum(common::BufferView payload,
                                     const crypto::Hasher &hasher) {
      auto digest = hasher.sha2_256d(payload);
      return {common::BufferView(digest).first(kBase58CheckChecksumLength)};
    }

    bool checksumMatches(common::BufferView raw,
                         const crypto::Hasher &hasher) {
      if (raw.size() < kBase58CheckChecksumLength) {
        return false;
      }
      auto body = raw.first(raw.size() - kBase58CheckChecksumLength);
      auto claimed = raw.last(kBase58CheckChecksumLength);
      auto expected = calculateChecksum(body, hasher);
      return CRYPTO_memcmp(
                 claimed.data(), expected.data(), kBase58CheckChecksumLength)
          == 0;
    }

    // decoded address with the checksum verified
    outcome::result<common::Buffer> decodeVerified(
        common::BufferView address,
        const crypto::Hasher &hasher,
        const Alphabet &alphabet) {
      OUTCOME_TRY(raw, decodeBase58(address, alphabet));
      if (not checksumMatches(raw, hasher)) {
        return AddressError::INVALID_ADDRESS;
      }
      return raw;
    }
  }  // namespace

  outcome::result<std::string> encodeBase58Check(common::BufferView content,
                                                 int version,
                                                 const crypto::Hasher &hasher,
                                                 const Alphabet &alphabet) {
    if (version < 0 or version > kMaxAddressVersion) {
      return ConfigError::VERSION_OUT_OF_RANGE;
    }

    common::Buffer bytes;
    bytes.reserve(1 + content.size() + kBase58CheckChecksumLength);
    bytes.putUint8(static_cast<uint8_t>(version)).put(content);
    auto checksum = calculateChecksum(bytes, hasher);
    bytes.put(checksum);
    return encodeBase58(bytes, alphabet);
  }

  outcome::result<std::string> encodeBase58Check(common::BufferView content,
                                                 int version,
                                                 const crypto::Hasher &hasher,
                                                 std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return encodeBase58Check(content, version, hasher, alphabet);
  }

  outcome::result<bool> isValidBase58Check(common::BufferView address,
                                           const crypto::Hasher &hasher,
                                           const Alphabet &alphabet) {
    OUTCOME_TRY(raw, decodeBase58(address, alphabet));
    return checksumMatches(raw, hasher);
  }

  outcome::result<bool> isValidBase58Check(std::string_view address,
                                           const crypto::Hasher &hasher,
                                           const Alphabet &alphabet) {
    return isValidBase58Check(
        common::BufferView::fromStringView(address), hasher, alphabet);
  }

  outcome::result<bool> isValidBase58Check(std::string_view address,
                                           const crypto::Hasher &hasher,
                                           std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return isValidBase58Check(address, hasher, alphabet);
  }

  outcome::result<bool> isValidBase58Check(common::BufferView address,
                                           const crypto::Hasher &hasher,
                                           std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return isValidBase58Check(address, hasher, alphabet);
  }

  outcome::result<common::Buffer> decodeBase58Check(
      common::BufferView address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet) {
    OUTCOME_TRY(raw, decodeVerified(address, hasher, alphabet));
    // a bare checksum has neither version nor content
    if (raw.size() == kBase58CheckChecksumLength) {
      return common::Buffer{};
    }
    return raw.subbuffer(1, raw.size() - 1 - kBase58CheckChecksumLength);
  }

  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet) {
    return decodeBase58Check(
        common::BufferView::fromStringView(address), hasher, alphabet);
  }

  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view address,
      const crypto::Hasher &hasher,
      std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58Check(address, hasher, alphabet);
  }

  outcome::result<common::Buffer> decodeBase58Check(
      common::BufferView address,
      const crypto::Hasher &hasher,
      std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58Check(address, hasher, alphabet);
  }

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      common::BufferView address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet) {
    OUTCOME_TRY(raw, decodeVerified(address, hasher, alphabet));
    if (raw.size() < 1 + kBase58CheckChecksumLength) {
      return AddressError::INVALID_ADDRESS;
    }
    return DecodedAddress{
        .version = raw[0],
        .content =
            raw.subbuffer(1, raw.size() - 1 - kBase58CheckChecksumLength),
    };
  }

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      std::string_view address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet) {
    return decodeBase58CheckVersioned(
        common::BufferView::fromStringView(address), hasher, alphabet);
  }

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      std::string_view address,
      const crypto::Hasher &hasher,
      std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58CheckVersioned(address, hasher, alphabet);
  }

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      common::BufferView address,
      const crypto::Hasher &hasher,
      std::string_view charset) {
    OUTCOME_TRY(alphabet, Alphabet::create(charset));
    return decodeBase58CheckVersioned(address, hasher, alphabet);
  }

}  // namespace base58check::codec
