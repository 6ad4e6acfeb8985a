/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "codec/alphabet.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace base58check::crypto {
  class Hasher;
}

namespace base58check::codec {

  enum class AddressError { INVALID_ADDRESS = 1 };

  constexpr size_t kBase58CheckChecksumLength = 4;
  constexpr int kMaxAddressVersion = 255;

  /// Version byte and content of a verified address
  struct DecodedAddress {
    uint8_t version = 0;
    common::Buffer content;

    bool operator==(const DecodedAddress &other) const = default;
  };

  /**
   * Encode an address: base58(<version><content><checksum>), where checksum
   * is the first 4 bytes of sha256(sha256(<version><content>)).
   * @param version address version, must fit into a single byte
   * @return address or ConfigError::VERSION_OUT_OF_RANGE
   */
  outcome::result<std::string> encodeBase58Check(
      common::BufferView content,
      int version,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<std::string> encodeBase58Check(common::BufferView content,
                                                 int version,
                                                 const crypto::Hasher &hasher,
                                                 std::string_view charset);

  /**
   * Check that the trailing 4 bytes of the decoded address are the checksum
   * of the bytes before them. Addresses decoded to less than 4 bytes are not
   * valid.
   * @return true if checksum matches, an error if the address is not a
   * Base58 string at all
   */
  outcome::result<bool> isValidBase58Check(
      std::string_view address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<bool> isValidBase58Check(
      common::BufferView address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<bool> isValidBase58Check(std::string_view address,
                                           const crypto::Hasher &hasher,
                                           std::string_view charset);

  outcome::result<bool> isValidBase58Check(common::BufferView address,
                                           const crypto::Hasher &hasher,
                                           std::string_view charset);

  /**
   * Return the content part of the provided address. The checksum is
   * verified in the process, version byte is dropped. Address holding the
   * checksum only gives empty content.
   */
  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<common::Buffer> decodeBase58Check(
      common::BufferView address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view address,
      const crypto::Hasher &hasher,
      std::string_view charset);

  outcome::result<common::Buffer> decodeBase58Check(
      common::BufferView address,
      const crypto::Hasher &hasher,
      std::string_view charset);

  /**
   * Same as decodeBase58Check, but keeps the version byte. Address holding
   * the checksum only is INVALID_ADDRESS, there is no version to return.
   */
  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      std::string_view address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      common::BufferView address,
      const crypto::Hasher &hasher,
      const Alphabet &alphabet = Alphabet::bitcoin());

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      std::string_view address,
      const crypto::Hasher &hasher,
      std::string_view charset);

  outcome::result<DecodedAddress> decodeBase58CheckVersioned(
      common::BufferView address,
      const crypto::Hasher &hasher,
      std::string_view charset);

}  // namespace base58check::codec

OUTCOME_HPP_DECLARE_ERROR(base58check::codec, AddressError);
