/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace base58check::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &reserve(size_t size) {
      Base::reserve(size);
      return *this;
    }

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      Base::push_back(n);
      return *this;
    }

    /**
     * @brief Put a string into byte buffer
     * @param view arbitrary string
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @param view arbitrary span of bytes
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    /**
     * Returns a copy of a part of the buffer
     * Works alike subspan() of std::span
     */
    Buffer subbuffer(size_t offset = 0, size_t length = -1) const {
      return Buffer(view(offset, length));
    }

    BufferView view(size_t offset = 0, size_t length = -1) const {
      return std::span(*this).subspan(offset, length);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(*this);
    }

    /**
     * @brief Construct Buffer from hex string
     * @param hex hex-encoded string
     * @return result containing constructed buffer if input string is
     * hex-encoded string.
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    /**
     * @brief return content of bytearray as a string view
     * @note Does not ensure correct encoding
     */
    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string_view(reinterpret_cast<const char *>(Base::data()),
                              Base::size());
    }

    /**
     * @brief stores content of a string to byte array
     */
    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    /// mind that it does not perform unhexing, there is ""_hex2buf for it
    inline Buffer operator""_buf(const char *c, size_t s) {
      std::vector<uint8_t> chars(c, c + s);
      return Buffer(std::move(chars));
    }

    inline Buffer operator""_hex2buf(const char *hex, size_t size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace base58check::common

namespace base58check {
  using common::Buffer;
}  // namespace base58check
