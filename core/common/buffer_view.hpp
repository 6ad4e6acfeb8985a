/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>
#include <qtils/cxx20/lexicographical_compare_three_way.hpp>

#include "common/hexutil.hpp"

inline auto operator""_bytes(const char *s, std::size_t size) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s), size);
}

namespace base58check::common {

  /**
   * @brief Non-owning view over a contiguous sequence of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    template <typename T>
    decltype(auto) operator=(T &&t) {
      return span::operator=(std::forward<T>(t));
    }

    void dropFirst(size_t count) {
      *this = subspan(count);
    }

    void dropLast(size_t count) {
      *this = first(size() - count);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    /// Views characters of a string as bytes, no transcoding is made
    static BufferView fromStringView(std::string_view str) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
    }

    auto operator<=>(const BufferView &other) const {
      return qtils::cxx20::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    auto operator==(const BufferView &other) const {
      return (*this <=> other) == std::strong_ordering::equal;
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }
}  // namespace base58check::common

namespace base58check {
  using common::BufferView;
}  // namespace base58check

template <>
struct fmt::formatter<base58check::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const base58check::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    // short form keeps the first and the last two bytes
    if (presentation == 's' && view.size() > 5) {
      using base58check::common::BufferView;
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            BufferView(view.first(2)).toHex(),
                            BufferView(view.last(2)).toHex());
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
