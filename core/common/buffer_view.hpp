/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ostream>
#include <span>

#include "common/hexutil.hpp"

namespace xrpcodec::common {

  /**
   * Non-owning view of bytes. Compared by content, not by address.
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView() = default;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    void dropFirst(size_t count) {
      *this = subspan(count);
    }

    void dropLast(size_t count) {
      *this = first(size() - count);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    bool operator==(const BufferView &other) const {
      return std::ranges::equal(*this, other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

  template <typename Super, typename Prefix>
  bool startsWith(const Super &super, const Prefix &prefix) {
    return std::size(super) >= std::size(prefix)
       and std::equal(std::begin(prefix), std::end(prefix), std::begin(super));
  }

}  // namespace xrpcodec::common
