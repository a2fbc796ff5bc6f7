/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace xrpcodec::common {

  /**
   * Owning byte buffer of arbitrary size, used for raw decoded strings and
   * for framing prefix, payload and checksum before encoding
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;
    using Base::Base;

    Buffer() = default;
    Buffer(Base &&bytes) : Base(std::move(bytes)) {}
    Buffer(const BufferView &view) : Base(view.begin(), view.end()) {}

    /// appends bytes of @param view, returns this buffer for chaining
    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer(std::move(bytes));
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  namespace literals {
    /// bytes of the string characters as is, without unhexing
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer(c, c + s);
    }

    inline Buffer operator""_hex2buf(const char *hex, size_t size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace xrpcodec::common
