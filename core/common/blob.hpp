/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

/**
 * Declares a distinct fixed-size byte type, so that values of the same size
 * but of different meaning (account id, seed entropy) are not mixed up
 */
#define XRPCODEC_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)       \
  namespace space_name {                                                      \
    struct class_name : public ::xrpcodec::common::Blob<blob_size> {          \
      using Base = ::xrpcodec::common::Blob<blob_size>;                       \
                                                                              \
      class_name() = default;                                                 \
      explicit class_name(const Base &blob) : Base{blob} {}                   \
                                                                              \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {    \
        OUTCOME_TRY(blob, Base::fromHex(hex));                                \
        return class_name{blob};                                              \
      }                                                                       \
                                                                              \
      static ::outcome::result<class_name> fromSpan(                          \
          const ::xrpcodec::common::BufferView &span) {                       \
        OUTCOME_TRY(blob, Base::fromSpan(span));                              \
        return class_name{blob};                                              \
      }                                                                       \
    };                                                                        \
  }                                                                           \
                                                                              \
  template <>                                                                 \
  struct fmt::formatter<space_name::class_name>                               \
      : fmt::formatter<space_name::class_name::Base> {}

namespace xrpcodec::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Byte array of compile-time size
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    /// @return INCORRECT_LENGTH unless hex encodes exactly size_ bytes
    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromSpan(const BufferView &span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::ranges::copy(span, blob.begin());
      return blob;
    }
  };

  extern template class Blob<4ul>;
  extern template class Blob<16ul>;
  extern template class Blob<20ul>;
  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace xrpcodec::common

/**
 * Blobs longer than 4 bytes are printed shortened as 0xabcd…ef01 by default,
 * "{:l}" prints all bytes
 */
template <size_t N>
struct fmt::formatter<xrpcodec::common::Blob<N>> {
  bool shortened = N > 4;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 's' or *it == 'l')) {
      shortened = *it++ == 's';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const xrpcodec::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (shortened) {
      xrpcodec::common::BufferView view(blob);
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            xrpcodec::common::hex_lower(view.first(2)),
                            xrpcodec::common::hex_lower(view.last(2)));
    }
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(xrpcodec::common, BlobError);
