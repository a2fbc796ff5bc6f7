/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "common/blob.hpp"

namespace xrpcodec::primitives::constants {
  constexpr size_t kAccountIdLength = 20;
  constexpr size_t kEntropyLength = 16;
}  // namespace xrpcodec::primitives::constants

XRPCODEC_BLOB_STRICT_TYPEDEF(xrpcodec::primitives,
                             AccountId,
                             constants::kAccountIdLength);

/// Seed randomness, the private key is derived from it
XRPCODEC_BLOB_STRICT_TYPEDEF(xrpcodec::primitives,
                             Entropy,
                             constants::kEntropyLength);

namespace xrpcodec::primitives {

  /**
   * Signature algorithm the seed is intended to be used with
   */
  enum class Algorithm : uint8_t {
    SECP256K1 = 0,
    ED25519,
  };

  constexpr Algorithm kDefaultAlgorithm = Algorithm::SECP256K1;

  struct DecodedSeed {
    Entropy entropy;
    Algorithm algorithm = kDefaultAlgorithm;

    bool operator==(const DecodedSeed &other) const = default;
  };

}  // namespace xrpcodec::primitives

template <>
struct fmt::formatter<xrpcodec::primitives::Algorithm>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(xrpcodec::primitives::Algorithm algorithm,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using xrpcodec::primitives::Algorithm;
    std::string_view name = "unknown";
    switch (algorithm) {
      case Algorithm::SECP256K1:
        name = "secp256k1";
        break;
      case Algorithm::ED25519:
        name = "ed25519";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
