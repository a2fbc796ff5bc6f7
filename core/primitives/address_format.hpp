/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <span>

#include "macro/unreachable.hpp"
#include "primitives/identifier_types.hpp"

namespace xrpcodec::primitives {

  /**
   * Kinds of identifiers which have a textual form
   */
  enum class IdentifierKind : uint8_t {
    ACCOUNT_ID,
    SECP256K1_SEED,
    ED25519_SEED,
  };

  /**
   * Framing of one identifier kind: type-tag prefix put in front of the
   * payload and the exact payload length
   */
  class AddressFormat {
   public:
    constexpr AddressFormat(std::span<const uint8_t> prefix,
                            size_t payload_length)
        : prefix_{prefix}, payload_length_{payload_length} {}

    constexpr std::span<const uint8_t> prefix() const {
      return prefix_;
    }

    constexpr size_t prefixLength() const {
      return prefix_.size();
    }

    constexpr size_t payloadLength() const {
      return payload_length_;
    }

   private:
    std::span<const uint8_t> prefix_;
    size_t payload_length_;
  };

  namespace formats {
    inline constexpr std::array<uint8_t, 1> kAccountIdPrefix{0x00};
    inline constexpr std::array<uint8_t, 1> kSecp256k1SeedPrefix{0x21};
    inline constexpr std::array<uint8_t, 3> kEd25519SeedPrefix{
        0x01, 0xE1, 0x4B};

    inline constexpr AddressFormat kAccountId{kAccountIdPrefix,
                                              constants::kAccountIdLength};
    inline constexpr AddressFormat kSecp256k1Seed{kSecp256k1SeedPrefix,
                                                  constants::kEntropyLength};
    inline constexpr AddressFormat kEd25519Seed{kEd25519SeedPrefix,
                                                constants::kEntropyLength};
  }  // namespace formats

  constexpr const AddressFormat &formatOf(IdentifierKind kind) {
    switch (kind) {
      case IdentifierKind::ACCOUNT_ID:
        return formats::kAccountId;
      case IdentifierKind::SECP256K1_SEED:
        return formats::kSecp256k1Seed;
      case IdentifierKind::ED25519_SEED:
        return formats::kEd25519Seed;
    }
    XRPCODEC_UNREACHABLE
  }

  constexpr IdentifierKind seedKindOf(Algorithm algorithm) {
    switch (algorithm) {
      case Algorithm::SECP256K1:
        return IdentifierKind::SECP256K1_SEED;
      case Algorithm::ED25519:
        return IdentifierKind::ED25519_SEED;
    }
    XRPCODEC_UNREACHABLE
  }

  /**
   * Seed formats in the order they are tried while decoding a seed of
   * unknown algorithm
   */
  inline constexpr std::array kSeedDecodingOrder{
      Algorithm::SECP256K1,
      Algorithm::ED25519,
  };

}  // namespace xrpcodec::primitives
