/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "primitives/address_format.hpp"
#include "primitives/checksum.hpp"
#include "primitives/identifier_types.hpp"

namespace xrpcodec::crypto {
  class Hasher;
}

namespace xrpcodec::primitives {

  /**
   * Decoding reports the single DECODE_ERROR whatever check has failed: bad
   * symbol, length, prefix or checksum. The reason is not disclosed on
   * purpose as the encoded values may be secret seeds.
   */
  enum class AddressCodecError {
    DECODE_ERROR = 1,
    INVALID_PAYLOAD_LENGTH,
  };

  /**
   * Upper bound of the encoded length of @param format, base58 takes at most
   * log(256) / log(58) < 1.38 symbols per byte. Longer strings are rejected
   * before decoding, the base conversion is quadratic in the input length.
   */
  constexpr size_t maxEncodedLength(const AddressFormat &format) {
    auto bytes =
        format.prefixLength() + format.payloadLength() + kChecksumLength;
    return bytes * 138 / 100 + 1;
  }

  /**
   * Produces base58(prefix ++ payload ++ checksum(prefix ++ payload)) over
   * the ledger alphabet
   */
  std::string encodeWithPrefix(common::BufferView prefix,
                               common::BufferView payload,
                               const crypto::Hasher &hasher);

  /**
   * Decodes the string and validates it against @param format. Length is
   * checked first, then prefix, then checksum.
   * @return payload without prefix and checksum, exactly
   * format.payloadLength() bytes
   */
  outcome::result<common::Buffer> decodeWithFormat(
      const AddressFormat &format,
      std::string_view encoded,
      const crypto::Hasher &hasher);

  /**
   * Encodes a payload of an arbitrary kind
   * @return INVALID_PAYLOAD_LENGTH if payload size does not match the kind
   */
  outcome::result<std::string> encode(IdentifierKind kind,
                                      common::BufferView payload,
                                      const crypto::Hasher &hasher);

  outcome::result<common::Buffer> decode(IdentifierKind kind,
                                         std::string_view encoded,
                                         const crypto::Hasher &hasher);

  /// Classic address, starts with 'r'
  std::string encodeAccountId(const AccountId &account_id,
                              const crypto::Hasher &hasher);

  outcome::result<AccountId> decodeAccountId(std::string_view encoded,
                                             const crypto::Hasher &hasher);

  /// Seed (secret), starts with 's' for secp256k1 and with "sEd" for ed25519
  std::string encodeSeed(const Entropy &entropy,
                         Algorithm algorithm,
                         const crypto::Hasher &hasher);

  /**
   * Decodes a seed of known algorithm
   */
  outcome::result<Entropy> decodeSeed(std::string_view encoded,
                                      Algorithm algorithm,
                                      const crypto::Hasher &hasher);

  /**
   * Decodes a seed trying algorithms in kSeedDecodingOrder, first match wins.
   * If none matches, the error of the last attempt is returned.
   */
  outcome::result<DecodedSeed> decodeSeed(std::string_view encoded,
                                          const crypto::Hasher &hasher);

}  // namespace xrpcodec::primitives

OUTCOME_HPP_DECLARE_ERROR(xrpcodec::primitives, AddressCodecError);
