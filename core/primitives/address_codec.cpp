/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address_codec.hpp"

#include "crypto/hasher.hpp"
#include "primitives/base58_codec.hpp"
#include "primitives/checksum.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xrpcodec::primitives, AddressCodecError, e) {
  using E = xrpcodec::primitives::AddressCodecError;
  switch (e) {
    case E::DECODE_ERROR:
      return "decode error";
    case E::INVALID_PAYLOAD_LENGTH:
      return "Payload length does not match the identifier kind";
  }
  return "Unknown address codec error";
}

namespace xrpcodec::primitives {

  namespace {
    outcome::result<void> verifyPayloadLength(common::BufferView bytes,
                                              const AddressFormat &format) {
      // minimal length is checked before anything is subtracted from the size
      if (bytes.size() < kChecksumLength + 1
          or bytes.size() < format.prefixLength() + kChecksumLength + 1) {
        return AddressCodecError::DECODE_ERROR;
      }
      if (bytes.size() - kChecksumLength - format.prefixLength()
          != format.payloadLength()) {
        return AddressCodecError::DECODE_ERROR;
      }
      return outcome::success();
    }

    template <typename Fixed>
    outcome::result<Fixed> toFixed(const common::Buffer &payload) {
      return outcome::mask_error(Fixed::fromSpan(payload),
                                 AddressCodecError::DECODE_ERROR);
    }
  }  // namespace

  std::string encodeWithPrefix(common::BufferView prefix,
                               common::BufferView payload,
                               const crypto::Hasher &hasher) {
    common::Buffer bytes;
    bytes.reserve(prefix.size() + payload.size() + kChecksumLength);
    bytes.put(prefix).put(payload);
    auto checksum = calculateChecksum(bytes, hasher);
    bytes.put(checksum);
    return encodeBase58(bytes, kXrplAlphabet);
  }

  outcome::result<common::Buffer> decodeWithFormat(
      const AddressFormat &format,
      std::string_view encoded,
      const crypto::Hasher &hasher) {
    if (encoded.size() > maxEncodedLength(format)) {
      return AddressCodecError::DECODE_ERROR;
    }

    OUTCOME_TRY(bytes,
                outcome::mask_error(decodeBase58(encoded, kXrplAlphabet),
                                    AddressCodecError::DECODE_ERROR));

    OUTCOME_TRY(verifyPayloadLength(bytes, format));

    if (not common::startsWith(bytes, format.prefix())) {
      return AddressCodecError::DECODE_ERROR;
    }

    common::BufferView checked(bytes);
    auto checksum = checked.last(kChecksumLength);
    checked.dropLast(kChecksumLength);
    if (not verifyChecksum(checked, checksum, hasher)) {
      return AddressCodecError::DECODE_ERROR;
    }

    checked.dropFirst(format.prefixLength());
    return common::Buffer(checked);
  }

  outcome::result<std::string> encode(IdentifierKind kind,
                                      common::BufferView payload,
                                      const crypto::Hasher &hasher) {
    const auto &format = formatOf(kind);
    if (payload.size() != format.payloadLength()) {
      return AddressCodecError::INVALID_PAYLOAD_LENGTH;
    }
    return encodeWithPrefix(format.prefix(), payload, hasher);
  }

  outcome::result<common::Buffer> decode(IdentifierKind kind,
                                         std::string_view encoded,
                                         const crypto::Hasher &hasher) {
    return decodeWithFormat(formatOf(kind), encoded, hasher);
  }

  std::string encodeAccountId(const AccountId &account_id,
                              const crypto::Hasher &hasher) {
    return encodeWithPrefix(formats::kAccountId.prefix(), account_id, hasher);
  }

  outcome::result<AccountId> decodeAccountId(std::string_view encoded,
                                             const crypto::Hasher &hasher) {
    OUTCOME_TRY(payload,
                decodeWithFormat(formats::kAccountId, encoded, hasher));
    return toFixed<AccountId>(payload);
  }

  std::string encodeSeed(const Entropy &entropy,
                         Algorithm algorithm,
                         const crypto::Hasher &hasher) {
    const auto &format = formatOf(seedKindOf(algorithm));
    return encodeWithPrefix(format.prefix(), entropy, hasher);
  }

  outcome::result<Entropy> decodeSeed(std::string_view encoded,
                                      Algorithm algorithm,
                                      const crypto::Hasher &hasher) {
    const auto &format = formatOf(seedKindOf(algorithm));
    OUTCOME_TRY(payload, decodeWithFormat(format, encoded, hasher));
    return toFixed<Entropy>(payload);
  }

  outcome::result<DecodedSeed> decodeSeed(std::string_view encoded,
                                          const crypto::Hasher &hasher) {
    outcome::result<DecodedSeed> res = AddressCodecError::DECODE_ERROR;
    for (auto algorithm : kSeedDecodingOrder) {
      auto entropy_res = decodeSeed(encoded, algorithm, hasher);
      if (entropy_res.has_value()) {
        return DecodedSeed{.entropy = entropy_res.value(),
                           .algorithm = algorithm};
      }
      res = entropy_res.as_failure();
    }
    return res;
  }

}  // namespace xrpcodec::primitives
