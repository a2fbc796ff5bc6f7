/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"
#include "primitives/identifier_types.hpp"

namespace xrpcodec::primitives {

  /**
   * Textual form of ledger account ids and seeds
   */
  class IdentifierCodec {
   public:
    virtual ~IdentifierCodec() = default;

    /**
     * Encodes seed entropy, the algorithm is tagged in the prefix
     * @param entropy 16 bytes of seed randomness
     * @param algorithm signature algorithm the seed is meant for
     * @return seed string
     */
    virtual std::string encodeSeed(const Entropy &entropy,
                                   Algorithm algorithm) const = 0;

    /**
     * Decodes seed string and detects its algorithm
     * @return entropy and algorithm, or AddressCodecError::DECODE_ERROR
     */
    virtual outcome::result<DecodedSeed> decodeSeed(
        std::string_view seed) const = 0;

    /**
     * @brief encodes 20 bytes of account id as classic address
     */
    virtual std::string encodeAccountId(const AccountId &account_id) const = 0;

    /**
     * @brief decodes classic address
     * @return account id bytes, or AddressCodecError::DECODE_ERROR
     */
    virtual outcome::result<AccountId> decodeAccountId(
        std::string_view address) const = 0;
  };

}  // namespace xrpcodec::primitives
