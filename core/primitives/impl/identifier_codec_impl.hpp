/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/identifier_codec.hpp"

#include <memory>

#include "log/logger.hpp"

namespace xrpcodec::crypto {
  class Hasher;
}

namespace xrpcodec::primitives {

  class IdentifierCodecImpl : public IdentifierCodec {
   public:
    explicit IdentifierCodecImpl(std::shared_ptr<crypto::Hasher> hasher);

    std::string encodeSeed(const Entropy &entropy,
                           Algorithm algorithm) const override;

    outcome::result<DecodedSeed> decodeSeed(
        std::string_view seed) const override;

    std::string encodeAccountId(const AccountId &account_id) const override;

    outcome::result<AccountId> decodeAccountId(
        std::string_view address) const override;

   private:
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace xrpcodec::primitives
