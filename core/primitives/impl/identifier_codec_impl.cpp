/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/impl/identifier_codec_impl.hpp"

#include <boost/assert.hpp>

#include "crypto/hasher.hpp"
#include "primitives/address_codec.hpp"

namespace xrpcodec::primitives {

  IdentifierCodecImpl::IdentifierCodecImpl(
      std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)},
        logger_{log::createLogger("IdentifierCodec", "codec")} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  std::string IdentifierCodecImpl::encodeSeed(const Entropy &entropy,
                                              Algorithm algorithm) const {
    SL_TRACE(logger_, "Encoding {} seed", algorithm);
    return primitives::encodeSeed(entropy, algorithm, *hasher_);
  }

  outcome::result<DecodedSeed> IdentifierCodecImpl::decodeSeed(
      std::string_view seed) const {
    auto res = primitives::decodeSeed(seed, *hasher_);
    if (res.has_value()) {
      SL_TRACE(logger_, "Decoded {} seed", res.value().algorithm);
    } else {
      SL_DEBUG(logger_, "String is not a valid seed of any known algorithm");
    }
    return res;
  }

  std::string IdentifierCodecImpl::encodeAccountId(
      const AccountId &account_id) const {
    return primitives::encodeAccountId(account_id, *hasher_);
  }

  outcome::result<AccountId> IdentifierCodecImpl::decodeAccountId(
      std::string_view address) const {
    auto res = primitives::decodeAccountId(address, *hasher_);
    if (res.has_value()) {
      SL_TRACE(logger_, "Decoded account id {:l}", res.value());
    } else {
      SL_DEBUG(logger_, "String is not a valid account address");
    }
    return res;
  }

}  // namespace xrpcodec::primitives
