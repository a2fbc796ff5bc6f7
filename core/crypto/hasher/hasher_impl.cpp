/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include "crypto/sha/sha256.hpp"

namespace xrpcodec::crypto {
  using common::Hash256;

  Hash256 HasherImpl::sha2_256(common::BufferView data) const {
    return crypto::sha256(data);
  }
}  // namespace xrpcodec::crypto
