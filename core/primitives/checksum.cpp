/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/checksum.hpp"

#include <algorithm>

#include "crypto/hasher.hpp"

namespace xrpcodec::primitives {

  Checksum calculateChecksum(common::BufferView data,
                             const crypto::Hasher &hasher) {
    auto digest = hasher.sha2_256(hasher.sha2_256(data));
    Checksum checksum;
    std::copy_n(digest.begin(), kChecksumLength, checksum.begin());
    return checksum;
  }

  bool verifyChecksum(common::BufferView data,
                      common::BufferView checksum,
                      const crypto::Hasher &hasher) {
    return common::BufferView(calculateChecksum(data, hasher)) == checksum;
  }

}  // namespace xrpcodec::primitives
