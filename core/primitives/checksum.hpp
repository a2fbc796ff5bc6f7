/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace xrpcodec::crypto {
  class Hasher;
}

namespace xrpcodec::primitives {

  constexpr size_t kChecksumLength = 4;

  using Checksum = common::Blob<kChecksumLength>;

  /**
   * First 4 bytes of sha256(sha256(data))
   */
  Checksum calculateChecksum(common::BufferView data,
                             const crypto::Hasher &hasher);

  /**
   * @return true if @param checksum equals the checksum of @param data
   */
  bool verifyChecksum(common::BufferView data,
                      common::BufferView checksum,
                      const crypto::Hasher &hasher);

}  // namespace xrpcodec::primitives
