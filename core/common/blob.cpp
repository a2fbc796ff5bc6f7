/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xrpcodec::common, BlobError, e) {
  using xrpcodec::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input string has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace xrpcodec::common {

  // explicit instantiations for the blobs used by the codec: checksums, seed
  // entropy, account ids and sha256 digests
  template class Blob<4ul>;
  template class Blob<16ul>;
  template class Blob<20ul>;
  template class Blob<32ul>;

}  // namespace xrpcodec::common
