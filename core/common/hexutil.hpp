/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace xrpcodec::common {

  class BufferView;

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    UNKNOWN,
  };

  /**
   * @return lowercase hex of @param bytes without any prefix
   */
  std::string hex_lower(BufferView bytes);

  /**
   * Reads both lowercase and uppercase hex of even length, no 0x prefix
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

}  // namespace xrpcodec::common

OUTCOME_HPP_DECLARE_ERROR(xrpcodec::common, UnhexError);
