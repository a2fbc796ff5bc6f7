/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>
#include <fmt/format.h>
#include <qtils/hex.hpp>

#include "common/buffer_view.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xrpcodec::common, UnhexError, e) {
  using xrpcodec::common::UnhexError;
  switch (e) {
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Odd number of hex digits";
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::UNKNOWN:
      return "Unknown error";
  }
  return "Unknown UnhexError";
}

namespace xrpcodec::common {

  std::string hex_lower(BufferView bytes) {
    return fmt::format("{:x}", std::span{bytes});
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;
    } catch (const std::exception &) {
      return UnhexError::UNKNOWN;
    }
    return bytes;
  }

}  // namespace xrpcodec::common
