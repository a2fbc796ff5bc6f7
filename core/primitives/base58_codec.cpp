/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// BASED ON BITCOIN IMPLEMENTATION WITH THE FOLLOWING COPYRIGHT:
//
// Copyright (c) 2014-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/base58_codec.hpp"

#include <algorithm>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(xrpcodec::primitives, Base58Error, e) {
  using E = xrpcodec::primitives::Base58Error;
  switch (e) {
    case E::INVALID_CHARACTER:
      return "Invalid character in a Base58 string";
  }
  return "Unknown error in base58 decoder";
}

namespace xrpcodec::primitives {

  outcome::result<common::Buffer> decodeBase58(
      std::string_view str, const Base58Alphabet &alphabet) noexcept {
    // Skip and count leading zero symbols.
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == alphabet.zero()) {
      ++zeroes;
    }
    str.remove_prefix(zeroes);

    // Allocate enough space in big-endian base256 representation.
    size_t size =
        str.size() * 733 / 1000 + 1;  // log(58) / log(256), rounded up.
    std::vector<uint8_t> b256(size);

    // Process the characters.
    size_t length = 0;
    for (auto c : str) {
      int carry = alphabet.digit(c);
      if (carry == -1) {
        return Base58Error::INVALID_CHARACTER;
      }
      size_t i = 0;
      // Apply "b256 = b256 * 58 + digit".
      for (auto it = b256.rbegin();
           (carry != 0 || i < length) && (it != b256.rend());
           ++it, ++i) {
        carry += 58 * (*it);
        *it = carry % 256;
        carry /= 256;
      }
      BOOST_ASSERT(carry == 0);
      length = i;
    }

    // Skip leading zeroes in b256.
    auto it = b256.begin() + static_cast<std::ptrdiff_t>(size - length);

    // Copy result into output vector.
    common::Buffer res;
    res.reserve(zeroes + (b256.end() - it));
    res.resize(zeroes);
    res.insert(res.end(), it, b256.end());
    return res;
  }

  std::string encodeBase58(common::BufferView input,
                           const Base58Alphabet &alphabet) noexcept {
    // Skip & count leading zeroes.
    size_t zeroes = 0;
    while (zeroes < input.size() && input[zeroes] == 0) {
      ++zeroes;
    }
    input.dropFirst(zeroes);

    // Allocate enough space in big-endian base58 representation.
    size_t size =
        input.size() * 138 / 100 + 1;  // log(256) / log(58), rounded up.
    std::vector<uint8_t> b58(size);

    // Process the bytes.
    size_t length = 0;
    for (auto byte : input) {
      int carry = byte;
      size_t i = 0;
      // Apply "b58 = b58 * 256 + ch".
      for (auto it = b58.rbegin();
           (carry != 0 || i < length) && (it != b58.rend());
           ++it, ++i) {
        carry += 256 * (*it);
        *it = carry % 58;
        carry /= 58;
      }
      BOOST_ASSERT(carry == 0);
      length = i;
    }

    // Skip leading zeroes in base58 result.
    auto it = b58.begin() + static_cast<std::ptrdiff_t>(size - length);
    it = std::find_if(it, b58.end(), [](auto b) { return b != 0; });

    // Translate the result into a string.
    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, alphabet.zero());
    while (it != b58.end()) {
      str += alphabet.symbol(*(it++));
    }
    return str;
  }

}  // namespace xrpcodec::primitives
