/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <stdexcept>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace xrpcodec::primitives {

  enum class Base58Error { INVALID_CHARACTER = 1 };

  /**
   * Ordered set of 58 distinct symbols. Position of a symbol is its digit
   * value, so two alphabets with the same symbols in different order are
   * different encodings.
   */
  class Base58Alphabet {
   public:
    static constexpr size_t kSize = 58;

    /**
     * @param symbols exactly 58 distinct characters; a duplicate is a compile
     * time error for constexpr alphabets
     */
    constexpr explicit Base58Alphabet(const char (&symbols)[kSize + 1])
        : symbols_{}, digits_{} {
      digits_.fill(-1);
      for (size_t i = 0; i < kSize; ++i) {
        auto symbol = static_cast<uint8_t>(symbols[i]);
        if (digits_[symbol] != -1) {
          throw std::invalid_argument("Duplicate symbol in base58 alphabet");
        }
        digits_[symbol] = static_cast<int8_t>(i);
        symbols_[i] = symbols[i];
      }
    }

    constexpr char symbol(uint8_t digit) const {
      return symbols_[digit];
    }

    /// @return digit value of @param symbol or -1 if it is not in alphabet
    constexpr int8_t digit(char symbol) const {
      return digits_[static_cast<uint8_t>(symbol)];
    }

    /// symbol which stands for a leading zero byte
    constexpr char zero() const {
      return symbols_[0];
    }

   private:
    std::array<char, kSize> symbols_;
    std::array<int8_t, 256> digits_;
  };

  /** All alphanumeric characters except for "0", "I", "O", and "l" */
  inline constexpr Base58Alphabet kBitcoinAlphabet{
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

  /** Alphabet of ledger account ids and seeds */
  inline constexpr Base58Alphabet kXrplAlphabet{
      "rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz"};

  /**
   * Decodes @param str over @param alphabet. No whitespace trimming or any
   * other normalization is done, every character must belong to the alphabet.
   */
  outcome::result<common::Buffer> decodeBase58(
      std::string_view str, const Base58Alphabet &alphabet) noexcept;

  std::string encodeBase58(common::BufferView bytes,
                           const Base58Alphabet &alphabet) noexcept;

}  // namespace xrpcodec::primitives

OUTCOME_HPP_DECLARE_ERROR(xrpcodec::primitives, Base58Error);
