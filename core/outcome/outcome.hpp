/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;

  /**
   * Replaces the error of a failed result with @param error, value is kept
   * untouched. Used where lower level error categories must not leak to the
   * caller.
   */
  template <typename Result, typename E>
  std::decay_t<Result> mask_error(Result &&r, E error) {
    if (r.has_error()) {
      return error;
    }
    return std::forward<Result>(r);
  }
}  // namespace outcome
