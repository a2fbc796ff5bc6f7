/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/random_generator/boost_generator.hpp>

namespace xrpcodec::crypto {
  /// source of random seed entropy
  using BoostRandomGenerator = libp2p::crypto::random::BoostRandomGenerator;
}  // namespace xrpcodec::crypto
