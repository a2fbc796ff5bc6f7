/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/impl/identifier_codec_impl.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/random_generator.hpp"
#include "primitives/address_codec.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using xrpcodec::crypto::BoostRandomGenerator;
using xrpcodec::crypto::HasherImpl;
using namespace xrpcodec::primitives;

class IdentifierCodecTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    codec_ = std::make_unique<IdentifierCodecImpl>(
        std::make_shared<HasherImpl>());
  }

 protected:
  Entropy randomEntropy() {
    return Entropy::fromSpan(generator_.randomBytes(Entropy::size())).value();
  }

  AccountId randomAccountId() {
    return AccountId::fromSpan(generator_.randomBytes(AccountId::size()))
        .value();
  }

  static constexpr size_t kRounds = 200;

  BoostRandomGenerator generator_;
  std::unique_ptr<IdentifierCodec> codec_;
};

/**
 * @given random account ids
 * @when encode and decode them
 * @then the same account ids are returned, addresses start with 'r'
 */
TEST_F(IdentifierCodecTest, AccountIdRoundTrip) {
  for (size_t i = 0; i < kRounds; ++i) {
    auto account_id = randomAccountId();
    auto address = codec_->encodeAccountId(account_id);
    ASSERT_EQ(address.front(), 'r');
    EXPECT_OUTCOME_TRUE(decoded, codec_->decodeAccountId(address));
    EXPECT_EQ(decoded, account_id);
  }
}

/**
 * @given random entropy for both algorithms
 * @when encode and decode seeds without knowing algorithm
 * @then entropy and algorithm are recovered
 */
TEST_F(IdentifierCodecTest, SeedRoundTrip) {
  for (size_t i = 0; i < kRounds; ++i) {
    for (auto algorithm : kSeedDecodingOrder) {
      auto entropy = randomEntropy();
      auto seed = codec_->encodeSeed(entropy, algorithm);
      ASSERT_EQ(seed.front(), 's');
      if (algorithm == Algorithm::ED25519) {
        ASSERT_EQ(seed.substr(0, 3), "sEd");
      }
      EXPECT_OUTCOME_TRUE(decoded, codec_->decodeSeed(seed));
      EXPECT_EQ(decoded.entropy, entropy);
      EXPECT_EQ(decoded.algorithm, algorithm);
    }
  }
}

/**
 * @given valid address with one symbol replaced
 * @when decode it
 * @then DECODE_ERROR is returned
 */
TEST_F(IdentifierCodecTest, CorruptedAddress) {
  auto address = codec_->encodeAccountId(randomAccountId());
  auto corrupted = address;
  auto &symbol = corrupted[corrupted.size() / 2];
  symbol = symbol == 'p' ? 's' : 'p';

  EXPECT_OUTCOME_ERROR(res,
                       codec_->decodeAccountId(corrupted),
                       AddressCodecError::DECODE_ERROR);
  EXPECT_OUTCOME_ERROR(
      res2, codec_->decodeSeed(address), AddressCodecError::DECODE_ERROR);
}

/**
 * @given well-known seed and address
 * @when decode them through the codec
 * @then the same values as with free functions are returned
 */
TEST_F(IdentifierCodecTest, KnownValues) {
  EXPECT_OUTCOME_TRUE(seed, codec_->decodeSeed("sp6JS7f14BuwFY8Mw6bTtLKWauoUs"));
  EXPECT_EQ(seed, (DecodedSeed{Entropy{}, Algorithm::SECP256K1}));

  EXPECT_OUTCOME_TRUE(account,
                      codec_->decodeAccountId("rrrrrrrrrrrrrrrrrrrrrhoLvTp"));
  EXPECT_EQ(account, AccountId{});
}
