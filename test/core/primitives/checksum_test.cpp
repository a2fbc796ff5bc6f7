/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/checksum.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "mock/crypto/hasher_mock.hpp"
#include "testutil/literals.hpp"

using xrpcodec::common::Buffer;
using xrpcodec::common::BufferView;
using xrpcodec::common::Hash256;
using xrpcodec::crypto::HasherImpl;
using xrpcodec::crypto::HasherMock;
using xrpcodec::primitives::calculateChecksum;
using xrpcodec::primitives::Checksum;
using xrpcodec::primitives::verifyChecksum;

using testing::Eq;
using testing::InSequence;
using testing::Return;

class ChecksumTest : public testing::Test {
 protected:
  HasherImpl hasher_;
};

/**
 * @given hasher mock
 * @when checksum is calculated
 * @then sha256 is applied to the data and then to the first digest, checksum
 * is the first 4 bytes of the second digest
 */
TEST_F(ChecksumTest, HashedTwice) {
  HasherMock hasher;
  auto data = "00112233"_hex2buf;
  Hash256 first = "first"_hash256;
  Hash256 second{};
  second[0] = 0xde;
  second[1] = 0xad;
  second[2] = 0xbe;
  second[3] = 0xef;
  second[4] = 0xff;

  {
    InSequence s;
    EXPECT_CALL(hasher, sha2_256(Eq(BufferView(data)))).WillOnce(Return(first));
    EXPECT_CALL(hasher, sha2_256(Eq(BufferView(first))))
        .WillOnce(Return(second));
  }

  EXPECT_EQ(calculateChecksum(data, hasher),
            Checksum::fromHex("deadbeef").value());
}

/**
 * @given well-known inputs
 * @when calculate checksum with sha256 hasher
 * @then expected checksum is returned
 */
TEST_F(ChecksumTest, KnownValues) {
  EXPECT_EQ(calculateChecksum(BufferView{}, hasher_),
            Checksum::fromHex("5df6e0e2").value());
  EXPECT_EQ(calculateChecksum(
                "00ba8e78626ee42c41b46d46c3048df3a1c3c87072"_hex2buf, hasher_),
            Checksum::fromHex("83160fbd").value());
  EXPECT_EQ(calculateChecksum(Buffer(21, 0), hasher_),
            Checksum::fromHex("94a00911").value());
}

/**
 * @given data and its checksum
 * @when verify the checksum or a corrupted one
 * @then only the exact checksum passes
 */
TEST_F(ChecksumTest, Verify) {
  auto data = "00ba8e78626ee42c41b46d46c3048df3a1c3c87072"_hex2buf;
  EXPECT_TRUE(verifyChecksum(data, "83160fbd"_hex2buf, hasher_));
  EXPECT_FALSE(verifyChecksum(data, "83160fbe"_hex2buf, hasher_));
  EXPECT_FALSE(verifyChecksum(data, "83160f"_hex2buf, hasher_));
  EXPECT_FALSE(verifyChecksum(data, BufferView{}, hasher_));
}
