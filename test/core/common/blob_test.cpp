/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace xrpcodec::common;

/**
 * @given hex string of the blob size
 * @when create blob from it
 * @then blob contains the bytes and prints back to the same hex
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<uint8_t, 4> expected{0, 255, 0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<4>::fromHex("00ff00ff"));
  EXPECT_EQ(blob, expected);
  EXPECT_EQ(blob.toHex(), "00ff00ff");
}

/**
 * @given non hex string
 * @when create blob from it
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  EXPECT_OUTCOME_FALSE_1(Blob<4>::fromHex("nothexxx"));
}

/**
 * @given hex strings shorter and longer than the blob
 * @when create blob from them
 * @then INCORRECT_LENGTH is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_OUTCOME_ERROR(
      res, Blob<4>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
  EXPECT_OUTCOME_ERROR(
      res2, Blob<4>::fromHex("00ff00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given span of bytes
 * @when create blob from the span
 * @then blob is created only when span size equals blob size
 */
TEST(BlobTest, CreateFromSpan) {
  std::vector<uint8_t> bytes{1, 2, 3, 4};
  EXPECT_OUTCOME_TRUE(blob, Blob<4>::fromSpan(bytes));
  EXPECT_TRUE(std::ranges::equal(blob, bytes));

  bytes.push_back(5);
  EXPECT_OUTCOME_ERROR(
      res, Blob<4>::fromSpan(bytes), BlobError::INCORRECT_LENGTH);
}

/**
 * @given blobs of different sizes
 * @when format them
 * @then long blobs are shortened unless "{:l}" is requested
 */
TEST(BlobTest, Format) {
  auto blob = Blob<20>::fromHex("ba8e78626ee42c41b46d46c3048df3a1c3c87072")
                  .value();
  EXPECT_EQ(fmt::format("{:l}", blob),
            "0xba8e78626ee42c41b46d46c3048df3a1c3c87072");
  EXPECT_EQ(fmt::format("{}", blob), "0xba8e…7072");

  auto checksum = Blob<4>::fromHex("83160fbd").value();
  EXPECT_EQ(fmt::format("{}", checksum), "0x83160fbd");
}
