// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/crypto/random_source.h>

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hlskey/crypto/mock_random_source.h>

using ::testing::_;
using ::testing::Return;

namespace hlskey {

TEST(EntropyRandomSourceTest, GeneratesRequestedSize) {
  EntropyRandomSource random_source;
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(random_source.GenerateRandomBytes(16, &bytes));
  EXPECT_EQ(16u, bytes.size());
}

TEST(EntropyRandomSourceTest, ConsecutiveCallsDiffer) {
  EntropyRandomSource random_source;
  std::vector<uint8_t> first;
  std::vector<uint8_t> second;
  ASSERT_TRUE(random_source.GenerateRandomBytes(16, &first));
  ASSERT_TRUE(random_source.GenerateRandomBytes(16, &second));
  EXPECT_NE(first, second);
}

TEST(EntropyRandomSourceTest, LargerThanEntropyBlock) {
  EntropyRandomSource random_source;
  std::vector<uint8_t> bytes(200, 0);
  ASSERT_TRUE(random_source.GenerateRandomBytes(bytes.data(), bytes.size()));
  // The last block is filled too.
  std::vector<uint8_t> tail(bytes.end() - 16, bytes.end());
  EXPECT_NE(std::vector<uint8_t>(16, 0), tail);
}

TEST(EntropyRandomSourceTest, ZeroSize) {
  EntropyRandomSource random_source;
  std::vector<uint8_t> bytes;
  EXPECT_TRUE(random_source.GenerateRandomBytes(0, &bytes));
  EXPECT_TRUE(bytes.empty());
}

TEST(RandomSourceTest, WrapperPropagatesFailure) {
  MockRandomSource random_source;
  EXPECT_CALL(random_source, GenerateRandomBytes(_, 16)).WillOnce(Return(false));

  std::vector<uint8_t> bytes;
  EXPECT_FALSE(random_source.GenerateRandomBytes(16, &bytes));
  EXPECT_EQ(16u, bytes.size());
}

}  // namespace hlskey
