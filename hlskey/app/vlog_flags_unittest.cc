// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/app/vlog_flags.h>

#include <absl/log/globals.h>
#include <absl/log/vlog_is_on.h>
#include <gtest/gtest.h>

#include <hlskey/flag_saver.h>

namespace hlskey {

class VlogFlagsTest : public ::testing::Test {
 protected:
  VlogFlagsTest() : saver_(&FLAGS_v) {}

  void TearDown() override { absl::SetGlobalVLogLevel(0); }

 private:
  FlagSaver<int> saver_;
};

TEST_F(VlogFlagsTest, DefaultLeavesVlogOff) {
  absl::SetFlag(&FLAGS_v, 0);
  handle_vlog_flags();
  EXPECT_FALSE(VLOG_IS_ON(1));
}

TEST_F(VlogFlagsTest, EnablesVlogUpToLevel) {
  absl::SetFlag(&FLAGS_v, 1);
  handle_vlog_flags();
  EXPECT_TRUE(VLOG_IS_ON(1));
  EXPECT_FALSE(VLOG_IS_ON(2));

  absl::SetFlag(&FLAGS_v, 2);
  handle_vlog_flags();
  EXPECT_TRUE(VLOG_IS_ON(2));
}

}  // namespace hlskey
