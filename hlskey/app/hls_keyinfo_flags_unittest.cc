// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/app/hls_keyinfo_flags.h>

#include <gtest/gtest.h>

#include <hlskey/app/validate_flag.h>
#include <hlskey/flag_saver.h>

namespace hlskey {
namespace {

const char kIv[] = "00112233445566778899aabbccddeeff";

class HlsKeyInfoFlagsTest : public ::testing::Test {
 protected:
  HlsKeyInfoFlagsTest()
      : key_uri_(&FLAGS_key_uri),
        key_output_(&FLAGS_key_output),
        keyinfo_output_(&FLAGS_keyinfo_output),
        iv_(&FLAGS_iv),
        random_iv_(&FLAGS_random_iv) {}

  void SetUp() override {
    absl::SetFlag(&FLAGS_key_uri, "https://example.com/key.bin");
    absl::SetFlag(&FLAGS_key_output, "/tmp/key.bin");
    absl::SetFlag(&FLAGS_keyinfo_output, "/tmp/key.keyinfo");
    absl::SetFlag(&FLAGS_iv, "");
    absl::SetFlag(&FLAGS_random_iv, false);
  }

 private:
  FlagSaver<std::string> key_uri_;
  FlagSaver<std::string> key_output_;
  FlagSaver<std::string> keyinfo_output_;
  FlagSaver<std::string> iv_;
  FlagSaver<bool> random_iv_;
};

TEST_F(HlsKeyInfoFlagsTest, RequiredFlagsOnly) {
  EXPECT_TRUE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, MissingKeyUri) {
  absl::SetFlag(&FLAGS_key_uri, "");
  EXPECT_FALSE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, MissingOutputs) {
  absl::SetFlag(&FLAGS_key_output, "");
  EXPECT_FALSE(ValidateKeyInfoFlags());

  absl::SetFlag(&FLAGS_key_output, "/tmp/key.bin");
  absl::SetFlag(&FLAGS_keyinfo_output, "");
  EXPECT_FALSE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, Iv) {
  absl::SetFlag(&FLAGS_iv, kIv);
  EXPECT_TRUE(ValidateKeyInfoFlags());

  absl::SetFlag(&FLAGS_iv, "00112233445566778899AABBCCDDEEFF");
  EXPECT_TRUE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, RandomIv) {
  absl::SetFlag(&FLAGS_random_iv, true);
  EXPECT_TRUE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, IvAndRandomIvAreExclusive) {
  absl::SetFlag(&FLAGS_iv, kIv);
  absl::SetFlag(&FLAGS_random_iv, true);
  EXPECT_FALSE(ValidateKeyInfoFlags());
}

TEST_F(HlsKeyInfoFlagsTest, MalformedIv) {
  absl::SetFlag(&FLAGS_iv, "0011");
  EXPECT_FALSE(ValidateKeyInfoFlags());

  absl::SetFlag(&FLAGS_iv, "g0112233445566778899aabbccddeeff");
  EXPECT_FALSE(ValidateKeyInfoFlags());
}

TEST(ValidateFlagTest, Condition) {
  EXPECT_TRUE(ValidateFlag("flag", "value", true, false, "needed"));
  EXPECT_FALSE(ValidateFlag("flag", "", true, false, "needed"));
  EXPECT_TRUE(ValidateFlag("flag", "", true, true, "needed"));
  EXPECT_FALSE(ValidateFlag("flag", "value", false, true, "needed"));
  EXPECT_TRUE(ValidateFlag("flag", "", false, true, "needed"));
}

TEST(ValidateFlagTest, Hex) {
  EXPECT_TRUE(ValidateHexFlag("flag", "", 2));
  EXPECT_TRUE(ValidateHexFlag("flag", "0aF9", 2));
  EXPECT_FALSE(ValidateHexFlag("flag", "0aF", 2));
  EXPECT_FALSE(ValidateHexFlag("flag", "0aFx", 2));
}

}  // namespace
}  // namespace hlskey
