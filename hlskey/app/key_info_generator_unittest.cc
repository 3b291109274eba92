// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/app/key_info_generator.h>

#include <sys/stat.h>

#include <filesystem>
#include <string>
#include <vector>

#include <absl/strings/str_split.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hlskey/file.h>
#include <hlskey/file/file_test_util.h>
#include <hlskey/key_info.h>
#include <hlskey/status/status_test_util.h>

namespace hlskey {
namespace {

const char kKeyUri[] = "https://example.com/keys/1";
const char kIv[] = "00112233445566778899aabbccddeeff";

std::vector<std::string> ReadLines(const std::string& path) {
  std::string contents;
  EXPECT_TRUE(File::ReadFileToString(path.c_str(), &contents));
  return absl::StrSplit(contents, '\n');
}

}  // namespace

class KeyInfoGeneratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_FALSE(output_dir_.path().empty());
    ASSERT_FALSE(scratch_dir_.path().empty());
    options_.key_uri = kKeyUri;
    options_.key_output = output_dir_.path() + "/key.bin";
    options_.keyinfo_output = output_dir_.path() + "/key.keyinfo";
    options_.temp_dir = scratch_dir_.path();
  }

  TempDirectory output_dir_;
  TempDirectory scratch_dir_;
  KeyInfoGeneratorOptions options_;
};

TEST_F(KeyInfoGeneratorTest, WritesKeyAndKeyInfo) {
  options_.iv = kIv;
  ASSERT_OK(GenerateKeyInfo(options_));

  EXPECT_THAT(ReadLines(options_.keyinfo_output),
              ::testing::ElementsAre(kKeyUri, options_.key_output, kIv, ""));
  EXPECT_EQ(KeyInfo::kKeySize,
            std::filesystem::file_size(
                std::filesystem::u8path(options_.key_output)));
  // The intermediate key file is gone.
  EXPECT_EQ(0u, scratch_dir_.CountEntries());
}

TEST_F(KeyInfoGeneratorTest, KeyOutputIsOwnerOnly) {
  ASSERT_TRUE(File::WriteStringToFile(options_.key_output.c_str(), "old"));
  ASSERT_EQ(0, chmod(options_.key_output.c_str(), 0644));

  ASSERT_OK(GenerateKeyInfo(options_));

  struct stat key_stat;
  ASSERT_EQ(0, stat(options_.key_output.c_str(), &key_stat));
  EXPECT_EQ(0u, key_stat.st_mode & (S_IRWXG | S_IRWXO));
  EXPECT_EQ(static_cast<off_t>(KeyInfo::kKeySize), key_stat.st_size);
}

TEST_F(KeyInfoGeneratorTest, WithoutIv) {
  ASSERT_OK(GenerateKeyInfo(options_));
  EXPECT_THAT(ReadLines(options_.keyinfo_output),
              ::testing::ElementsAre(kKeyUri, options_.key_output, ""));
}

TEST_F(KeyInfoGeneratorTest, RandomIv) {
  options_.random_iv = true;
  ASSERT_OK(GenerateKeyInfo(options_));

  const std::vector<std::string> lines = ReadLines(options_.keyinfo_output);
  ASSERT_EQ(4u, lines.size());
  EXPECT_TRUE(KeyInfo::IsValidIv(lines[2]));
}

TEST_F(KeyInfoGeneratorTest, KeyOutputIsDirectory) {
  ASSERT_TRUE(std::filesystem::create_directory(options_.key_output));

  Status status = GenerateKeyInfo(options_);
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_THAT(status.error_message(),
              ::testing::HasSubstr(options_.key_output));
  EXPECT_FALSE(File::Exists(options_.keyinfo_output.c_str()));
  EXPECT_EQ(0u, scratch_dir_.CountEntries());
}

TEST_F(KeyInfoGeneratorTest, KeyInfoOutputIsDirectory) {
  ASSERT_TRUE(std::filesystem::create_directory(options_.keyinfo_output));

  EXPECT_EQ(error::FILE_FAILURE, GenerateKeyInfo(options_).error_code());
  EXPECT_EQ(0u, scratch_dir_.CountEntries());
}

}  // namespace hlskey
