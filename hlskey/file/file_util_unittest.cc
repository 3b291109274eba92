// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file/file_util.h>

#include <filesystem>

#include <absl/log/log.h>
#include <gtest/gtest.h>

namespace hlskey {

TEST(FileUtilTest, TempFilePathInDesignatedDirectory) {
  std::string temp_file_path;
  EXPECT_TRUE(TempFilePath("/test", "hls_key_01.bin", &temp_file_path));
  EXPECT_EQ("/test/hls_key_01.bin", temp_file_path);
  LOG(INFO) << "temp file path: " << temp_file_path;
}

TEST(FileUtilTest, TempFilePathInSystemTempDirectory) {
  std::string temp_file_path;
  EXPECT_TRUE(TempFilePath("", "hls_key_01.bin", &temp_file_path));
  const std::filesystem::path path = std::filesystem::u8path(temp_file_path);
  EXPECT_TRUE(path.is_absolute());
  EXPECT_EQ("hls_key_01.bin", path.filename().u8string());
  EXPECT_TRUE(std::filesystem::equivalent(
      std::filesystem::temp_directory_path(), path.parent_path()));
  LOG(INFO) << "temp file path: " << temp_file_path;
}

TEST(FileUtilTest, TempFilePathIsAbsoluteForRelativeDirectory) {
  std::string temp_file_path;
  ASSERT_TRUE(TempFilePath("relative/dir", "name.txt", &temp_file_path));
  const std::filesystem::path path = std::filesystem::u8path(temp_file_path);
  EXPECT_TRUE(path.is_absolute());
  EXPECT_EQ("name.txt", path.filename().u8string());
  EXPECT_EQ("dir", path.parent_path().filename().u8string());
}

}  // namespace hlskey
