// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file.h>

#include <sys/stat.h>

#include <cstdio>
#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include <hlskey/file/file_closer.h>
#include <hlskey/file/file_test_util.h>

namespace {
const int kDataSize = 1024;

// Write a file with standard C library routines.
void WriteFile(const std::string& path, const std::string& data) {
  FILE* f = fopen(path.c_str(), "wb");
  ASSERT_EQ(data.size(), fwrite(data.data(), 1, data.size(), f));
  fclose(f);
}

void DeleteFile(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::u8path(path), ec);
  // Ignore errors.
}

bool FileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::u8path(path), ec);
}

}  // namespace

namespace hlskey {

class LocalFileTest : public testing::Test {
 protected:
  void SetUp() override {
    data_.resize(kDataSize);
    for (int i = 0; i < kDataSize; ++i)
      data_[i] = i % 256;

    local_file_name_no_prefix_ = generate_unique_temp_path();

    // Local file name with prefix for File API.
    local_file_name_ = kLocalFilePrefix;
    local_file_name_ += local_file_name_no_prefix_;
  }

  void TearDown() override {
    // Remove test file if created.
    DeleteFile(local_file_name_no_prefix_);
  }

  std::string data_;

  // A path to a temporary test file.
  std::string local_file_name_no_prefix_;

  // Same as |local_file_name_no_prefix_| but with the file prefix.
  std::string local_file_name_;
};

TEST_F(LocalFileTest, WriteAndRead) {
  ASSERT_TRUE(File::WriteStringToFile(local_file_name_.c_str(), data_));

  std::string read_data;
  ASSERT_TRUE(File::ReadFileToString(local_file_name_.c_str(), &read_data));
  EXPECT_EQ(data_, read_data);
}

TEST_F(LocalFileTest, WriteTruncates) {
  WriteFile(local_file_name_no_prefix_, data_);
  ASSERT_TRUE(File::WriteStringToFile(local_file_name_.c_str(), "short"));
  ASSERT_FILE_STREQ(local_file_name_.c_str(), "short");
}

TEST_F(LocalFileTest, ExclusiveCreate) {
  DeleteFile(local_file_name_no_prefix_);

  std::unique_ptr<File, FileCloser> file(
      File::Open(local_file_name_.c_str(), "wx"));
  ASSERT_TRUE(file);
  ASSERT_EQ(kDataSize, file->Write(data_.data(), data_.size()));
  ASSERT_TRUE(file.release()->Close());

  ASSERT_FILE_STREQ(local_file_name_.c_str(), data_);
}

TEST_F(LocalFileTest, ExclusiveCreateFailsIfFileExists) {
  WriteFile(local_file_name_no_prefix_, data_);
  EXPECT_TRUE(File::Open(local_file_name_.c_str(), "wx") == NULL);
  // The existing content is untouched.
  ASSERT_FILE_STREQ(local_file_name_.c_str(), data_);
}

TEST_F(LocalFileTest, ExclusiveCreateIsOwnerOnly) {
  DeleteFile(local_file_name_no_prefix_);
  std::unique_ptr<File, FileCloser> file(
      File::Open(local_file_name_.c_str(), "wx"));
  ASSERT_TRUE(file);

  struct stat file_stat;
  ASSERT_EQ(0, stat(local_file_name_no_prefix_.c_str(), &file_stat));
  EXPECT_EQ(0u, file_stat.st_mode & (S_IRWXG | S_IRWXO));
}

TEST_F(LocalFileTest, DeleteRemovesFile) {
  WriteFile(local_file_name_no_prefix_, data_);
  ASSERT_TRUE(File::Delete(local_file_name_.c_str()));
  EXPECT_FALSE(FileExists(local_file_name_no_prefix_));
}

TEST_F(LocalFileTest, DeleteMissingFileSucceeds) {
  DeleteFile(local_file_name_no_prefix_);
  EXPECT_TRUE(File::Delete(local_file_name_.c_str()));
  EXPECT_TRUE(File::Delete(local_file_name_.c_str()));
}

TEST_F(LocalFileTest, DeleteNonEmptyDirectoryFails) {
  TempDirectory temp_dir;
  ASSERT_FALSE(temp_dir.path().empty());
  WriteFile(temp_dir.path() + "/child", data_);
  EXPECT_FALSE(File::Delete(temp_dir.path().c_str()));
}

TEST_F(LocalFileTest, Exists) {
  DeleteFile(local_file_name_no_prefix_);
  EXPECT_FALSE(File::Exists(local_file_name_.c_str()));

  WriteFile(local_file_name_no_prefix_, data_);
  EXPECT_TRUE(File::Exists(local_file_name_no_prefix_.c_str()));
  EXPECT_TRUE(File::Exists(local_file_name_.c_str()));
}

TEST_F(LocalFileTest, ExistsForDirectoryAndDanglingLink) {
  TempDirectory temp_dir;
  ASSERT_FALSE(temp_dir.path().empty());
  EXPECT_TRUE(File::Exists(temp_dir.path().c_str()));

  const std::string link = temp_dir.path() + "/link";
  std::error_code ec;
  std::filesystem::create_symlink(temp_dir.path() + "/missing", link, ec);
  ASSERT_FALSE(ec);
  EXPECT_TRUE(File::Exists(link.c_str()));
}

TEST_F(LocalFileTest, ReadFromMissingFileFails) {
  DeleteFile(local_file_name_no_prefix_);
  std::string contents;
  EXPECT_FALSE(File::ReadFileToString(local_file_name_.c_str(), &contents));
}

TEST_F(LocalFileTest, WriteCreatesParentDirectories) {
  TempDirectory temp_dir;
  ASSERT_FALSE(temp_dir.path().empty());
  const std::string nested = temp_dir.path() + "/a/b/keyinfo.txt";
  ASSERT_TRUE(File::WriteStringToFile(nested.c_str(), "content"));
  ASSERT_FILE_STREQ(nested.c_str(), "content");
}

}  // namespace hlskey
