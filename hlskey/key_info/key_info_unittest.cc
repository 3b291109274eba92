// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/key_info.h>

#include <signal.h>
#include <sys/resource.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <memory>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hlskey/crypto/mock_random_source.h>
#include <hlskey/file.h>
#include <hlskey/file/file_closer.h>
#include <hlskey/file/file_test_util.h>
#include <hlskey/status/status_test_util.h>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;

namespace hlskey {
namespace {

const char kUrl[] = "http://localhost:4123/keyinfo";
const char kIv[] = "12345678901234567890123456789012";

bool FileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::u8path(path), ec);
}

std::string FileNameOf(const std::string& path) {
  return std::filesystem::u8path(path).filename().u8string();
}

std::function<bool(uint8_t*, size_t)> FillWith(uint8_t value) {
  return [value](uint8_t* buffer, size_t size) {
    std::fill(buffer, buffer + size, value);
    return true;
  };
}

// Returns a mock random source which answers every request with a distinct
// byte value.
std::unique_ptr<NiceMock<MockRandomSource>> CountingRandomSource() {
  auto random_source = std::make_unique<NiceMock<MockRandomSource>>();
  auto counter = std::make_shared<uint8_t>(0);
  ON_CALL(*random_source, GenerateRandomBytes(_, _))
      .WillByDefault(Invoke([counter](uint8_t* buffer, size_t size) {
        std::fill(buffer, buffer + size, ++*counter);
        return true;
      }));
  return random_source;
}

// A sink which accepts a limited number of bytes, then fails.
class FailingFile : public File {
 public:
  explicit FailingFile(int64_t bytes_accepted)
      : File("failing"), bytes_accepted_(bytes_accepted) {}

  bool Close() override {
    delete this;
    return true;
  }
  int64_t Read(void*, uint64_t) override { return -1; }
  int64_t Write(const void*, uint64_t length) override {
    if (bytes_accepted_ <= 0)
      return -1;
    const int64_t bytes_written =
        std::min(static_cast<int64_t>(length), bytes_accepted_);
    bytes_accepted_ -= bytes_written;
    return bytes_written;
  }

 protected:
  bool Open() override { return true; }

 private:
  int64_t bytes_accepted_;
};

// Lowers the file size limit of the process while in scope, so that writes to
// regular files beyond |limit| bytes fail with EFBIG.
class ScopedFileSizeLimit {
 public:
  explicit ScopedFileSizeLimit(rlim_t limit) {
    old_handler_ = signal(SIGXFSZ, SIG_IGN);
    if (getrlimit(RLIMIT_FSIZE, &old_limit_) != 0)
      return;
    rlimit new_limit = old_limit_;
    new_limit.rlim_cur = limit;
    applied_ = setrlimit(RLIMIT_FSIZE, &new_limit) == 0;
  }

  ~ScopedFileSizeLimit() {
    if (applied_)
      setrlimit(RLIMIT_FSIZE, &old_limit_);
    signal(SIGXFSZ, old_handler_);
  }

  bool applied() const { return applied_; }

 private:
  rlimit old_limit_;
  sighandler_t old_handler_;
  bool applied_ = false;
};

}  // namespace

class KeyInfoTest : public testing::Test {
 protected:
  void SetUp() override {
    ASSERT_FALSE(temp_dir_.path().empty());
    params_.temp_dir = temp_dir_.path();
    ASSERT_OK(KeyInfo::Create(kUrl, params_, &key_info_));
    ASSERT_TRUE(key_info_);
  }

  void TearDown() override { key_info_.reset(); }

  File* OpenSink() { return File::Open(sink_.path().c_str(), "w"); }

  std::string ReadSink() {
    std::string contents;
    EXPECT_TRUE(File::ReadFileToString(sink_.path().c_str(), &contents));
    return contents;
  }

  TempDirectory temp_dir_;
  TempFile sink_;
  KeyInfoParams params_;
  std::unique_ptr<KeyInfo> key_info_;
};

TEST_F(KeyInfoTest, CreateGeneratesKeyFile) {
  EXPECT_EQ(kUrl, key_info_->url());
  EXPECT_EQ("", key_info_->iv());
  EXPECT_EQ("", key_info_->key_info_file());

  const std::vector<uint8_t> key = key_info_->GetKey();
  ASSERT_EQ(KeyInfo::kKeySize, key.size());

  const std::string& key_file = key_info_->key_file();
  EXPECT_TRUE(std::filesystem::u8path(key_file).is_absolute());
  EXPECT_TRUE(
      std::filesystem::is_regular_file(std::filesystem::u8path(key_file)));
  EXPECT_THAT(FileNameOf(key_file), StartsWith("hls_key_"));
  EXPECT_EQ(".bin", std::filesystem::u8path(key_file).extension().u8string());
  EXPECT_TRUE(std::filesystem::equivalent(
      std::filesystem::u8path(temp_dir_.path()),
      std::filesystem::u8path(key_file).parent_path()));
  EXPECT_EQ(1u, temp_dir_.CountEntries());

  ASSERT_FILE_STREQ(key_file.c_str(), std::string(key.begin(), key.end()));
}

TEST_F(KeyInfoTest, CreateInSystemTempDirectory) {
  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, KeyInfoParams(), &key_info));

  const std::string key_file = key_info->key_file();
  EXPECT_TRUE(std::filesystem::equivalent(
      std::filesystem::temp_directory_path(),
      std::filesystem::u8path(key_file).parent_path()));
  EXPECT_EQ(KeyInfo::kKeySize,
            std::filesystem::file_size(std::filesystem::u8path(key_file)));

  ASSERT_OK(key_info->Dispose());
  EXPECT_FALSE(FileExists(key_file));
}

TEST_F(KeyInfoTest, CustomFileNames) {
  params_.key_file_prefix = "custom_";
  params_.key_file_extension = ".key";
  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, params_, &key_info));

  const std::string name = FileNameOf(key_info->key_file());
  EXPECT_THAT(name, StartsWith("custom_"));
  EXPECT_EQ(".key", std::filesystem::u8path(name).extension().u8string());
}

TEST_F(KeyInfoTest, GetKeyReturnsCopy) {
  std::vector<uint8_t> key = key_info_->GetKey();
  const std::vector<uint8_t> original = key;
  for (uint8_t& byte : key)
    byte ^= 0xff;

  EXPECT_EQ(original, key_info_->GetKey());
  EXPECT_NE(key, key_info_->GetKey());
}

TEST_F(KeyInfoTest, TwoInstancesAreIndependent) {
  std::unique_ptr<KeyInfo> other;
  ASSERT_OK(KeyInfo::Create(kUrl, params_, &other));

  EXPECT_NE(key_info_->key_file(), other->key_file());
  EXPECT_NE(key_info_->GetKey(), other->GetKey());
  EXPECT_EQ(2u, temp_dir_.CountEntries());
}

TEST_F(KeyInfoTest, RandIvIsLowercaseHex) {
  key_info_->RandIv();

  const std::string& iv = key_info_->iv();
  ASSERT_EQ(32u, iv.size());
  for (char c : iv) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))
        << "Unexpected character '" << c << "' in " << iv;
  }
  EXPECT_TRUE(KeyInfo::IsValidIv(iv));
}

TEST_F(KeyInfoTest, RandIvChangesIv) {
  const std::string first_iv = key_info_->RandIv().iv();
  const std::string second_iv = key_info_->RandIv().iv();
  EXPECT_NE(first_iv, second_iv);
}

TEST_F(KeyInfoTest, SettersChain) {
  KeyInfo& result = key_info_->SetIv(kIv).SetKeyFile("/keys/key.bin").RandIv();
  EXPECT_EQ(key_info_.get(), &result);
  EXPECT_EQ("/keys/key.bin", key_info_->key_file());
  EXPECT_NE(kIv, key_info_->iv());
}

TEST_F(KeyInfoTest, SetIvAcceptsAnyString) {
  key_info_->SetIv("not a hex iv");
  EXPECT_EQ("not a hex iv", key_info_->iv());

  std::unique_ptr<File, FileCloser> sink(OpenSink());
  ASSERT_TRUE(sink);
  ASSERT_OK(key_info_->WriteTo(sink.get(), nullptr));
  sink.reset();
  EXPECT_EQ(absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n",
                         "not a hex iv\n"),
            ReadSink());
}

TEST_F(KeyInfoTest, WriteToWithIv) {
  key_info_->SetIv(kIv);

  std::unique_ptr<File, FileCloser> sink(OpenSink());
  ASSERT_TRUE(sink);
  int64_t bytes_written = 0;
  ASSERT_OK(key_info_->WriteTo(sink.get(), &bytes_written));
  sink.reset();

  const std::string contents = ReadSink();
  EXPECT_EQ(static_cast<int64_t>(contents.size()), bytes_written);

  std::vector<std::string> lines = absl::StrSplit(contents, '\n');
  ASSERT_EQ(4u, lines.size());
  EXPECT_EQ(kUrl, lines[0]);
  EXPECT_EQ(key_info_->key_file(), lines[1]);
  EXPECT_EQ(kIv, lines[2]);
  EXPECT_EQ("", lines[3]);
}

TEST_F(KeyInfoTest, WriteToWithoutIv) {
  std::unique_ptr<File, FileCloser> sink(OpenSink());
  ASSERT_TRUE(sink);
  int64_t bytes_written = 0;
  ASSERT_OK(key_info_->WriteTo(sink.get(), &bytes_written));
  sink.reset();

  const std::string expected =
      absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n");
  EXPECT_EQ(expected, ReadSink());
  EXPECT_EQ(static_cast<int64_t>(expected.size()), bytes_written);
}

TEST_F(KeyInfoTest, WriteToAfterClearingIv) {
  key_info_->SetIv(kIv).SetIv("");

  std::unique_ptr<File, FileCloser> sink(OpenSink());
  ASSERT_TRUE(sink);
  ASSERT_OK(key_info_->WriteTo(sink.get(), nullptr));
  sink.reset();

  EXPECT_EQ(absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n"), ReadSink());
}

TEST_F(KeyInfoTest, WriteToReportsBytesWrittenBeforeFailure) {
  const int64_t url_line_size = sizeof(kUrl);  // Includes room for '\n'.

  std::unique_ptr<File, FileCloser> sink(new FailingFile(url_line_size));
  int64_t bytes_written = 0;
  Status status = key_info_->WriteTo(sink.get(), &bytes_written);
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_THAT(status.error_message(), HasSubstr("key file"));
  EXPECT_EQ(url_line_size, bytes_written);
}

TEST_F(KeyInfoTest, WriteToReportsShortWrite) {
  const int64_t bytes_accepted = sizeof(kUrl) + 5;

  std::unique_ptr<File, FileCloser> sink(new FailingFile(bytes_accepted));
  int64_t bytes_written = 0;
  Status status = key_info_->WriteTo(sink.get(), &bytes_written);
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_EQ(bytes_accepted, bytes_written);
}

TEST_F(KeyInfoTest, WriteToFile) {
  TempFile output;
  key_info_->SetIv("abcdef1234567890abcdef1234567890");
  ASSERT_OK(key_info_->WriteToFile(output.path()));
  ASSERT_FILE_STREQ(output.path().c_str(),
                    absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n",
                                 "abcdef1234567890abcdef1234567890\n"));

  key_info_->SetIv("111222333444555666777888999000aa");
  ASSERT_OK(key_info_->WriteToFile(output.path()));
  ASSERT_FILE_STREQ(output.path().c_str(),
                    absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n",
                                 "111222333444555666777888999000aa\n"));

  // The caller's file is not tracked.
  EXPECT_EQ("", key_info_->key_info_file());
  ASSERT_OK(key_info_->Dispose());
  EXPECT_TRUE(FileExists(output.path()));
}

TEST_F(KeyInfoTest, WriteToFileFailsForDirectory) {
  Status status = key_info_->WriteToFile(temp_dir_.path());
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
}

TEST_F(KeyInfoTest, WriteToTemporaryFileReusesPath) {
  key_info_->SetIv(kIv);
  std::string path;
  ASSERT_OK(key_info_->WriteToTemporaryFile(&path));
  EXPECT_EQ(path, key_info_->key_info_file());
  EXPECT_THAT(FileNameOf(path), StartsWith("hls_keyinfo_"));
  EXPECT_EQ(".txt", std::filesystem::u8path(path).extension().u8string());
  ASSERT_FILE_STREQ(path.c_str(), absl::StrCat(kUrl, "\n",
                                               key_info_->key_file(), "\n",
                                               kIv, "\n"));

  key_info_->SetIv("abcdef1234567890abcdef1234567890");
  std::string second_path;
  ASSERT_OK(key_info_->WriteToTemporaryFile(&second_path));
  EXPECT_EQ(path, second_path);
  ASSERT_FILE_STREQ(path.c_str(),
                    absl::StrCat(kUrl, "\n", key_info_->key_file(), "\n",
                                 "abcdef1234567890abcdef1234567890\n"));

  // The key file and a single keyinfo file.
  EXPECT_EQ(2u, temp_dir_.CountEntries());
}

TEST_F(KeyInfoTest, DisposeRemovesGeneratedFiles) {
  const std::string key_file = key_info_->key_file();
  std::string key_info_file;
  ASSERT_OK(key_info_->WriteToTemporaryFile(&key_info_file));
  ASSERT_TRUE(FileExists(key_file));
  ASSERT_TRUE(FileExists(key_info_file));

  ASSERT_OK(key_info_->Dispose());
  EXPECT_FALSE(FileExists(key_file));
  EXPECT_FALSE(FileExists(key_info_file));
  EXPECT_EQ("", key_info_->key_file());
  EXPECT_EQ("", key_info_->key_info_file());
  EXPECT_EQ(0u, temp_dir_.CountEntries());
}

TEST_F(KeyInfoTest, DisposeTwice) {
  ASSERT_OK(key_info_->WriteToTemporaryFile(nullptr));
  ASSERT_OK(key_info_->Dispose());
  ASSERT_OK(key_info_->Dispose());
  EXPECT_EQ("", key_info_->key_file());
  EXPECT_EQ(0u, temp_dir_.CountEntries());
}

TEST_F(KeyInfoTest, DisposeIgnoresMissingFiles) {
  const std::string key_file = key_info_->key_file();
  ASSERT_TRUE(File::Delete(key_file.c_str()));
  EXPECT_OK(key_info_->Dispose());
}

TEST_F(KeyInfoTest, DisposeKeepsCallerKeyFile) {
  TempFile caller_key_file;
  const std::string generated_key_file = key_info_->key_file();

  key_info_->SetKeyFile(caller_key_file.path());
  EXPECT_EQ(caller_key_file.path(), key_info_->key_file());

  ASSERT_OK(key_info_->Dispose());
  EXPECT_TRUE(FileExists(caller_key_file.path()));
  // The superseded generated key file does not leak.
  EXPECT_FALSE(FileExists(generated_key_file));
  EXPECT_EQ("", key_info_->key_file());
}

TEST_F(KeyInfoTest, DisposeReportsEveryFailure) {
  const std::string key_file = key_info_->key_file();
  std::string key_info_file;
  ASSERT_OK(key_info_->WriteToTemporaryFile(&key_info_file));

  // Replace both files with non-empty directories, which cannot be removed.
  for (const std::string& path : {key_file, key_info_file}) {
    ASSERT_TRUE(File::Delete(path.c_str()));
    ASSERT_TRUE(File::WriteStringToFile((path + "/child").c_str(), "x"));
  }

  Status status = key_info_->Dispose();
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_THAT(status.error_message(), HasSubstr(key_file));
  EXPECT_THAT(status.error_message(), HasSubstr(key_info_file));
  EXPECT_EQ("", key_info_->key_file());
  EXPECT_EQ("", key_info_->key_info_file());

  // Nothing is tracked any more.
  EXPECT_OK(key_info_->Dispose());
}

TEST_F(KeyInfoTest, DestructorRemovesGeneratedFiles) {
  const std::string key_file = key_info_->key_file();
  std::string key_info_file;
  ASSERT_OK(key_info_->WriteToTemporaryFile(&key_info_file));

  key_info_.reset();
  EXPECT_FALSE(FileExists(key_file));
  EXPECT_FALSE(FileExists(key_info_file));
}

TEST(KeyInfoCreateTest, FailsOnRandomSourceFailure) {
  TempDirectory temp_dir;
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();

  auto random_source = std::make_unique<MockRandomSource>();
  EXPECT_CALL(*random_source, GenerateRandomBytes(_, KeyInfo::kKeySize))
      .WillOnce(Return(false));

  std::unique_ptr<KeyInfo> key_info;
  Status status =
      KeyInfo::Create(kUrl, params, std::move(random_source), &key_info);
  EXPECT_EQ(error::RANDOM_SOURCE_FAILURE, status.error_code());
  EXPECT_FALSE(key_info);
  EXPECT_EQ(0u, temp_dir.CountEntries());
}

TEST(KeyInfoCreateTest, FailsOnUnusableTempDirectory) {
  TempFile regular_file;
  KeyInfoParams params;
  params.temp_dir = regular_file.path() + "/subdir";

  std::unique_ptr<KeyInfo> key_info;
  Status status = KeyInfo::Create(kUrl, params, &key_info);
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_FALSE(key_info);
}

TEST(KeyInfoCreateTest, RetriesOnNameCollision) {
  TempDirectory temp_dir;
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();
  const std::string taken =
      temp_dir.path() + "/hls_key_0000000000000000.bin";
  ASSERT_TRUE(File::WriteStringToFile(taken.c_str(), "taken"));

  auto random_source = std::make_unique<MockRandomSource>();
  {
    InSequence in_sequence;
    EXPECT_CALL(*random_source, GenerateRandomBytes(_, KeyInfo::kKeySize))
        .WillOnce(Invoke(FillWith(0xaa)));
    EXPECT_CALL(*random_source, GenerateRandomBytes(_, 8))
        .WillOnce(Invoke(FillWith(0x00)))
        .WillOnce(Invoke(FillWith(0x01)));
  }

  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, params, std::move(random_source), &key_info));
  EXPECT_EQ("hls_key_0101010101010101.bin", FileNameOf(key_info->key_file()));
  EXPECT_EQ(std::vector<uint8_t>(KeyInfo::kKeySize, 0xaa), key_info->GetKey());
  ASSERT_FILE_STREQ(taken.c_str(), "taken");

  ASSERT_OK(key_info->Dispose());
  EXPECT_TRUE(FileExists(taken));
}

TEST(KeyInfoCreateTest, RetriesWhenNameIsTakenByDirectory) {
  TempDirectory temp_dir;
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();
  const std::string taken = temp_dir.path() + "/hls_key_0000000000000000.bin";
  ASSERT_TRUE(std::filesystem::create_directory(taken));

  auto random_source = std::make_unique<MockRandomSource>();
  {
    InSequence in_sequence;
    EXPECT_CALL(*random_source, GenerateRandomBytes(_, KeyInfo::kKeySize))
        .WillOnce(Invoke(FillWith(0xaa)));
    EXPECT_CALL(*random_source, GenerateRandomBytes(_, 8))
        .WillOnce(Invoke(FillWith(0x00)))
        .WillOnce(Invoke(FillWith(0x02)));
  }

  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, params, std::move(random_source), &key_info));
  EXPECT_EQ("hls_key_0202020202020202.bin", FileNameOf(key_info->key_file()));

  ASSERT_OK(key_info->Dispose());
  EXPECT_TRUE(std::filesystem::is_directory(taken));
  EXPECT_EQ(1u, temp_dir.CountEntries());
}

TEST(KeyInfoCreateTest, RemovesKeyFileWhenKeyCannotBeWritten) {
  TempDirectory temp_dir;
  ASSERT_FALSE(temp_dir.path().empty());
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();

  std::unique_ptr<KeyInfo> key_info;
  Status status;
  {
    ScopedFileSizeLimit no_file_content(0);
    ASSERT_TRUE(no_file_content.applied());
    status = KeyInfo::Create(kUrl, params, &key_info);
  }
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
  EXPECT_THAT(status.error_message(), HasSubstr(temp_dir.path()));
  EXPECT_FALSE(key_info);
  EXPECT_EQ(0u, temp_dir.CountEntries());
}

TEST(KeyInfoIvTest, RandIvFallsBackToZeroIv) {
  TempDirectory temp_dir;
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();

  auto random_source = CountingRandomSource();
  MockRandomSource* mock_random_source = random_source.get();
  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, params, std::move(random_source), &key_info));

  EXPECT_CALL(*mock_random_source, GenerateRandomBytes(_, KeyInfo::kIvSize))
      .WillOnce(Return(false));
  key_info->RandIv();
  EXPECT_EQ("00000000000000000000000000000000", key_info->iv());
}

TEST(KeyInfoIvTest, GenerateRandomIvReportsFailure) {
  TempDirectory temp_dir;
  KeyInfoParams params;
  params.temp_dir = temp_dir.path();

  auto random_source = CountingRandomSource();
  MockRandomSource* mock_random_source = random_source.get();
  std::unique_ptr<KeyInfo> key_info;
  ASSERT_OK(KeyInfo::Create(kUrl, params, std::move(random_source), &key_info));
  key_info->SetIv(kIv);

  EXPECT_CALL(*mock_random_source, GenerateRandomBytes(_, KeyInfo::kIvSize))
      .WillOnce(Return(false))
      .WillOnce(Invoke(FillWith(0x5c)));
  EXPECT_EQ(error::RANDOM_SOURCE_FAILURE,
            key_info->GenerateRandomIv().error_code());
  EXPECT_EQ(kIv, key_info->iv());

  ASSERT_OK(key_info->GenerateRandomIv());
  EXPECT_EQ("5c5c5c5c5c5c5c5c5c5c5c5c5c5c5c5c", key_info->iv());
}

TEST(KeyInfoIvTest, IsValidIv) {
  EXPECT_TRUE(KeyInfo::IsValidIv(kIv));
  EXPECT_TRUE(KeyInfo::IsValidIv("abcdef1234567890ABCDEF1234567890"));
  EXPECT_FALSE(KeyInfo::IsValidIv(""));
  EXPECT_FALSE(KeyInfo::IsValidIv("1234"));
  EXPECT_FALSE(KeyInfo::IsValidIv("123456789012345678901234567890123"));
  EXPECT_FALSE(KeyInfo::IsValidIv("g2345678901234567890123456789012"));
}

}  // namespace hlskey
