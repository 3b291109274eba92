// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/key_info.h>

#include <algorithm>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/string_view.h>

#include <hlskey/crypto/random_source.h>
#include <hlskey/file.h>
#include <hlskey/file/file_closer.h>
#include <hlskey/file/file_util.h>
#include <hlskey/macros/logging.h>
#include <hlskey/macros/status.h>

namespace hlskey {
namespace {

// Attempts to find an unused generated file name before giving up.
const int kMaxUniqueFileAttempts = 16;
// Random bytes in a generated file name, hex encoded.
const size_t kFileNameRandomBytes = 8;
const char kZeroIv[] = "00000000000000000000000000000000";

std::string BytesToHex(const std::vector<uint8_t>& bytes) {
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

Status WriteLine(File* sink,
                 const std::string& line,
                 const char* line_name,
                 int64_t* total_bytes_written) {
  const std::string data = line + "\n";
  const int64_t bytes_written = sink->Write(data.data(), data.size());
  if (bytes_written < 0) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Failed to write the ", line_name, " line to ",
                               sink->file_name(), "."));
  }
  *total_bytes_written += bytes_written;
  if (static_cast<size_t>(bytes_written) != data.size()) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Short write of the ", line_name, " line to ",
                               sink->file_name(), ": wrote ", bytes_written,
                               " of ", data.size(), " bytes."));
  }
  return Status::OK;
}

}  // namespace

KeyInfo::KeyInfo(const std::string& url,
                 const KeyInfoParams& params,
                 std::unique_ptr<RandomSource> random_source)
    : url_(url), params_(params), random_source_(std::move(random_source)) {}

KeyInfo::~KeyInfo() {
  Status status = Dispose();
  if (!status.ok())
    LOG(WARNING) << "Failed to clean up keyinfo files: " << status;
}

Status KeyInfo::Create(const std::string& url,
                       const KeyInfoParams& params,
                       std::unique_ptr<KeyInfo>* key_info) {
  return Create(url, params,
                std::unique_ptr<RandomSource>(new EntropyRandomSource),
                key_info);
}

Status KeyInfo::Create(const std::string& url,
                       const KeyInfoParams& params,
                       std::unique_ptr<RandomSource> random_source,
                       std::unique_ptr<KeyInfo>* key_info) {
  DCHECK(random_source);
  DCHECK(key_info);

  std::unique_ptr<KeyInfo> instance(
      new KeyInfo(url, params, std::move(random_source)));
  RETURN_IF_ERROR(instance->GenerateKeyFile());

  VLOG(1) << "Generated key file " << instance->key_file() << " for "
          << instance->url();
  *key_info = std::move(instance);
  return Status::OK;
}

Status KeyInfo::GenerateKeyFile() {
  std::vector<uint8_t> key;
  if (!random_source_->GenerateRandomBytes(kKeySize, &key))
    return Status(error::RANDOM_SOURCE_FAILURE, "Failed to generate the key.");

  std::string path;
  File* file = nullptr;
  RETURN_IF_ERROR(CreateUniqueFile(params_.key_file_prefix,
                                   params_.key_file_extension, &path, &file));
  std::unique_ptr<File, FileCloser> key_file(file);

  Status status;
  const int64_t bytes_written = key_file->Write(key.data(), key.size());
  if (bytes_written < 0 || static_cast<size_t>(bytes_written) != key.size()) {
    status = Status(error::FILE_FAILURE,
                    absl::StrCat("Failed to write the key to ", path, "."));
    key_file.reset();
  } else if (!key_file.release()->Close()) {
    status = Status(error::FILE_FAILURE,
                    absl::StrCat("Failed to close key file ", path, "."));
  }

  if (!status.ok()) {
    if (!File::Delete(path.c_str()))
      LOG(WARNING) << "Failed to remove incomplete key file " << path;
    return status;
  }

  key_ = std::move(key);
  key_file_ = path;
  generated_key_file_ = path;
  return Status::OK;
}

Status KeyInfo::CreateUniqueFile(const std::string& prefix,
                                 const std::string& extension,
                                 std::string* path,
                                 File** file) {
  for (int attempt = 0; attempt < kMaxUniqueFileAttempts; ++attempt) {
    std::vector<uint8_t> name_bytes;
    if (!random_source_->GenerateRandomBytes(kFileNameRandomBytes,
                                             &name_bytes)) {
      return Status(error::RANDOM_SOURCE_FAILURE,
                    "Failed to generate a temporary file name.");
    }

    std::string candidate;
    if (!TempFilePath(params_.temp_dir,
                      absl::StrCat(prefix, BytesToHex(name_bytes), extension),
                      &candidate)) {
      return Status(error::FILE_FAILURE,
                    "Cannot resolve the temporary directory.");
    }

    *file = File::Open(candidate.c_str(), "wx");
    if (*file) {
      *path = candidate;
      return Status::OK;
    }
    // Only a name collision is worth another attempt.
    if (!File::Exists(candidate.c_str())) {
      return Status(error::FILE_FAILURE,
                    absl::StrCat("Failed to create ", candidate, "."));
    }
    VLOG(1) << candidate << " already exists.";
  }
  return Status(error::FILE_FAILURE,
                absl::StrCat("Failed to find an unused file name in ",
                             params_.temp_dir.empty() ? "the temporary directory"
                                                      : params_.temp_dir,
                             "."));
}

std::vector<uint8_t> KeyInfo::GetKey() const {
  if (key_.size() != kKeySize)
    return std::vector<uint8_t>();
  return key_;
}

KeyInfo& KeyInfo::SetIv(const std::string& iv) {
  if (!iv.empty() && !IsValidIv(iv))
    VLOG(1) << "IV '" << iv << "' is not 32 hex characters.";
  iv_ = iv;
  return *this;
}

KeyInfo& KeyInfo::SetKeyFile(const std::string& key_file) {
  key_file_ = key_file;
  return *this;
}

KeyInfo& KeyInfo::RandIv() {
  Status status = GenerateRandomIv();
  if (!status.ok()) {
    LOG(WARNING) << "Using an all-zero IV: " << status;
    iv_ = kZeroIv;
  }
  return *this;
}

Status KeyInfo::GenerateRandomIv() {
  std::vector<uint8_t> iv;
  if (!random_source_->GenerateRandomBytes(kIvSize, &iv)) {
    return Status(error::RANDOM_SOURCE_FAILURE,
                  "Failed to generate a random IV.");
  }
  iv_ = BytesToHex(iv);
  return Status::OK;
}

Status KeyInfo::Dispose() {
  std::vector<std::string> failed_files;

  if (!generated_key_file_.empty()) {
    if (!File::Delete(generated_key_file_.c_str()))
      failed_files.push_back("key file " + generated_key_file_);
    generated_key_file_.clear();
  }
  key_file_.clear();

  if (!key_info_file_.empty()) {
    if (!File::Delete(key_info_file_.c_str()))
      failed_files.push_back("keyinfo file " + key_info_file_);
    key_info_file_.clear();
  }

  if (!failed_files.empty()) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Failed to delete ",
                               absl::StrJoin(failed_files, ", "), "."));
  }
  return Status::OK;
}

Status KeyInfo::WriteTo(File* sink, int64_t* bytes_written) const {
  DCHECK(sink);

  int64_t total_bytes_written = 0;
  Status status = WriteLine(sink, url_, "URL", &total_bytes_written);
  if (status.ok())
    status = WriteLine(sink, key_file_, "key file", &total_bytes_written);
  if (status.ok() && !iv_.empty())
    status = WriteLine(sink, iv_, "IV", &total_bytes_written);

  if (bytes_written)
    *bytes_written = total_bytes_written;
  return status;
}

Status KeyInfo::WriteAndClose(File* file) const {
  std::unique_ptr<File, FileCloser> closer(file);
  const std::string file_name = file->file_name();
  RETURN_IF_ERROR(WriteTo(file, nullptr));
  if (!closer.release()->Close()) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Failed to close ", file_name, "."));
  }
  return Status::OK;
}

Status KeyInfo::WriteToTemporaryFile(std::string* path) {
  RETURN_IF_ERROR(CheckKey());

  std::string key_info_path = key_info_file_;
  const bool created = key_info_path.empty();
  File* file = nullptr;
  if (created) {
    RETURN_IF_ERROR(CreateUniqueFile(params_.key_info_file_prefix,
                                     params_.key_info_file_extension,
                                     &key_info_path, &file));
  } else {
    file = File::Open(key_info_path.c_str(), "w");
    if (!file) {
      return Status(error::FILE_FAILURE,
                    absl::StrCat("Cannot open ", key_info_path, "."));
    }
  }

  Status status = WriteAndClose(file);
  if (!status.ok()) {
    if (created && !File::Delete(key_info_path.c_str()))
      LOG(WARNING) << "Failed to remove incomplete keyinfo file "
                   << key_info_path;
    return status;
  }

  key_info_file_ = key_info_path;
  if (path)
    *path = key_info_path;
  return Status::OK;
}

Status KeyInfo::WriteToFile(const std::string& path) const {
  RETURN_IF_ERROR(CheckKey());

  File* file = File::Open(path.c_str(), "w");
  if (!file)
    return Status(error::FILE_FAILURE, absl::StrCat("Cannot open ", path, "."));
  return WriteAndClose(file);
}

Status KeyInfo::CheckKey() const {
  if (key_.size() != kKeySize) {
    return Status(error::KEY_NOT_INITIALIZED,
                  absl::StrCat("Expecting a ", kKeySize, "-byte key, got ",
                               key_.size(), " bytes."));
  }
  return Status::OK;
}

bool KeyInfo::IsValidIv(const std::string& iv) {
  return iv.size() == kIvSize * 2 &&
         std::all_of(iv.begin(), iv.end(),
                     [](char c) { return absl::ascii_isxdigit(c); });
}

}  // namespace hlskey
