// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file.h>

#include <filesystem>
#include <memory>
#include <string_view>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/match.h>

#include <hlskey/file/file_closer.h>
#include <hlskey/file/local_file.h>

namespace hlskey {

const char kLocalFilePrefix[] = "file://";

namespace {

const char* StripLocalFilePrefix(const char* file_name) {
  DCHECK(file_name);
  if (absl::StartsWith(file_name, kLocalFilePrefix))
    return file_name + std::string_view(kLocalFilePrefix).size();
  return file_name;
}

}  // namespace

File* File::Open(const char* file_name, const char* mode) {
  std::unique_ptr<File, FileCloser> file(
      new LocalFile(StripLocalFilePrefix(file_name), mode));
  if (!file->Open()) {
    // The handle never opened, so Close() only releases the object.
    file.release()->Close();
    return NULL;
  }
  return file.release();
}

bool File::Delete(const char* file_name) {
  return LocalFile::Delete(StripLocalFilePrefix(file_name));
}

bool File::Exists(const char* file_name) {
  std::error_code ec;
  // symlink_status so that a dangling link still counts as taken.
  const auto status = std::filesystem::symlink_status(
      std::filesystem::u8path(StripLocalFilePrefix(file_name)), ec);
  return !ec && std::filesystem::exists(status);
}

bool File::ReadFileToString(const char* file_name, std::string* contents) {
  DCHECK(contents);

  std::unique_ptr<File, FileCloser> file(File::Open(file_name, "r"));
  if (!file)
    return false;

  char buffer[0x1000];
  int64_t bytes_read;
  while ((bytes_read = file->Read(buffer, sizeof(buffer))) > 0)
    contents->append(buffer, bytes_read);
  return bytes_read == 0;
}

bool File::WriteStringToFile(const char* file_name,
                             const std::string& contents) {
  std::unique_ptr<File, FileCloser> file(File::Open(file_name, "w"));
  if (!file) {
    LOG(ERROR) << "Cannot open " << file_name << " for writing.";
    return false;
  }
  const int64_t bytes_written = file->Write(contents.data(), contents.size());
  if (bytes_written < 0 ||
      static_cast<size_t>(bytes_written) != contents.size()) {
    LOG(ERROR) << "Wrote " << bytes_written << " of " << contents.size()
               << " bytes to " << file_name << ".";
    return false;
  }
  if (!file.release()->Close()) {
    LOG(ERROR) << "Cannot close " << file_name << ".";
    return false;
  }
  return true;
}

}  // namespace hlskey
