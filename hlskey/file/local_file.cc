// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file/local_file.h>

#if !defined(OS_WIN)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif  // !defined(OS_WIN)

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <absl/log/check.h>
#include <absl/log/log.h>

namespace hlskey {
namespace {

bool CreateParentDirectories(const std::filesystem::path& file_path) {
  const auto parent_path = file_path.parent_path();
  if (parent_path.empty())
    return true;
  std::error_code ec;
  if (std::filesystem::is_directory(parent_path, ec))
    return true;
  std::filesystem::create_directories(parent_path, ec);
  if (ec) {
    LOG(ERROR) << "Cannot create directory " << parent_path << ": "
               << ec.message();
    return false;
  }
  return true;
}

}  // namespace

LocalFile::LocalFile(const char* file_name, const char* mode)
    : File(file_name), file_mode_(mode), internal_file_(NULL) {}

LocalFile::~LocalFile() {}

bool LocalFile::Close() {
  bool result = true;
  if (internal_file_) {
    result = fclose(internal_file_) == 0;
    if (!result)
      LOG(ERROR) << "fclose " << file_name() << ": " << strerror(errno);
    internal_file_ = NULL;
  }
  delete this;
  return result;
}

int64_t LocalFile::Read(void* buffer, uint64_t length) {
  DCHECK(buffer);
  DCHECK(internal_file_);
  const size_t bytes_read = fread(buffer, 1, length, internal_file_);
  if (bytes_read == 0 && ferror(internal_file_))
    return -1;
  return bytes_read;
}

int64_t LocalFile::Write(const void* buffer, uint64_t length) {
  DCHECK(buffer);
  DCHECK(internal_file_);
  const size_t bytes_written = fwrite(buffer, 1, length, internal_file_);
  VLOG(2) << "Wrote " << bytes_written << " of " << length << " bytes to "
          << file_name();
  if (bytes_written == 0 && ferror(internal_file_))
    return -1;
  return bytes_written;
}

bool LocalFile::Open() {
  const auto file_path = std::filesystem::u8path(file_name());
  const bool writing = file_mode_.find('w') != std::string::npos;
  if (writing && !CreateParentDirectories(file_path))
    return false;

  if (file_mode_.find('x') != std::string::npos)
    return OpenExclusive();

  // Binary mode, so that key bytes are written unchanged on every platform.
  const std::string mode = writing ? "wb" : "rb";
  internal_file_ = fopen(file_path.u8string().c_str(), mode.c_str());
  return internal_file_ != NULL;
}

bool LocalFile::OpenExclusive() {
  const std::string path = std::filesystem::u8path(file_name()).u8string();
#if defined(OS_WIN)
  internal_file_ = fopen(path.c_str(), "wbx");
  return internal_file_ != NULL;
#else
  const int fd =
      open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    VLOG(1) << "Cannot create " << path << " exclusively: "
            << strerror(errno);
    return false;
  }
  internal_file_ = fdopen(fd, "wb");
  if (!internal_file_) {
    LOG(ERROR) << "fdopen " << path << ": " << strerror(errno);
    close(fd);
    return false;
  }
  return true;
#endif  // defined(OS_WIN)
}

bool LocalFile::Delete(const char* file_name) {
  std::error_code ec;
  // A missing file is not an error: remove() reports it through its return
  // value only.
  std::filesystem::remove(std::filesystem::u8path(file_name), ec);
  if (ec) {
    LOG(ERROR) << "Cannot delete " << file_name << ": " << ec.message();
    return false;
  }
  return true;
}

}  // namespace hlskey
