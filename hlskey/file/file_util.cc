// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file/file_util.h>

#include <filesystem>

#include <absl/log/check.h>
#include <absl/log/log.h>

namespace hlskey {

bool TempFilePath(const std::string& temp_dir,
                  const std::string& file_name,
                  std::string* temp_file_path) {
  DCHECK(temp_file_path);
  std::error_code ec;
  std::filesystem::path temp_dir_path;

  if (temp_dir.empty()) {
    temp_dir_path = std::filesystem::temp_directory_path(ec);
    if (ec) {
      LOG(ERROR) << "Cannot resolve the system temporary directory, error: "
                 << ec;
      return false;
    }
  } else {
    temp_dir_path = std::filesystem::u8path(temp_dir);
  }

  temp_dir_path = std::filesystem::absolute(temp_dir_path, ec);
  if (ec) {
    LOG(ERROR) << "Cannot resolve an absolute path for " << temp_dir
               << ", error: " << ec;
    return false;
  }

  *temp_file_path =
      (temp_dir_path / std::filesystem::u8path(file_name)).u8string();
  return true;
}

}  // namespace hlskey
