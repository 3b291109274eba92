// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_FILE_FILE_UTIL_H_
#define HLSKEY_FILE_FILE_UTIL_H_

#include <string>

namespace hlskey {

/// Builds an absolute path for a temporary file.
/// @param temp_dir is the directory to place the file in. The system temporary
///        directory is used if it is empty.
/// @param file_name is the name of the file inside the directory.
/// @param temp_file_path[out] receives the absolute path.
/// @return true on success, false if no temporary directory can be resolved.
bool TempFilePath(const std::string& temp_dir,
                  const std::string& file_name,
                  std::string* temp_file_path);

}  // namespace hlskey

#endif  // HLSKEY_FILE_FILE_UTIL_H_
