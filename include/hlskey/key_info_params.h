// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_PUBLIC_KEY_INFO_PARAMS_H_
#define HLSKEY_PUBLIC_KEY_INFO_PARAMS_H_

#include <string>

namespace hlskey {

/// Parameters controlling where KeyInfo places the files it generates.
struct KeyInfoParams {
  /// Directory for the generated key and keyinfo files. The system temporary
  /// directory is used if it is empty.
  std::string temp_dir;
  /// Name prefix and extension of the generated key file. A random hex
  /// string is inserted between them.
  std::string key_file_prefix = "hls_key_";
  std::string key_file_extension = ".bin";
  /// Name prefix and extension of the keyinfo file generated by
  /// KeyInfo::WriteToTemporaryFile.
  std::string key_info_file_prefix = "hls_keyinfo_";
  std::string key_info_file_extension = ".txt";
};

}  // namespace hlskey

#endif  // HLSKEY_PUBLIC_KEY_INFO_PARAMS_H_
