// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_APP_KEY_INFO_GENERATOR_H_
#define HLSKEY_APP_KEY_INFO_GENERATOR_H_

#include <string>

#include <hlskey/status.h>

namespace hlskey {

/// Inputs of one hls_keyinfo run.
struct KeyInfoGeneratorOptions {
  std::string key_uri;
  /// Caller path receiving the 16 key bytes, readable by the owner only.
  std::string key_output;
  /// Caller path receiving the keyinfo lines.
  std::string keyinfo_output;
  /// IV line written verbatim. Takes precedence over random_iv.
  std::string iv;
  bool random_iv = false;
  /// Directory for the intermediate key file. Empty for the system default.
  std::string temp_dir;
};

/// Generates a key, saves it to @a options.key_output and writes a keyinfo
/// file pointing at it to @a options.keyinfo_output. Intermediate files are
/// removed whatever the outcome.
Status GenerateKeyInfo(const KeyInfoGeneratorOptions& options);

}  // namespace hlskey

#endif  // HLSKEY_APP_KEY_INFO_GENERATOR_H_
