// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Defines command line flags for keyinfo generation.

#ifndef HLSKEY_APP_HLS_KEYINFO_FLAGS_H_
#define HLSKEY_APP_HLS_KEYINFO_FLAGS_H_

#include <string>

#include <absl/flags/declare.h>
#include <absl/flags/flag.h>

ABSL_DECLARE_FLAG(std::string, key_uri);
ABSL_DECLARE_FLAG(std::string, key_output);
ABSL_DECLARE_FLAG(std::string, keyinfo_output);
ABSL_DECLARE_FLAG(std::string, iv);
ABSL_DECLARE_FLAG(bool, random_iv);
ABSL_DECLARE_FLAG(std::string, temp_dir);

namespace hlskey {

/// Validate keyinfo generation flags.
/// @return true on success, false otherwise.
bool ValidateKeyInfoFlags();

}  // namespace hlskey

#endif  // HLSKEY_APP_HLS_KEYINFO_FLAGS_H_
