// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Defines command line flags for keyinfo generation.

#include <hlskey/app/hls_keyinfo_flags.h>

#include <hlskey/app/validate_flag.h>
#include <hlskey/key_info.h>

ABSL_FLAG(std::string,
          key_uri,
          "",
          "The key URI written on the first line of the keyinfo file. Players "
          "fetch the key from this URI. It is written verbatim.");
ABSL_FLAG(std::string,
          key_output,
          "",
          "Path to save the generated 16-byte key to. The second line of the "
          "keyinfo file points at this path.");
ABSL_FLAG(std::string,
          keyinfo_output,
          "",
          "Path to save the keyinfo file to. Pass it to ffmpeg with "
          "-hls_key_info_file.");
ABSL_FLAG(std::string,
          iv,
          "",
          "IV as 32 hex characters, written on the third line of the keyinfo "
          "file. The line is omitted if neither --iv nor --random_iv is set.");
ABSL_FLAG(bool,
          random_iv,
          false,
          "Generate a random IV. Cannot be combined with --iv.");
ABSL_FLAG(std::string,
          temp_dir,
          "",
          "Directory for intermediate files. The system temporary directory is "
          "used if not specified.");

namespace hlskey {

bool ValidateKeyInfoFlags() {
  bool success = true;

  const char kGenerating[] = "generating a keyinfo file";
  if (!ValidateFlag("key_uri", absl::GetFlag(FLAGS_key_uri), true, false,
                    kGenerating)) {
    success = false;
  }
  if (!ValidateFlag("key_output", absl::GetFlag(FLAGS_key_output), true, false,
                    kGenerating)) {
    success = false;
  }
  if (!ValidateFlag("keyinfo_output", absl::GetFlag(FLAGS_keyinfo_output),
                    true, false, kGenerating)) {
    success = false;
  }

  const std::string iv = absl::GetFlag(FLAGS_iv);
  if (!ValidateFlag("iv", iv, !absl::GetFlag(FLAGS_random_iv), true,
                    "--random_iv is not set")) {
    success = false;
  }
  if (!ValidateHexFlag("iv", iv, KeyInfo::kIvSize))
    success = false;

  return success;
}

}  // namespace hlskey
