// Copyright 2014 Google Inc. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Flag validation help functions.

#include <hlskey/app/validate_flag.h>

#include <stdio.h>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>

namespace hlskey {

void PrintError(const std::string& error_message) {
  fprintf(stderr, "ERROR: %s\n", error_message.c_str());
}

bool ValidateFlag(const char* flag_name,
                  const std::string& flag_value,
                  bool condition,
                  bool optional,
                  const char* label) {
  if (flag_value.empty()) {
    if (!optional && condition) {
      PrintError(absl::StrFormat("--%s is required if %s.", flag_name, label));
      return false;
    }
  } else if (!condition) {
    PrintError(absl::StrFormat("--%s should be specified only if %s.",
                               flag_name, label));
    return false;
  }
  return true;
}

bool ValidateHexFlag(const char* flag_name,
                     const std::string& flag_value,
                     size_t num_bytes) {
  if (flag_value.empty())
    return true;
  bool is_hex = flag_value.size() == num_bytes * 2;
  for (char c : flag_value)
    is_hex = is_hex && absl::ascii_isxdigit(c);
  if (!is_hex) {
    PrintError(absl::StrFormat("--%s should be %d hex characters, got '%s'.",
                               flag_name, num_bytes * 2, flag_value));
    return false;
  }
  return true;
}

}  // namespace hlskey
