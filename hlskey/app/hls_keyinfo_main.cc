// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <cstdio>
#include <iostream>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <hlskey/app/hls_keyinfo_flags.h>
#include <hlskey/app/key_info_generator.h>
#include <hlskey/app/vlog_flags.h>

ABSL_FLAG(bool, quiet, false, "When enabled, LOG(INFO) output is suppressed.");

namespace hlskey {
namespace {

const char kUsage[] =
    "%s --key_uri=<uri> --key_output=<path> --keyinfo_output=<path> "
    "[--iv=<hex> | --random_iv]\n\n"
    "  Generates a random AES-128 key and a keyinfo file for ffmpeg's\n"
    "  -hls_key_info_file option. The keyinfo file has the form:\n"
    "    <key uri>\n"
    "    <key file path>\n"
    "    <iv, optional>\n";

enum ExitStatus {
  kSuccess = 0,
  kArgumentValidationFailed,
  kGenerationFailed,
};

KeyInfoGeneratorOptions GetKeyInfoGeneratorOptions() {
  KeyInfoGeneratorOptions options;
  options.key_uri = absl::GetFlag(FLAGS_key_uri);
  options.key_output = absl::GetFlag(FLAGS_key_output);
  options.keyinfo_output = absl::GetFlag(FLAGS_keyinfo_output);
  options.iv = absl::GetFlag(FLAGS_iv);
  options.random_iv = absl::GetFlag(FLAGS_random_iv);
  options.temp_dir = absl::GetFlag(FLAGS_temp_dir);
  return options;
}

int HlsKeyInfoMain(int argc, char** argv) {
  auto usage = absl::StrFormat(kUsage, argv[0]);
  absl::SetProgramUsageMessage(usage);

  auto remaining_args = absl::ParseCommandLine(argc, argv);
  if (remaining_args.size() > 1) {
    std::cerr << "Usage: " << absl::ProgramUsageMessage();
    return kArgumentValidationFailed;
  }

  if (absl::GetFlag(FLAGS_quiet)) {
    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
  }

  handle_vlog_flags();

  absl::InitializeLog();

  if (!ValidateKeyInfoFlags()) {
    std::cerr << "Usage: " << absl::ProgramUsageMessage();
    return kArgumentValidationFailed;
  }

  Status status = GenerateKeyInfo(GetKeyInfoGeneratorOptions());
  if (!status.ok()) {
    LOG(ERROR) << "Keyinfo generation error: " << status.ToString();
    return kGenerationFailed;
  }
  if (!absl::GetFlag(FLAGS_quiet)) {
    printf("Wrote %s\n", absl::GetFlag(FLAGS_keyinfo_output).c_str());
  }
  return kSuccess;
}

}  // namespace
}  // namespace hlskey

int main(int argc, char** argv) {
  return hlskey::HlsKeyInfoMain(argc, argv);
}
