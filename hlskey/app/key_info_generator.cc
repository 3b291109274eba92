// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/app/key_info_generator.h>

#include <filesystem>
#include <memory>
#include <vector>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include <hlskey/file.h>
#include <hlskey/file/file_closer.h>
#include <hlskey/key_info.h>
#include <hlskey/macros/status.h>

namespace hlskey {
namespace {

// Replaces |path| with a new owner-only file holding |key|.
Status SaveKey(const std::vector<uint8_t>& key, const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(std::filesystem::u8path(path), ec)) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Cannot save the key to ", path,
                               ": it is a directory."));
  }
  // Exclusive creation sets owner-only permissions, which an existing file
  // would keep otherwise.
  if (!File::Delete(path.c_str())) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Cannot replace ", path, "."));
  }
  std::unique_ptr<File, FileCloser> file(File::Open(path.c_str(), "wx"));
  if (!file) {
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Cannot create ", path, "."));
  }

  const int64_t bytes_written = file->Write(key.data(), key.size());
  const bool written = bytes_written >= 0 &&
                       static_cast<size_t>(bytes_written) == key.size();
  const bool closed = file.release()->Close();
  if (!written || !closed) {
    if (!File::Delete(path.c_str()))
      LOG(WARNING) << "Failed to remove incomplete key file " << path;
    return Status(error::FILE_FAILURE,
                  absl::StrCat("Failed to save the key to ", path, "."));
  }
  return Status::OK;
}

Status WriteOutputs(const KeyInfoGeneratorOptions& options,
                    KeyInfo* key_info) {
  if (!options.iv.empty()) {
    key_info->SetIv(options.iv);
  } else if (options.random_iv) {
    RETURN_IF_ERROR(key_info->GenerateRandomIv());
  }

  RETURN_IF_ERROR(SaveKey(key_info->GetKey(), options.key_output));
  key_info->SetKeyFile(options.key_output);
  return key_info->WriteToFile(options.keyinfo_output);
}

}  // namespace

Status GenerateKeyInfo(const KeyInfoGeneratorOptions& options) {
  KeyInfoParams params;
  params.temp_dir = options.temp_dir;

  std::unique_ptr<KeyInfo> key_info;
  RETURN_IF_ERROR(KeyInfo::Create(options.key_uri, params, &key_info));

  Status status = WriteOutputs(options, key_info.get());
  status.Update(key_info->Dispose());
  if (status.ok())
    VLOG(1) << "Wrote " << options.keyinfo_output;
  return status;
}

}  // namespace hlskey
