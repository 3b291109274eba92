// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_PUBLIC_KEY_INFO_H_
#define HLSKEY_PUBLIC_KEY_INFO_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <hlskey/export.h>
#include <hlskey/key_info_params.h>
#include <hlskey/macros/classes.h>
#include <hlskey/status.h>

namespace hlskey {

class File;
class RandomSource;

/// Generates an AES-128 key and describes it in the keyinfo format consumed
/// by ffmpeg's -hls_key_info_file option:
///
///   <key URI>
///   <key file path>
///   <IV, optional>
///
/// Each line is terminated by a single '\n'. The key is written to a file in
/// the temporary directory on creation. The files created by a KeyInfo are
/// removed by Dispose(), which is also invoked on destruction.
///
/// A KeyInfo instance is not thread safe.
class HLSKEY_EXPORT KeyInfo {
 public:
  /// Size of the generated key and IV in bytes.
  static constexpr size_t kKeySize = 16;
  static constexpr size_t kIvSize = 16;

  /// Creates a KeyInfo with a fresh random key persisted to a new file.
  /// @param url is the key URI, stored verbatim.
  /// @param params selects the temporary directory and file names.
  /// @param[out] key_info receives the created instance on success.
  /// @return RANDOM_SOURCE_FAILURE if no random bytes are available,
  ///         FILE_FAILURE if the key file cannot be created or written. No
  ///         file is left behind on failure.
  static Status Create(const std::string& url,
                       const KeyInfoParams& params,
                       std::unique_ptr<KeyInfo>* key_info);

  /// Same as above, with the random source injected.
  static Status Create(const std::string& url,
                       const KeyInfoParams& params,
                       std::unique_ptr<RandomSource> random_source,
                       std::unique_ptr<KeyInfo>* key_info);

  /// Disposes the instance. Failures are logged; call Dispose() explicitly
  /// to observe them.
  ~KeyInfo();

  /// @return A copy of the key, or an empty vector if there is no key.
  std::vector<uint8_t> GetKey() const;

  /// Sets the IV line verbatim. An empty IV omits the line.
  KeyInfo& SetIv(const std::string& iv);

  /// Points the key file line at @a key_file. The caller owns @a key_file; it
  /// is never deleted by this instance. The generated key file is still
  /// removed by Dispose().
  KeyInfo& SetKeyFile(const std::string& key_file);

  /// Sets a random IV, as 32 lowercase hex characters. If the random source
  /// fails, an all-zero IV is set and a warning is logged. Use
  /// GenerateRandomIv() to fail instead.
  KeyInfo& RandIv();

  /// Sets a random IV, as 32 lowercase hex characters.
  /// @return RANDOM_SOURCE_FAILURE, leaving the IV unchanged, if the random
  ///         source fails.
  Status GenerateRandomIv();

  /// Removes the generated key file and the generated keyinfo file, if any.
  /// Files that no longer exist are not errors. key_file() is cleared
  /// whatever the outcome. Calling Dispose() again is a no-op.
  /// @return FILE_FAILURE listing every file that could not be removed.
  Status Dispose();

  /// Writes the keyinfo lines to @a sink.
  /// @param[out] bytes_written receives the number of bytes written before
  ///             any failure. Optional.
  Status WriteTo(File* sink, int64_t* bytes_written) const;

  /// Writes the keyinfo to a generated file in the temporary directory. The
  /// file is created on the first call and rewritten on later calls. It is
  /// removed by Dispose().
  /// @param[out] path receives the path of the keyinfo file. Optional.
  Status WriteToTemporaryFile(std::string* path);

  /// Writes the keyinfo to @a path, replacing any existing content. The file
  /// is owned by the caller.
  Status WriteToFile(const std::string& path) const;

  /// @return true if @a iv is 32 hexadecimal characters.
  static bool IsValidIv(const std::string& iv);

  const std::string& url() const { return url_; }
  const std::string& key_file() const { return key_file_; }
  const std::string& iv() const { return iv_; }
  /// @return The path of the generated keyinfo file, or an empty string.
  const std::string& key_info_file() const { return key_info_file_; }

 private:
  KeyInfo(const std::string& url,
          const KeyInfoParams& params,
          std::unique_ptr<RandomSource> random_source);

  Status GenerateKeyFile();
  Status CreateUniqueFile(const std::string& prefix,
                          const std::string& extension,
                          std::string* path,
                          File** file);
  Status CheckKey() const;
  // Writes the keyinfo lines to |file| and closes it.
  Status WriteAndClose(File* file) const;

  const std::string url_;
  const KeyInfoParams params_;
  std::unique_ptr<RandomSource> random_source_;
  std::vector<uint8_t> key_;
  std::string key_file_;
  std::string iv_;
  // Files created by this instance.
  std::string generated_key_file_;
  std::string key_info_file_;

  DISALLOW_COPY_AND_ASSIGN(KeyInfo);
};

}  // namespace hlskey

#endif  // HLSKEY_PUBLIC_KEY_INFO_H_
