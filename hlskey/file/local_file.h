// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_FILE_LOCAL_FILE_H_
#define HLSKEY_FILE_LOCAL_FILE_H_

#include <cstdint>
#include <cstdio>
#include <string>

#include <hlskey/file.h>
#include <hlskey/macros/classes.h>

namespace hlskey {

/// Implement LocalFile which deals with local storage.
class LocalFile : public File {
 public:
  /// @param mode is an fopen mode. "wx" creates the file exclusively,
  ///        readable and writable by the owner only.
  LocalFile(const char* file_name, const char* mode);

  /// @name File implementation overrides.
  /// @{
  bool Close() override;
  int64_t Read(void* buffer, uint64_t length) override;
  int64_t Write(const void* buffer, uint64_t length) override;
  /// @}

  /// @return true if the file was deleted or did not exist.
  static bool Delete(const char* file_name);

 protected:
  ~LocalFile() override;

  bool Open() override;

 private:
  bool OpenExclusive();

  std::string file_mode_;
  FILE* internal_file_;

  DISALLOW_COPY_AND_ASSIGN(LocalFile);
};

}  // namespace hlskey

#endif  // HLSKEY_FILE_LOCAL_FILE_H_
