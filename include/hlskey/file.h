// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_PUBLIC_FILE_H_
#define HLSKEY_PUBLIC_FILE_H_

#include <cstdint>
#include <string>

#include <hlskey/export.h>
#include <hlskey/macros/classes.h>

namespace hlskey {

/// Optional prefix of local file names.
extern const char kLocalFilePrefix[];

/// Byte stream the key and keyinfo files are written through. Instances are
/// created by Open() and released by Close().
class HLSKEY_EXPORT File {
 public:
  /// Opens a local file. A leading kLocalFilePrefix is stripped.
  /// @param mode is "r" to read, "w" to create or truncate, or "wx" to create
  ///        a file which must not exist yet, readable and writable by the
  ///        owner only. Write modes create missing parent directories.
  /// @return The opened file, or NULL on failure.
  static File* Open(const char* file_name, const char* mode);

  /// @return true if the file was removed or did not exist.
  static bool Delete(const char* file_name);

  /// @return true if anything exists at @a file_name, whatever its type.
  static bool Exists(const char* file_name);

  /// Appends the whole content of @a file_name to @a contents.
  static bool ReadFileToString(const char* file_name, std::string* contents);

  /// Creates or truncates @a file_name and writes @a contents to it.
  static bool WriteStringToFile(const char* file_name,
                                const std::string& contents);

  /// Closes the file and deletes this object, whatever the outcome.
  /// @return false if buffered data could not be written out.
  virtual bool Close() = 0;

  /// @return Number of bytes read, 0 at end of file, or < 0 on error.
  virtual int64_t Read(void* buffer, uint64_t length) = 0;

  /// @return Number of bytes written, or < 0 on error.
  virtual int64_t Write(const void* buffer, uint64_t length) = 0;

  /// @return The file name without kLocalFilePrefix.
  const std::string& file_name() const { return file_name_; }

 protected:
  explicit File(const std::string& file_name) : file_name_(file_name) {}
  /// Use Close() instead.
  virtual ~File() {}

  virtual bool Open() = 0;

 private:
  std::string file_name_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

}  // namespace hlskey

#endif  // HLSKEY_PUBLIC_FILE_H_
