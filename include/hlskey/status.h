// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_PUBLIC_STATUS_H_
#define HLSKEY_PUBLIC_STATUS_H_

#include <ostream>
#include <string>

#include <hlskey/export.h>

namespace hlskey {

namespace error {

/// Error codes reported by KeyInfo.
enum Code {
  OK = 0,
  // A key or keyinfo file could not be created, written, closed or removed.
  FILE_FAILURE,
  // The entropy source did not deliver the requested bytes.
  RANDOM_SOURCE_FAILURE,
  // A keyinfo file was requested before the key existed.
  KEY_NOT_INITIALIZED,
};

}  // namespace error

/// Outcome of a KeyInfo operation: OK, or an error code with a message
/// naming the failed operation and file.
class HLSKEY_EXPORT Status {
 public:
  Status() : error_code_(error::OK) {}

  /// The message is dropped when @a error_code is OK.
  Status(error::Code error_code, const std::string& error_message);

  static const Status OK;

  /// Keeps the first error: replaces *this with @a new_status only if *this
  /// is OK.
  void Update(Status new_status);

  bool ok() const { return error_code_ == error::OK; }
  error::Code error_code() const { return error_code_; }
  const std::string& error_message() const { return error_message_; }

  bool operator==(const Status& other) const {
    return error_code_ == other.error_code_ &&
           error_message_ == other.error_message_;
  }
  bool operator!=(const Status& other) const { return !(*this == other); }

  /// @return "OK", or "<code> (<code name>): <message>".
  std::string ToString() const;

 private:
  error::Code error_code_;
  std::string error_message_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace hlskey

#endif  // HLSKEY_PUBLIC_STATUS_H_
