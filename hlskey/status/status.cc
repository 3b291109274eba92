// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/status.h>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <hlskey/macros/logging.h>

namespace hlskey {
namespace {

const char* CodeName(error::Code error_code) {
  switch (error_code) {
    case error::OK:
      return "OK";
    case error::FILE_FAILURE:
      return "FILE_FAILURE";
    case error::RANDOM_SOURCE_FAILURE:
      return "RANDOM_SOURCE_FAILURE";
    case error::KEY_NOT_INITIALIZED:
      return "KEY_NOT_INITIALIZED";
  }
  NOTIMPLEMENTED() << "No name for error code " << static_cast<int>(error_code);
  return "UNNAMED";
}

}  // namespace

const Status Status::OK;

Status::Status(error::Code error_code, const std::string& error_message)
    : error_code_(error_code) {
  if (ok())
    return;
  error_message_ = error_message;
  VLOG(1) << "Status " << ToString();
}

void Status::Update(Status new_status) {
  if (ok())
    *this = std::move(new_status);
}

std::string Status::ToString() const {
  if (ok())
    return "OK";
  return absl::StrFormat("%d (%s): %s", static_cast<int>(error_code_),
                         CodeName(error_code_), error_message_);
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.ToString();
}

}  // namespace hlskey
