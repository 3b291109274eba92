// Copyright 2022 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_FLAG_SAVER_H_
#define HLSKEY_FLAG_SAVER_H_

#include <absl/flags/flag.h>

namespace hlskey {

/// An RAII object to save and restore the value of a command-line flag during
/// a test. Each flag to be restored needs its own FlagSaver.
template <typename T>
class FlagSaver {
 public:
  explicit FlagSaver(absl::Flag<T>* flag)
      : flag_(flag), original_value_(absl::GetFlag(*flag)) {}

  ~FlagSaver() { absl::SetFlag(flag_, original_value_); }

 private:
  absl::Flag<T>* flag_;  // unowned
  T original_value_;
};

}  // namespace hlskey

#endif  // HLSKEY_FLAG_SAVER_H_
