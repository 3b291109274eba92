// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Defines verbose logging flags.

#include <hlskey/app/vlog_flags.h>

#include <absl/log/globals.h>

ABSL_FLAG(int,
          v,
          0,
          "Show VLOG(n) messages for n <= this value, e.g. --v=1 traces key "
          "file creation.");

namespace hlskey {

void handle_vlog_flags() {
  const int vlog_level = absl::GetFlag(FLAGS_v);
  if (vlog_level > 0)
    absl::SetGlobalVLogLevel(vlog_level);
}

}  // namespace hlskey
