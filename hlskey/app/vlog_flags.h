// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_APP_VLOG_FLAGS_H_
#define HLSKEY_APP_VLOG_FLAGS_H_

#include <absl/flags/declare.h>
#include <absl/flags/flag.h>

ABSL_DECLARE_FLAG(int, v);

namespace hlskey {
void handle_vlog_flags();
}

#endif  // HLSKEY_APP_VLOG_FLAGS_H_
