// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_STATUS_TEST_UTIL_H_
#define HLSKEY_STATUS_TEST_UTIL_H_

#include <gtest/gtest.h>

#include <hlskey/status.h>

#define EXPECT_OK(val) EXPECT_EQ(hlskey::Status::OK, (val))
#define ASSERT_OK(val) ASSERT_EQ(hlskey::Status::OK, (val))
#define EXPECT_NOT_OK(val) EXPECT_NE(hlskey::Status::OK, (val))
#define ASSERT_NOT_OK(val) ASSERT_NE(hlskey::Status::OK, (val))

#endif  // HLSKEY_STATUS_TEST_UTIL_H_
