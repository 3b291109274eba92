// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/status.h>

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hlskey/macros/status.h>
#include <hlskey/status/status_test_util.h>

namespace hlskey {
namespace {

Status FailIf(bool fail) {
  return fail ? Status(error::FILE_FAILURE, "write failed") : Status::OK;
}

Status RunSteps(bool fail_first, int* steps_run) {
  RETURN_IF_ERROR(FailIf(fail_first));
  ++*steps_run;
  RETURN_IF_ERROR(FailIf(false));
  ++*steps_run;
  return Status::OK;
}

}  // namespace

TEST(StatusTest, DefaultIsOk) {
  EXPECT_OK(Status());
  EXPECT_EQ("OK", Status().ToString());
  EXPECT_EQ("", Status::OK.error_message());
}

TEST(StatusTest, OkCodeDropsMessage) {
  const Status status(error::OK, "ignored");
  EXPECT_TRUE(status.ok());
  EXPECT_EQ("", status.error_message());
  EXPECT_EQ(Status::OK, status);
}

TEST(StatusTest, ToStringNamesErrorCode) {
  EXPECT_EQ("1 (FILE_FAILURE): cannot open",
            Status(error::FILE_FAILURE, "cannot open").ToString());
  EXPECT_EQ("2 (RANDOM_SOURCE_FAILURE): no entropy",
            Status(error::RANDOM_SOURCE_FAILURE, "no entropy").ToString());
  EXPECT_EQ("3 (KEY_NOT_INITIALIZED): no key",
            Status(error::KEY_NOT_INITIALIZED, "no key").ToString());
}

TEST(StatusTest, StreamsToString) {
  std::ostringstream os;
  os << Status(error::FILE_FAILURE, "gone");
  EXPECT_EQ("1 (FILE_FAILURE): gone", os.str());
}

TEST(StatusTest, UpdateKeepsFirstError) {
  Status status;
  status.Update(Status::OK);
  EXPECT_OK(status);

  const Status first(error::FILE_FAILURE, "first");
  status.Update(first);
  status.Update(Status(error::RANDOM_SOURCE_FAILURE, "second"));
  status.Update(Status::OK);
  EXPECT_EQ(first, status);
}

TEST(StatusTest, EqualityComparesCodeAndMessage) {
  EXPECT_NE(Status(error::FILE_FAILURE, "message"),
            Status(error::KEY_NOT_INITIALIZED, "message"));
  EXPECT_NE(Status(error::FILE_FAILURE, "message"),
            Status(error::FILE_FAILURE, "another"));
  EXPECT_EQ(Status(error::FILE_FAILURE, "message"),
            Status(error::FILE_FAILURE, "message"));
}

TEST(StatusTest, ReturnIfErrorStopsAtFailure) {
  int steps_run = 0;
  EXPECT_EQ(error::FILE_FAILURE, RunSteps(true, &steps_run).error_code());
  EXPECT_EQ(0, steps_run);

  steps_run = 0;
  EXPECT_OK(RunSteps(false, &steps_run));
  EXPECT_EQ(2, steps_run);
}

}  // namespace hlskey
