// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "kvscan/util/status.h"
#include "kvscan/util/test_macros.h"

using std::string;

namespace kvscan {

TEST(StatusTest, TestPosixCode) {
  Status ok = Status::OK();
  ASSERT_EQ(-1, ok.posix_code());
  Status file_error = Status::IOError("file error", Slice(), 20);
  ASSERT_EQ(20, file_error.posix_code());
}

TEST(StatusTest, TestToString) {
  Status file_error = Status::IOError("file error", Slice(), 20);
  ASSERT_EQ(string("IO error: file error (error 20)"), file_error.ToString());
  ASSERT_EQ("OK", Status::OK().ToString());
  ASSERT_EQ("Timed out: scan: 3 attempts", Status::TimedOut("scan", "3 attempts").ToString());
}

TEST(StatusTest, TestClonePrepend) {
  Status file_error = Status::IOError("file error", "msg2", 20);
  Status appended = file_error.CloneAndPrepend("Heading");
  ASSERT_EQ(string("IO error: Heading: file error: msg2 (error 20)"), appended.ToString());
}

TEST(StatusTest, TestCloneAppend) {
  Status remote = Status::RemoteError("NotServingRegionException");
  Status appended = remote.CloneAndAppend("after 2 attempt(s)");
  ASSERT_TRUE(appended.IsRemoteError());
  ASSERT_EQ("Remote error: NotServingRegionException: after 2 attempt(s)",
            appended.ToString());
  ASSERT_EQ("NotServingRegionException: after 2 attempt(s)", appended.message().ToString());
}

TEST(StatusTest, TestMessageFromByteSlices) {
  const uint8_t row[] = { 'r', 'o', 'w', '-', '1', 'x' };
  const uint8_t detail[] = { 'g', 'o', 'n', 'e', '\0', 'z' };
  Status s = Status::NotFound(Slice(row, 5), Slice(detail, 5));
  ASSERT_TRUE(s.IsNotFound());
  ASSERT_EQ(string("row-1: gone\0", 12), s.message().ToString());
}

TEST(StatusTest, TestCloneOfOkIsOk) {
  ASSERT_OK(Status::OK().CloneAndPrepend("ignored"));
  ASSERT_OK(Status::OK().CloneAndAppend("ignored"));
}

TEST(StatusTest, TestPredicates) {
  ASSERT_TRUE(Status::NetworkError("x").IsNetworkError());
  ASSERT_TRUE(Status::ServiceUnavailable("x").IsServiceUnavailable());
  ASSERT_TRUE(Status::IllegalState("x").IsIllegalState());
  ASSERT_FALSE(Status::Corruption("x").IsNotSupported());
  ASSERT_EQ("Not implemented", Status::NotSupported("x").CodeAsString());
}

namespace {

Status ReturnNotOk(const Status& s) {
  RETURN_NOT_OK_PREPEND(s, "outer");
  return Status::OK();
}

} // anonymous namespace

TEST(StatusTest, TestReturnNotOkPrepend) {
  ASSERT_OK(ReturnNotOk(Status::OK()));
  Status s = ReturnNotOk(Status::Aborted("inner"));
  ASSERT_TRUE(s.IsAborted());
  ASSERT_EQ("Aborted: outer: inner", s.ToString());
}

} // namespace kvscan
