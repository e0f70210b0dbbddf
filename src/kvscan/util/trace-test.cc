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

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"
#include "kvscan/util/trace.h"

using std::string;
using std::thread;
using std::vector;

namespace kvscan {

class TraceTest : public KvScanTest {
};

TEST_F(TraceTest, TestBasic) {
  Trace t("scan of t1");
  t.Message("hello world, 1");
  t.Message("goodbye 2");
  ASSERT_EQ(2, t.num_entries());
  ASSERT_TRUE(t.End(Status::OK()));

  string result = t.DumpToString();
  ASSERT_STR_CONTAINS(result, "scan of t1");
  ASSERT_STR_CONTAINS(result, "hello world, 1");
  ASSERT_STR_CONTAINS(result, "goodbye 2");
  ASSERT_STR_CONTAINS(result, "ended: OK");
}

TEST_F(TraceTest, TestEndedOnce) {
  Trace t("scan");
  ASSERT_FALSE(t.ended());
  ASSERT_OK(t.final_status());
  ASSERT_TRUE(t.End(Status::TimedOut("deadline passed")));
  ASSERT_TRUE(t.ended());
  ASSERT_FALSE(t.End(Status::OK()));
  ASSERT_TRUE(t.final_status().IsTimedOut());

  // Messages after the end are dropped.
  t.Message("too late");
  ASSERT_EQ(0, t.num_entries());
  ASSERT_STR_NOT_CONTAINS(t.DumpToString(), "too late");
}

TEST_F(TraceTest, TestConcurrentMessages) {
  Trace t("scan");
  vector<thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&t, i]() {
      for (int j = 0; j < 100; j++) {
        t.Message("thread " + std::to_string(i) + " message " + std::to_string(j));
      }
    });
  }
  for (thread& th : threads) {
    th.join();
  }
  ASSERT_EQ(400, t.num_entries());
}

} // namespace kvscan
