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

#include "kvscan/rpc/timer_thread.h"

#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/util/countdown_latch.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::lock_guard;
using std::mutex;
using std::vector;

namespace kvscan {
namespace rpc {

class TimerThreadTest : public KvScanTest {
 protected:
  void SetUp() override {
    KvScanTest::SetUp();
    ASSERT_OK(timer_.Start());
  }

  void TearDown() override {
    timer_.Shutdown();
    KvScanTest::TearDown();
  }

  // Schedules a task which records 'id' once it ran.
  void ScheduleRecording(int id, const MonoDelta& delay, CountDownLatch* latch) {
    timer_.Schedule([this, id, latch](const Status& s) {
      CHECK_OK(s);
      {
        lock_guard<mutex> l(lock_);
        order_.push_back(id);
      }
      latch->CountDown();
    }, delay);
  }

  TimerThread timer_;
  mutex lock_;
  vector<int> order_;
};

TEST_F(TimerThreadTest, TestTasksRunInDueOrder) {
  CountDownLatch latch(3);
  ScheduleRecording(30, MonoDelta::FromMilliseconds(30), &latch);
  ScheduleRecording(10, MonoDelta::FromMilliseconds(10), &latch);
  ScheduleRecording(20, MonoDelta::FromMilliseconds(20), &latch);
  ASSERT_TRUE(latch.WaitFor(MonoDelta::FromSeconds(10)));
  lock_guard<mutex> l(lock_);
  ASSERT_EQ(vector<int>({ 10, 20, 30 }), order_);
}

TEST_F(TimerThreadTest, TestSameDueTimeRunsInSchedulingOrder) {
  CountDownLatch latch(5);
  for (int i = 0; i < 5; i++) {
    ScheduleRecording(i, MonoDelta::FromNanoseconds(0), &latch);
  }
  ASSERT_TRUE(latch.WaitFor(MonoDelta::FromSeconds(10)));
  lock_guard<mutex> l(lock_);
  ASSERT_EQ(vector<int>({ 0, 1, 2, 3, 4 }), order_);
}

TEST_F(TimerThreadTest, TestDelayIsHonored) {
  CountDownLatch latch(1);
  MonoTime start = MonoTime::Now();
  MonoTime ran;
  timer_.Schedule([&](const Status& s) {
    CHECK_OK(s);
    ran = MonoTime::Now();
    latch.CountDown();
  }, MonoDelta::FromMilliseconds(50));
  ASSERT_TRUE(latch.WaitFor(MonoDelta::FromSeconds(10)));
  ASSERT_GE((ran - start).ToMilliseconds(), 50);
}

TEST_F(TimerThreadTest, TestShutdownAbortsPendingTasks) {
  Status pending_status;
  timer_.Schedule([&](const Status& s) { pending_status = s; },
                  MonoDelta::FromSeconds(3600));
  ASSERT_EQ(1, timer_.num_pending());
  timer_.Shutdown();
  ASSERT_TRUE(pending_status.IsAborted()) << pending_status.ToString();
  ASSERT_EQ(0, timer_.num_pending());

  // Tasks scheduled after the shutdown are aborted at once.
  Status late_status;
  timer_.Schedule([&](const Status& s) { late_status = s; }, MonoDelta::FromNanoseconds(0));
  ASSERT_TRUE(late_status.IsAborted()) << late_status.ToString();
}

TEST_F(TimerThreadTest, TestTasksMayScheduleTasks) {
  CountDownLatch latch(1);
  timer_.Schedule([&](const Status& s) {
    CHECK_OK(s);
    timer_.Schedule([&](const Status& s2) {
      CHECK_OK(s2);
      latch.CountDown();
    }, MonoDelta::FromMilliseconds(1));
  }, MonoDelta::FromMilliseconds(1));
  ASSERT_TRUE(latch.WaitFor(MonoDelta::FromSeconds(10)));
}

} // namespace rpc
} // namespace kvscan
