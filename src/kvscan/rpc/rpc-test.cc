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

#include "kvscan/rpc/rpc.h"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::vector;

namespace kvscan {
namespace rpc {

namespace {

// Keeps the scheduled tasks until the test runs them.
class QueueScheduler : public Scheduler {
 public:
  void Schedule(StatusCallback task, const MonoDelta& delay) override {
    tasks_.push_back(std::move(task));
    delays_.push_back(delay);
  }

  void RunAll() {
    vector<StatusCallback> tasks;
    tasks.swap(tasks_);
    for (const auto& t : tasks) {
      t(Status::OK());
    }
  }

  vector<StatusCallback> tasks_;
  vector<MonoDelta> delays_;
};

} // anonymous namespace

class RpcRetrierTest : public KvScanTest {
 protected:
  QueueScheduler scheduler_;
};

TEST_F(RpcRetrierTest, TestBackoffGrowsExponentially) {
  const MonoDelta base = MonoDelta::FromMilliseconds(100);
  for (int attempt = 1; attempt <= 12; attempt++) {
    int64_t expected = 100LL << std::min(8, attempt - 1);
    int64_t actual = ComputeBackoff(base, attempt).ToMilliseconds();
    ASSERT_GE(actual, expected) << "attempt " << attempt;
    ASSERT_LE(actual, expected + expected / 100) << "attempt " << attempt;
  }
}

TEST_F(RpcRetrierTest, TestRetriesUntilAttemptsExhausted) {
  RpcRetrier retrier(MonoDelta::FromSeconds(60), 3, &scheduler_);
  int retries = 0;
  Status retry_status = Status::IllegalState("not run");
  auto cb = [&](const Status& s) {
    retries++;
    retry_status = s;
  };

  for (int attempt = 1; attempt < 3; attempt++) {
    retrier.StartAttempt();
    ASSERT_EQ(attempt, retrier.attempt_num());
    ASSERT_OK(retrier.DelayedRetry(MonoDelta::FromMilliseconds(1),
                                   Status::NetworkError("connection refused"), cb));
    ASSERT_EQ(1U, scheduler_.tasks_.size());
    scheduler_.RunAll();
    ASSERT_EQ(attempt, retries);
    ASSERT_OK(retry_status);
  }
  // The pause doubles from one attempt to the next.
  ASSERT_EQ(1, scheduler_.delays_[0].ToMilliseconds());
  ASSERT_EQ(2, scheduler_.delays_[1].ToMilliseconds());

  retrier.StartAttempt();
  Status s = retrier.DelayedRetry(MonoDelta::FromMilliseconds(1),
                                  Status::NetworkError("connection refused"), cb);
  ASSERT_TRUE(s.IsNetworkError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "retries exhausted");
  ASSERT_STR_CONTAINS(s.ToString(), "after 3 attempt(s)");
  ASSERT_TRUE(scheduler_.tasks_.empty());

  // A new step starts from scratch.
  retrier.Reset();
  ASSERT_EQ(0, retrier.attempt_num());
  ASSERT_OK(retrier.last_error());
}

TEST_F(RpcRetrierTest, TestBackoffPastDeadline) {
  RpcRetrier retrier(MonoDelta::FromMilliseconds(50), 10, &scheduler_);
  retrier.StartAttempt();
  Status s = retrier.DelayedRetry(MonoDelta::FromSeconds(1),
                                  Status::ServiceUnavailable("region is opening"),
                                  [](const Status& s) {});
  ASSERT_TRUE(s.IsTimedOut()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "last retryable error: Service unavailable");
  ASSERT_TRUE(scheduler_.tasks_.empty());
}

TEST_F(RpcRetrierTest, TestDeadlinePassesWhileWaiting) {
  RpcRetrier retrier(MonoDelta::FromMilliseconds(100), 10, &scheduler_);
  retrier.StartAttempt();
  Status retry_status;
  ASSERT_OK(retrier.DelayedRetry(MonoDelta::FromMilliseconds(1),
                                 Status::NetworkError("reset by peer"),
                                 [&](const Status& s) { retry_status = s; }));
  SleepFor(MonoDelta::FromMilliseconds(150));
  scheduler_.RunAll();
  ASSERT_TRUE(retry_status.IsTimedOut()) << retry_status.ToString();
  ASSERT_STR_CONTAINS(retry_status.ToString(), "reset by peer");
}

TEST_F(RpcRetrierTest, TestRefreshDeadline) {
  RpcRetrier retrier(MonoDelta::FromMilliseconds(100), 10, &scheduler_);
  retrier.StartAttempt();
  MonoTime first = retrier.deadline();
  SleepFor(MonoDelta::FromMilliseconds(5));
  retrier.RefreshDeadline();
  ASSERT_GT(retrier.deadline(), first);
  ASSERT_EQ(1, retrier.attempt_num());
}

TEST_F(RpcRetrierTest, TestControllerDeadlineCappedByStep) {
  RpcRetrier retrier(MonoDelta::FromSeconds(1), 10, &scheduler_);
  RpcController controller;
  controller.set_priority(5);
  retrier.PrepareController(MonoDelta::FromSeconds(10), &controller);
  ASSERT_EQ(retrier.deadline(), controller.deadline());
  ASSERT_EQ(0U, controller.priority());

  retrier.PrepareController(MonoDelta::FromMilliseconds(10), &controller);
  ASSERT_LT(controller.deadline(), retrier.deadline());
}

TEST_F(RpcRetrierTest, TestEnrichMentionsLastError) {
  RpcRetrier retrier(MonoDelta::FromSeconds(2), 10, &scheduler_);
  retrier.StartAttempt();
  retrier.StartAttempt();
  ASSERT_OK(retrier.DelayedRetry(MonoDelta::FromMilliseconds(1),
                                 Status::NetworkError("connection refused"),
                                 [](const Status& s) {}));
  Status s = retrier.Enrich(Status::RemoteError("DoNotRetryIOException"));
  ASSERT_EQ("Remote error: DoNotRetryIOException: after 2 attempt(s), timeout 2.000s, "
            "last retryable error: Network error: connection refused", s.ToString());
}

} // namespace rpc
} // namespace kvscan
