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
#ifndef KVSCAN_RPC_RPC_H
#define KVSCAN_RPC_RPC_H

#include "kvscan/gutil/macros.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"
#include "kvscan/util/status_callback.h"

namespace kvscan {
namespace rpc {

class RpcController;
class Scheduler;

// Exponential backoff from 'base_pause': the pause doubles with every
// attempt up to a multiplier of 256, plus up to 1% of jitter. 'attempt' is
// the 1-based number of the attempt which just failed.
MonoDelta ComputeBackoff(const MonoDelta& base_pause, int attempt);

// Provides utilities for retrying failed RPCs.
//
// One logical step (for example "open a scanner" or "fetch the next batch")
// gets a budget of 'max_attempts' attempts which must all start before the
// step's deadline. Each attempt is sent with a per-call deadline which never
// extends past the step deadline.
//
// This class is not thread-safe; the owner must only use it from the single
// live continuation of its operation.
class RpcRetrier {
 public:
  RpcRetrier(const MonoDelta& timeout, int max_attempts, Scheduler* scheduler);

  // Starts a new logical step: the attempt count and the last error are
  // cleared and the deadline restarts from now.
  void Reset();

  // Restarts only the deadline, keeping the attempt count.
  void RefreshDeadline();

  // Counts a new attempt of the current step.
  void StartAttempt() { attempt_num_++; }

  // Resets 'controller' for a call of the current attempt. The controller's
  // deadline is the earlier of now + 'rpc_timeout' and the step deadline.
  void PrepareController(const MonoDelta& rpc_timeout, RpcController* controller) const;

  // Schedules 'retry_cb' after a backoff computed from 'base_pause'.
  //
  // 'why_status' is the retryable error which failed the last attempt. If
  // the attempt budget is exhausted, or the backoff would end after the
  // deadline, nothing is scheduled and the enriched terminal error is
  // returned instead.
  //
  // 'retry_cb' is passed OK when it is time to retry, TimedOut if the
  // deadline passed while waiting, or the scheduler's error.
  Status DelayedRetry(const MonoDelta& base_pause,
                      const Status& why_status,
                      StatusCallback retry_cb) WARN_UNUSED_RESULT;

  // Returns 's' with the attempt count, the configured timeout and the last
  // retryable error appended.
  Status Enrich(const Status& s) const;

  // Number of attempts started in the current step.
  int attempt_num() const { return attempt_num_; }

  const MonoTime& deadline() const { return deadline_; }

  const MonoDelta& timeout() const { return timeout_; }

  const Status& last_error() const { return last_error_; }

 private:
  void DelayedRetryCb(const StatusCallback& retry_cb, const Status& status);

  const MonoDelta timeout_;
  const int max_attempts_;
  Scheduler* const scheduler_;

  int attempt_num_;
  MonoTime deadline_;

  // The last retryable error, reported when the step finally fails.
  Status last_error_;

  DISALLOW_COPY_AND_ASSIGN(RpcRetrier);
};

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_RPC_H
