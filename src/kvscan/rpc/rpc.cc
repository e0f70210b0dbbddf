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
#include <cstdlib>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/scheduler.h"

using std::string;

namespace kvscan {
namespace rpc {

namespace {
const int kMaxBackoffExponent = 8;
} // anonymous namespace

MonoDelta ComputeBackoff(const MonoDelta& base_pause, int attempt) {
  DCHECK_GE(attempt, 1);
  int64_t pause_ms = base_pause.ToMilliseconds() *
      (1LL << std::min(kMaxBackoffExponent, std::max(attempt, 1) - 1));
  int64_t jitter_ms = pause_ms / 100 > 0 ? rand() % (pause_ms / 100 + 1) : 0;
  return MonoDelta::FromMilliseconds(pause_ms + jitter_ms);
}

RpcRetrier::RpcRetrier(const MonoDelta& timeout, int max_attempts, Scheduler* scheduler)
    : timeout_(timeout),
      max_attempts_(max_attempts),
      scheduler_(DCHECK_NOTNULL(scheduler)),
      attempt_num_(0) {
  DCHECK_GE(max_attempts, 1);
  Reset();
}

void RpcRetrier::Reset() {
  attempt_num_ = 0;
  last_error_ = Status::OK();
  RefreshDeadline();
}

void RpcRetrier::RefreshDeadline() {
  deadline_ = MonoTime::Now() + timeout_;
}

void RpcRetrier::PrepareController(const MonoDelta& rpc_timeout,
                                   RpcController* controller) const {
  controller->Reset();
  controller->set_deadline(MonoTime::Earliest(MonoTime::Now() + rpc_timeout, deadline_));
}

Status RpcRetrier::DelayedRetry(const MonoDelta& base_pause,
                                const Status& why_status,
                                StatusCallback retry_cb) {
  DCHECK(!why_status.ok());
  last_error_ = why_status;
  if (attempt_num_ >= max_attempts_) {
    return Enrich(why_status.CloneAndPrepend("retries exhausted"));
  }
  MonoDelta backoff = ComputeBackoff(base_pause, std::max(attempt_num_, 1));
  if (deadline_ < MonoTime::Now() + backoff) {
    return Enrich(Status::TimedOut("deadline would pass before the next attempt"));
  }
  VLOG(2) << "Retrying in " << backoff.ToString() << " after attempt "
          << attempt_num_ << ": " << why_status.ToString();
  scheduler_->Schedule(
      [this, retry_cb](const Status& s) { this->DelayedRetryCb(retry_cb, s); },
      backoff);
  return Status::OK();
}

void RpcRetrier::DelayedRetryCb(const StatusCallback& retry_cb, const Status& status) {
  Status new_status = status;
  if (new_status.ok() && MonoTime::Now() > deadline_) {
    new_status = Enrich(Status::TimedOut("passed its deadline"));
  }
  retry_cb(new_status);
}

Status RpcRetrier::Enrich(const Status& s) const {
  string detail = "after " + std::to_string(attempt_num_) + " attempt(s), timeout " +
      timeout_.ToString();
  if (!last_error_.ok() &&
      s.message().ToString().find(last_error_.message().ToString()) == string::npos) {
    detail += ", last retryable error: " + last_error_.ToString();
  }
  return s.CloneAndAppend(detail);
}

} // namespace rpc
} // namespace kvscan
