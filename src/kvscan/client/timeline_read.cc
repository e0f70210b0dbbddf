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

#include "kvscan/client/timeline_read.h"

#include <utility>

#include <glog/logging.h>

#include "kvscan/client/region_locator.h"
#include "kvscan/client/scan_context.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/trace.h"

using std::lock_guard;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace kvscan {
namespace client {

TimelineConsistentRead::TimelineConsistentRead(shared_ptr<const ScanContext> ctx,
                                               string start_row,
                                               bool include_start_row,
                                               bool reload_location,
                                               int32_t row_budget)
    : ctx_(std::move(ctx)),
      start_row_(std::move(start_row)),
      include_start_row_(include_start_row),
      reload_location_(reload_location),
      row_budget_(row_budget),
      done_(false),
      secondaries_launched_(false),
      pending_(0) {
}

void TimelineConsistentRead::Call(OpenCursorCallback callback) {
  {
    lock_guard<mutex> l(lock_);
    DCHECK(!callback_);
    callback_ = std::move(callback);
    pending_ = 1;
  }
  StartReplica(0);

  shared_ptr<TimelineConsistentRead> self = shared_from_this();
  const MonoDelta& timeout = ctx_->config.primary_call_timeout();
  if (timeout.ToNanoseconds() <= 0) {
    LaunchSecondaries();
    return;
  }
  ctx_->scheduler->Schedule([self](const Status& s) {
    if (s.ok()) {
      self->LaunchSecondaries();
    }
  }, timeout);
}

void TimelineConsistentRead::StartReplica(int replica_id) {
  shared_ptr<OpenScannerCaller> caller = std::make_shared<OpenScannerCaller>(
      ctx_, start_row_, include_start_row_, replica_id, reload_location_, row_budget_);
  {
    lock_guard<mutex> l(lock_);
    callers_.push_back(caller);
  }
  shared_ptr<TimelineConsistentRead> self = shared_from_this();
  caller->Call([self, replica_id](const Status& s, unique_ptr<OpenedCursor> opened) {
    self->ReplicaDone(replica_id, s, std::move(opened));
  });
}

void TimelineConsistentRead::LaunchSecondaries() {
  {
    lock_guard<mutex> l(lock_);
    if (done_ || secondaries_launched_) {
      return;
    }
    secondaries_launched_ = true;
    // The locate call counts as an outstanding operation.
    pending_++;
  }
  ctx_->trace->Message("Primary replica slow or failed; racing secondary replicas");
  shared_ptr<TimelineConsistentRead> self = shared_from_this();
  ctx_->locator->LocateRegionReplicas(
      ctx_->table_name, start_row_, reload_location_,
      MonoTime::Now() + ctx_->config.scan_timeout(),
      [self](const Status& s, const RegionLocations& locs) {
        self->SecondariesLocated(s, locs);
      });
}

void TimelineConsistentRead::SecondariesLocated(const Status& status,
                                                const RegionLocations& locations) {
  std::vector<int> replicas;
  if (status.ok()) {
    for (const RegionLocation& loc : locations.locations()) {
      if (!loc.server.empty() && !loc.region.is_default_replica()) {
        replicas.push_back(loc.region.replica_id());
      }
    }
  }
  {
    lock_guard<mutex> l(lock_);
    if (done_) {
      return;
    }
    pending_ += replicas.size();
  }
  for (int replica_id : replicas) {
    StartReplica(replica_id);
  }

  OpenCursorCallback cb;
  Status error;
  {
    lock_guard<mutex> l(lock_);
    Status why = status.ok() ? Status::NotFound("region has no secondary replica") : status;
    if (!OperationFailedUnlocked(why)) {
      return;
    }
    cb = std::move(callback_);
    callback_ = nullptr;
    error = primary_error_.ok() ? first_error_ : primary_error_;
  }
  cb(error, nullptr);
}

void TimelineConsistentRead::ReplicaDone(int replica_id, const Status& status,
                                         unique_ptr<OpenedCursor> opened) {
  OpenCursorCallback cb;
  Status error;
  bool launch_secondaries = false;
  {
    lock_guard<mutex> l(lock_);
    if (done_) {
      if (status.ok()) {
        VLOG(1) << "Ignoring scanner opened on replica " << replica_id
                << " after the race was decided: " << opened->cursor->ToString();
      }
      return;
    }
    if (status.ok()) {
      done_ = true;
      cb = std::move(callback_);
      callback_ = nullptr;
    } else {
      if (replica_id == 0) {
        primary_error_ = status;
        launch_secondaries = !secondaries_launched_;
      }
      if (!OperationFailedUnlocked(status)) {
        cb = nullptr;
      } else {
        cb = std::move(callback_);
        callback_ = nullptr;
        error = primary_error_.ok() ? first_error_ : primary_error_;
      }
    }
  }
  if (status.ok()) {
    ctx_->trace->Message("Replica " + std::to_string(replica_id) + " won the open race");
    cb(Status::OK(), std::move(opened));
    return;
  }
  if (cb) {
    cb(error, nullptr);
    return;
  }
  if (launch_secondaries) {
    LaunchSecondaries();
  }
}

bool TimelineConsistentRead::OperationFailedUnlocked(const Status& status) {
  DCHECK_GT(pending_, 0);
  pending_--;
  if (first_error_.ok()) {
    first_error_ = status;
  }
  if (pending_ > 0 || done_) {
    return false;
  }
  // Nothing is running any more. Before the secondaries were tried, a failed
  // primary only means that the secondaries must be tried now.
  if (!secondaries_launched_) {
    return false;
  }
  done_ = true;
  return true;
}

} // namespace client
} // namespace kvscan
