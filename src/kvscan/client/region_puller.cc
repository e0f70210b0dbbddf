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

#include "kvscan/client/region_puller.h"

#include <utility>
#include <vector>

#include <glog/logging.h>

#include "kvscan/client/region_locator.h"
#include "kvscan/client/region_server_stub.h"
#include "kvscan/client/scan_context.h"
#include "kvscan/client/scan_metrics.h"
#include "kvscan/client/scan_result_cache.h"
#include "kvscan/client/scan_rpc_status.h"
#include "kvscan/common/key_util.h"
#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/trace.h"

using std::lock_guard;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

namespace kvscan {
namespace client {

const char* VerdictToString(RegionPuller::Verdict verdict) {
  switch (verdict) {
    case RegionPuller::Verdict::REGION_EXHAUSTED: return "REGION_EXHAUSTED";
    case RegionPuller::Verdict::SCAN_COMPLETE: return "SCAN_COMPLETE";
    case RegionPuller::Verdict::ERROR: return "ERROR";
  }
  LOG(FATAL) << "unknown verdict";
  return "";
}

string RegionPuller::Outcome::ToString() const {
  string ret = VerdictToString(verdict);
  switch (verdict) {
    case Verdict::REGION_EXHAUSTED:
      ret += ", next start " + Slice(next_start_row).ToDebugString() +
             (next_start_inclusive ? " (inclusive)" : " (exclusive)");
      if (reload_location) {
        ret += ", reload location";
      }
      break;
    case Verdict::ERROR:
      ret += ": " + status.ToString();
      break;
    case Verdict::SCAN_COMPLETE:
      break;
  }
  return ret;
}

// The consumer may call Resume() before the callback which suspended the
// scan returned, from any thread.
class RegionPuller::Resumer : public ScanResumer {
 public:
  explicit Resumer(shared_ptr<RegionPuller> puller)
      : puller_(std::move(puller)),
        state_(State::INITIALIZED) {
  }

  void Resume() override {
    shared_ptr<RegionPuller> puller;
    {
      lock_guard<mutex> l(lock_);
      if (state_ == State::INITIALIZED) {
        // Still within the callback: the puller goes on when it returns.
        state_ = State::RESUMED;
        return;
      }
      if (state_ != State::SUSPENDED) {
        return;
      }
      state_ = State::RESUMED;
      puller = std::move(puller_);
    }
    puller->ResumeFromSuspension();
  }

  // Called once the callback which suspended the scan returned. Returns
  // false if the consumer resumed the scan already.
  bool Suspend() {
    lock_guard<mutex> l(lock_);
    if (state_ == State::RESUMED) {
      return false;
    }
    state_ = State::SUSPENDED;
    return true;
  }

  bool suspended() const {
    lock_guard<mutex> l(lock_);
    return state_ == State::SUSPENDED;
  }

 private:
  enum class State {
    INITIALIZED,
    SUSPENDED,
    RESUMED,
  };

  mutable mutex lock_;
  shared_ptr<RegionPuller> puller_;
  State state_;

  DISALLOW_COPY_AND_ASSIGN(Resumer);
};

// Handed to the consumer for one callback.
class RegionPuller::Controller : public ScanController {
 public:
  enum class State {
    RUNNING,
    SUSPENDED,
    TERMINATED,
  };

  explicit Controller(RegionPuller* puller)
      : puller_(puller),
        state_(State::RUNNING) {
  }

  shared_ptr<ScanResumer> Suspend() override {
    if (state_ != State::RUNNING) {
      return resumer_;
    }
    state_ = State::SUSPENDED;
    resumer_ = std::make_shared<Resumer>(puller_->shared_from_this());
    return resumer_;
  }

  void Terminate() override {
    state_ = State::TERMINATED;
  }

  State state() const { return state_; }
  const shared_ptr<Resumer>& resumer() const { return resumer_; }

 private:
  RegionPuller* const puller_;
  State state_;
  shared_ptr<Resumer> resumer_;

  DISALLOW_COPY_AND_ASSIGN(Controller);
};

RegionPuller::RegionPuller(shared_ptr<const ScanContext> ctx,
                           unique_ptr<OpenedCursor> opened,
                           ScanResultCache* cache,
                           AdvancedScanConsumer* consumer)
    : ctx_(std::move(ctx)),
      cursor_(std::move(opened->cursor)),
      open_start_row_(opened->start_row),
      open_start_inclusive_(opened->include_start_row),
      first_batch_(std::move(opened->first_batch)),
      cache_(cache),
      consumer_(consumer),
      retrier_(ctx_->config.scan_timeout(), ctx_->config.max_attempts(),
               ctx_->scheduler.get()),
      region_done_(false),
      scan_done_(false) {
  CHECK(cursor_);
}

RegionPuller::~RegionPuller() {
}

void RegionPuller::Start(OutcomeCallback callback) {
  DCHECK(!callback_);
  callback_ = std::move(callback);
  retrier_.Reset();
  RowBatch batch = std::move(first_batch_);
  HandleBatch(batch);
}

void RegionPuller::HandleBatch(const RowBatch& batch) {
  region_done_ = !batch.more_results_in_region;
  scan_done_ = !batch.more_results;
  if (batch.stale) {
    ctx_->trace->Message("Rows of " + cursor_->ToString() + " may be stale");
  }

  if (batch.heartbeat && batch.rows.empty()) {
    // The server is making progress: the step gets a fresh deadline.
    retrier_.RefreshDeadline();
    Controller controller(this);
    consumer_->OnHeartbeat(&controller);
    if (!AfterCallback(controller)) {
      return;
    }
  } else {
    cache_->Accept(batch.rows, batch.heartbeat);
  }
  if (region_done_ || scan_done_) {
    cache_->Flush();
  }
  DeliverAndContinue();
}

void RegionPuller::DeliverAndContinue() {
  vector<RowResult> rows;
  while (cache_->NextBatch(&rows)) {
    if (ctx_->metrics) {
      int64_t bytes = 0;
      for (const RowResult& row : rows) {
        bytes += row.EncodedSize();
      }
      ctx_->metrics->AddRowsScanned(rows.size(), bytes);
    }
    Controller controller(this);
    consumer_->OnNext(rows, &controller);
    if (!AfterCallback(controller)) {
      return;
    }
  }

  if (cache_->limit_reached()) {
    CloseScanner();
    FinishScan("row limit reached");
    return;
  }
  if (scan_done_) {
    FinishScan("server reported no more rows");
    return;
  }
  if (region_done_) {
    FinishRegion();
    return;
  }
  SendContinue();
}

bool RegionPuller::AfterCallback(const Controller& controller) {
  switch (controller.state()) {
    case Controller::State::RUNNING:
      return true;
    case Controller::State::TERMINATED:
      CloseScanner();
      FinishScan("terminated by the consumer");
      return false;
    case Controller::State::SUSPENDED:
      break;
  }
  const shared_ptr<Resumer>& resumer = controller.resumer();
  if (!resumer->Suspend()) {
    // Resumed from within the callback.
    return true;
  }
  ctx_->trace->Message("Scan suspended by the consumer");
  {
    lock_guard<mutex> l(lock_);
    resumer_ = resumer;
  }
  ScheduleLeaseRenewal();
  return false;
}

void RegionPuller::ResumeFromSuspension() {
  ctx_->trace->Message("Scan resumed by the consumer");
  {
    lock_guard<mutex> l(lock_);
    resumer_.reset();
  }
  DeliverAndContinue();
}

void RegionPuller::ScheduleLeaseRenewal() {
  MonoDelta delay;
  {
    lock_guard<mutex> l(lock_);
    if (!cursor_->lease.Initialized() || region_done_ || scan_done_) {
      return;
    }
    delay = MonoDelta::FromNanoseconds(cursor_->lease.ToNanoseconds() / 2);
  }
  shared_ptr<RegionPuller> self = shared_from_this();
  ctx_->scheduler->Schedule([self](const Status& s) {
    if (s.ok()) {
      self->SendRenewal();
    }
  }, delay);
}

void RegionPuller::SendRenewal() {
  {
    lock_guard<mutex> l(lock_);
    shared_ptr<Resumer> resumer = resumer_.lock();
    if (!resumer || !resumer->suspended()) {
      return;
    }
  }
  struct RenewCall {
    ScanRequestPB req;
    ScanResponsePB resp;
    rpc::RpcController controller;
  };
  shared_ptr<RenewCall> call = std::make_shared<RenewCall>();
  call->req.set_scanner_id(cursor_->scanner_id);
  call->req.set_renew(true);
  call->req.set_number_of_rows(0);
  call->controller.set_timeout(ctx_->config.rpc_timeout());
  shared_ptr<RegionPuller> self = shared_from_this();
  cursor_->stub->ScanAsync(call->req, &call->resp, &call->controller, [self, call]() {
    if (!call->controller.status().ok()) {
      // The lease runs out; the scanner is re-opened once the scan resumes.
      VLOG(1) << "Unable to renew the lease of " << self->cursor_->ToString() << ": "
              << call->controller.status().ToString();
      return;
    }
    {
      lock_guard<mutex> l(self->lock_);
      if (call->resp.has_ttl()) {
        self->cursor_->RenewLease(call->resp.ttl());
      }
    }
    VLOG(2) << "Renewed the lease of " << self->cursor_->ToString();
    self->ScheduleLeaseRenewal();
  });
}

void RegionPuller::SendContinue() {
  bool lease_expired;
  {
    lock_guard<mutex> l(lock_);
    lease_expired = cursor_->LeaseExpired(MonoTime::Now());
  }
  if (lease_expired) {
    ctx_->trace->Message("Lease of " + cursor_->ToString() + " expired");
    VLOG(1) << "Lease of " << cursor_->ToString() << " expired; re-opening the region";
    Reopen(false);
    return;
  }

  retrier_.StartAttempt();
  req_.Clear();
  req_.set_scanner_id(cursor_->scanner_id);
  req_.set_number_of_rows(cache_->RowBudget(ctx_->spec.caching()));
  req_.set_next_call_seq(cursor_->next_call_seq);
  req_.set_client_handles_partials(ctx_->spec.allow_partial_results());
  req_.set_client_handles_heartbeats(true);
  if (ctx_->spec.has_limit()) {
    req_.set_limit_of_rows(
        static_cast<uint32_t>(ctx_->spec.limit() - cache_->num_complete_rows()));
  }

  retrier_.PrepareController(ctx_->config.rpc_timeout(), &cursor_->controller);
  cursor_->controller.set_priority(ctx_->spec.priority());
  for (const auto& attr : ctx_->spec.attributes()) {
    cursor_->controller.AddRequestAttribute(attr.first, attr.second);
  }
  if (ctx_->metrics) {
    ctx_->metrics->IncrementRpcCall(cursor_->location.is_remote);
    if (retrier_.attempt_num() >= 2) {
      ctx_->metrics->IncrementRpcRetry(cursor_->location.is_remote);
    }
  }
  resp_.Clear();
  shared_ptr<RegionPuller> self = shared_from_this();
  cursor_->stub->ScanAsync(req_, &resp_, &cursor_->controller,
                           [self]() { self->ContinueDone(); });
}

void RegionPuller::ContinueDone() {
  ScanRpcStatus result = AnalyzeScanResponse(cursor_->controller, retrier_.deadline());
  switch (result.result) {
    case ScanRpcStatus::OK: {
      cursor_->next_call_seq++;
      if (resp_.has_ttl()) {
        lock_guard<mutex> l(lock_);
        cursor_->RenewLease(resp_.ttl());
      }
      RowBatch batch;
      Status s = RowBatchFromResponse(resp_, cursor_->controller, &batch);
      if (!s.ok()) {
        Fail(s.CloneAndPrepend("invalid response from " + cursor_->ToString()));
        return;
      }
      retrier_.Reset();
      HandleBatch(batch);
      return;
    }
    case ScanRpcStatus::REGION_MOVED:
      if (ctx_->metrics) {
        ctx_->metrics->IncrementNotServingRegion();
      }
      ctx_->locator->InvalidateCachedLocation(cursor_->location);
      VLOG(1) << cursor_->ToString() << " moved: " << result.status.ToString();
      Reopen(true);
      return;
    case ScanRpcStatus::SCANNER_EXPIRED:
    case ScanRpcStatus::OUT_OF_ORDER:
      VLOG(1) << cursor_->ToString() << " must be re-opened: " << result.status.ToString();
      Reopen(false);
      return;
    case ScanRpcStatus::SERVER_OVERLOADED:
      Retry(ctx_->config.pause_server_overloaded(), result.status);
      return;
    case ScanRpcStatus::SERVICE_UNAVAILABLE:
    case ScanRpcStatus::RPC_ERROR:
    case ScanRpcStatus::RPC_DEADLINE_EXCEEDED:
      Retry(ctx_->config.pause(), result.status);
      return;
    case ScanRpcStatus::OVERALL_DEADLINE_EXCEEDED:
    case ScanRpcStatus::CONNECTION_FATAL:
    case ScanRpcStatus::DO_NOT_RETRY:
    case ScanRpcStatus::INVALID_REQUEST:
      break;
  }
  LOG(WARNING) << "Scan of " << cursor_->ToString() << " failed: "
               << ScanRpcStatusResultToString(result.result) << ": "
               << result.status.ToString();
  Fail(retrier_.Enrich(result.status.CloneAndPrepend("unable to scan " +
                                                     cursor_->location.ToString())));
}

void RegionPuller::Retry(const MonoDelta& pause, const Status& why) {
  if (retrier_.attempt_num() > ctx_->config.start_log_errors_count()) {
    LOG(WARNING) << "Attempt " << retrier_.attempt_num() << " to scan "
                 << cursor_->ToString() << " failed: " << why.ToString();
  } else {
    VLOG(1) << "Attempt " << retrier_.attempt_num() << " to scan "
            << cursor_->ToString() << " failed: " << why.ToString();
  }
  shared_ptr<RegionPuller> self = shared_from_this();
  Status s = retrier_.DelayedRetry(pause, why, [self](const Status& s) {
    if (!s.ok()) {
      self->Fail(s);
      return;
    }
    self->SendContinue();
  });
  if (!s.ok()) {
    Fail(s.CloneAndPrepend("unable to scan " + cursor_->location.ToString()));
  }
}

void RegionPuller::CloseScanner() {
  if (region_done_ || scan_done_ || cursor_->scanner_id == 0) {
    // The server closed the scanner already.
    return;
  }
  struct CloseCall {
    ScanRequestPB req;
    ScanResponsePB resp;
    rpc::RpcController controller;
  };
  shared_ptr<CloseCall> call = std::make_shared<CloseCall>();
  call->req.set_scanner_id(cursor_->scanner_id);
  call->req.set_close_scanner(true);
  call->req.set_number_of_rows(0);
  call->controller.set_timeout(ctx_->config.rpc_timeout());
  string desc = cursor_->ToString();
  cursor_->stub->ScanAsync(call->req, &call->resp, &call->controller, [call, desc]() {
    if (!call->controller.status().ok()) {
      VLOG(1) << "Unable to close " << desc << ": " << call->controller.status().ToString();
    }
  });
}

void RegionPuller::Reopen(bool reload_location) {
  Outcome outcome;
  outcome.verdict = Verdict::REGION_EXHAUSTED;
  outcome.has_more = true;
  outcome.reload_location = reload_location;

  string row;
  bool inclusive;
  if (cache_->ResumePosition(&row, &inclusive) &&
      (row > open_start_row_ || (row == open_start_row_ && !inclusive))) {
    outcome.next_start_row = std::move(row);
    outcome.next_start_inclusive = inclusive;
  } else {
    // Nothing was accepted from this region yet.
    outcome.next_start_row = open_start_row_;
    outcome.next_start_inclusive = open_start_inclusive_;
  }
  cache_->Clear();
  Finish(outcome);
}

void RegionPuller::FinishRegion() {
  const string& end_key = cursor_->location.region.end_key();
  if (key_util::IsLastRegionForScan(end_key, ctx_->spec.stop_row(),
                                    ctx_->spec.include_stop_row())) {
    FinishScan("last region of the scan exhausted");
    return;
  }
  Outcome outcome;
  outcome.verdict = Verdict::REGION_EXHAUSTED;
  outcome.has_more = true;
  outcome.next_start_row = end_key;
  outcome.next_start_inclusive = true;
  Finish(outcome);
}

void RegionPuller::FinishScan(const string& why) {
  ctx_->trace->Message("Scan complete: " + why);
  Outcome outcome;
  outcome.verdict = Verdict::SCAN_COMPLETE;
  Finish(outcome);
}

void RegionPuller::Fail(const Status& status) {
  Outcome outcome;
  outcome.verdict = Verdict::ERROR;
  outcome.status = status;
  Finish(outcome);
}

void RegionPuller::Finish(const Outcome& outcome) {
  DCHECK(callback_);
  VLOG(1) << "Finished pulling " << cursor_->ToString() << ": " << outcome.ToString();
  OutcomeCallback cb = std::move(callback_);
  callback_ = nullptr;
  cb(outcome);
}

} // namespace client
} // namespace kvscan
