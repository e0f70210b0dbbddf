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

#include "kvscan/client/open_scanner_caller.h"

#include <utility>

#include <glog/logging.h>

#include "kvscan/client/region_locator.h"
#include "kvscan/client/region_server_stub.h"
#include "kvscan/client/scan_context.h"
#include "kvscan/client/scan_metrics.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/trace.h"

using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace kvscan {
namespace client {

void CursorHandle::RenewLease(uint32_t ttl_ms) {
  if (ttl_ms == 0) {
    lease = MonoDelta();
    lease_deadline = MonoTime();
    return;
  }
  lease = MonoDelta::FromMilliseconds(ttl_ms);
  lease_deadline = MonoTime::Now() + lease;
}

bool CursorHandle::LeaseExpired(const MonoTime& now) const {
  return lease_deadline.Initialized() && now > lease_deadline;
}

string CursorHandle::ToString() const {
  return "scanner " + std::to_string(scanner_id) + " on " + location.ToString();
}

OpenScannerCaller::OpenScannerCaller(shared_ptr<const ScanContext> ctx,
                                     string start_row,
                                     bool include_start_row,
                                     int replica_id,
                                     bool reload_location,
                                     int32_t row_budget)
    : ctx_(std::move(ctx)),
      start_row_(std::move(start_row)),
      include_start_row_(include_start_row),
      replica_id_(replica_id),
      reload_location_(reload_location),
      row_budget_(row_budget),
      retrier_(ctx_->config.scan_timeout(), ctx_->config.max_attempts(),
               ctx_->scheduler.get()) {
}

void OpenScannerCaller::Call(OpenCursorCallback callback) {
  DCHECK(!callback_);
  callback_ = std::move(callback);
  retrier_.Reset();
  Locate();
}

void OpenScannerCaller::Locate() {
  retrier_.StartAttempt();
  shared_ptr<OpenScannerCaller> self = shared_from_this();
  ctx_->locator->LocateRegion(
      ctx_->table_name, start_row_, replica_id_, reload_location_, retrier_.deadline(),
      [self](const Status& s, const RegionLocation& loc) { self->LocateDone(s, loc); });
}

void OpenScannerCaller::LocateDone(const Status& status, const RegionLocation& location) {
  if (!status.ok()) {
    if (status.IsNetworkError() || status.IsServiceUnavailable()) {
      Retry(ctx_->config.pause(), status);
      return;
    }
    Finish(retrier_.Enrich(status.CloneAndPrepend(
        "unable to locate region for row " + Slice(start_row_).ToDebugString())), nullptr);
    return;
  }
  location_ = location;
  Status s = ctx_->stub_factory->GetStub(location_.server, &stub_);
  if (!s.ok()) {
    Retry(ctx_->config.pause(), s);
    return;
  }
  SendOpen();
}

void OpenScannerCaller::SendOpen() {
  req_.Clear();
  req_.mutable_region()->set_region_name(location_.region.region_name());
  ctx_->spec.ToPB(start_row_, include_start_row_, req_.mutable_scan());
  req_.set_number_of_rows(row_budget_);
  req_.set_client_handles_partials(ctx_->spec.allow_partial_results());
  req_.set_client_handles_heartbeats(true);
  if (ctx_->spec.has_limit()) {
    req_.set_limit_of_rows(static_cast<uint32_t>(ctx_->spec.limit()));
  }

  retrier_.PrepareController(ctx_->config.rpc_timeout(), &controller_);
  controller_.set_priority(ctx_->spec.priority());
  for (const auto& attr : ctx_->spec.attributes()) {
    controller_.AddRequestAttribute(attr.first, attr.second);
  }
  if (ctx_->metrics) {
    ctx_->metrics->IncrementRpcCall(location_.is_remote, &open_metrics_);
    if (retrier_.attempt_num() >= 2) {
      ctx_->metrics->IncrementRpcRetry(location_.is_remote, &open_metrics_);
    }
  }
  ctx_->trace->Message("Opening scanner on " + location_.ToString() + ", attempt " +
                       std::to_string(retrier_.attempt_num()));
  resp_.Clear();
  shared_ptr<OpenScannerCaller> self = shared_from_this();
  stub_->ScanAsync(req_, &resp_, &controller_, [self]() { self->OpenDone(); });
}

void OpenScannerCaller::OpenDone() {
  ScanRpcStatus result = AnalyzeScanResponse(controller_, retrier_.deadline());
  switch (result.result) {
    case ScanRpcStatus::OK: {
      unique_ptr<OpenedCursor> opened(new OpenedCursor);
      Status s = RowBatchFromResponse(resp_, controller_, &opened->first_batch);
      if (!s.ok()) {
        Finish(s.CloneAndPrepend("unable to open scanner on " + location_.ToString()),
               nullptr);
        return;
      }
      opened->cursor.reset(new CursorHandle);
      opened->cursor->scanner_id = resp_.scanner_id();
      opened->cursor->location = location_;
      opened->cursor->stub = stub_;
      opened->cursor->RenewLease(resp_.ttl());
      opened->start_row = start_row_;
      opened->include_start_row = include_start_row_;
      opened->open_metrics = open_metrics_;
      VLOG(1) << "Opened " << opened->cursor->ToString() << " at "
              << Slice(start_row_).ToDebugString();
      Finish(Status::OK(), std::move(opened));
      return;
    }
    case ScanRpcStatus::REGION_MOVED:
      if (ctx_->metrics) {
        ctx_->metrics->IncrementNotServingRegion(&open_metrics_);
      }
      ctx_->locator->InvalidateCachedLocation(location_);
      reload_location_ = true;
      Retry(ctx_->config.pause(), result.status);
      return;
    case ScanRpcStatus::SERVER_OVERLOADED:
      Retry(ctx_->config.pause_server_overloaded(), result.status);
      return;
    case ScanRpcStatus::SERVICE_UNAVAILABLE:
    case ScanRpcStatus::RPC_ERROR:
    case ScanRpcStatus::RPC_DEADLINE_EXCEEDED:
    case ScanRpcStatus::SCANNER_EXPIRED:
    case ScanRpcStatus::OUT_OF_ORDER:
      Retry(ctx_->config.pause(), result.status);
      return;
    case ScanRpcStatus::OVERALL_DEADLINE_EXCEEDED:
    case ScanRpcStatus::CONNECTION_FATAL:
    case ScanRpcStatus::DO_NOT_RETRY:
    case ScanRpcStatus::INVALID_REQUEST:
      break;
  }
  LOG(WARNING) << "Unable to open scanner on " << location_.ToString() << ": "
               << ScanRpcStatusResultToString(result.result) << ": "
               << result.status.ToString();
  Finish(retrier_.Enrich(result.status.CloneAndPrepend(
      "unable to open scanner on " + location_.ToString())), nullptr);
}

void OpenScannerCaller::Retry(const MonoDelta& pause, const Status& why) {
  if (retrier_.attempt_num() > ctx_->config.start_log_errors_count()) {
    LOG(WARNING) << "Attempt " << retrier_.attempt_num() << " to open a scanner at row "
                 << Slice(start_row_).ToDebugString() << " failed: " << why.ToString();
  } else {
    VLOG(1) << "Attempt " << retrier_.attempt_num() << " to open a scanner at row "
            << Slice(start_row_).ToDebugString() << " failed: " << why.ToString();
  }
  shared_ptr<OpenScannerCaller> self = shared_from_this();
  Status s = retrier_.DelayedRetry(pause, why, [self](const Status& s) {
    if (!s.ok()) {
      self->Finish(s, nullptr);
      return;
    }
    self->Locate();
  });
  if (!s.ok()) {
    Finish(s.CloneAndPrepend("unable to open scanner at row " +
                             Slice(start_row_).ToDebugString()), nullptr);
  }
}

void OpenScannerCaller::Finish(const Status& status, unique_ptr<OpenedCursor> opened) {
  DCHECK(callback_);
  ctx_->trace->Message("Open scanner finished: " + status.ToString());
  OpenCursorCallback cb = std::move(callback_);
  callback_ = nullptr;
  cb(status, std::move(opened));
}

} // namespace client
} // namespace kvscan
