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

#include "kvscan/client/scan_driver.h"

#include <utility>

#include <glog/logging.h>

#include "kvscan/client/region_locator.h"
#include "kvscan/client/region_server_stub.h"
#include "kvscan/client/scan_consumer.h"
#include "kvscan/client/scan_context.h"
#include "kvscan/client/scan_metrics.h"
#include "kvscan/client/scan_result_cache.h"
#include "kvscan/client/timeline_read.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/trace.h"

using std::lock_guard;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace kvscan {
namespace client {

const char* ScanDriverStateToString(ScanDriver::State state) {
  switch (state) {
    case ScanDriver::State::IDLE: return "IDLE";
    case ScanDriver::State::LOCATING_REGION: return "LOCATING_REGION";
    case ScanDriver::State::OPENING_CURSOR: return "OPENING_CURSOR";
    case ScanDriver::State::PULLING: return "PULLING";
    case ScanDriver::State::COMPLETED: return "COMPLETED";
    case ScanDriver::State::FAILED: return "FAILED";
  }
  LOG(FATAL) << "unknown state";
  return "";
}

const char* ScanDriverEventToString(ScanDriver::Event event) {
  switch (event) {
    case ScanDriver::Event::START: return "START";
    case ScanDriver::Event::INVALID_SPEC: return "INVALID_SPEC";
    case ScanDriver::Event::OPEN_ISSUED: return "OPEN_ISSUED";
    case ScanDriver::Event::CURSOR_OPENED: return "CURSOR_OPENED";
    case ScanDriver::Event::OPEN_FAILED: return "OPEN_FAILED";
    case ScanDriver::Event::REGION_EXHAUSTED: return "REGION_EXHAUSTED";
    case ScanDriver::Event::SCAN_COMPLETE: return "SCAN_COMPLETE";
    case ScanDriver::Event::PULL_FAILED: return "PULL_FAILED";
  }
  LOG(FATAL) << "unknown event";
  return "";
}

Status ScanDriver::NextState(State from, Event event, State* to) {
  switch (from) {
    case State::IDLE:
      if (event == Event::START) {
        *to = State::LOCATING_REGION;
        return Status::OK();
      }
      if (event == Event::INVALID_SPEC) {
        *to = State::FAILED;
        return Status::OK();
      }
      break;
    case State::LOCATING_REGION:
      if (event == Event::OPEN_ISSUED) {
        *to = State::OPENING_CURSOR;
        return Status::OK();
      }
      break;
    case State::OPENING_CURSOR:
      if (event == Event::CURSOR_OPENED) {
        *to = State::PULLING;
        return Status::OK();
      }
      if (event == Event::OPEN_FAILED) {
        *to = State::FAILED;
        return Status::OK();
      }
      break;
    case State::PULLING:
      if (event == Event::REGION_EXHAUSTED) {
        *to = State::LOCATING_REGION;
        return Status::OK();
      }
      if (event == Event::SCAN_COMPLETE) {
        *to = State::COMPLETED;
        return Status::OK();
      }
      if (event == Event::PULL_FAILED) {
        *to = State::FAILED;
        return Status::OK();
      }
      break;
    case State::COMPLETED:
    case State::FAILED:
      break;
  }
  return Status::IllegalState(string("invalid scan driver transition: ") +
                              ScanDriverEventToString(event) + " in state " +
                              ScanDriverStateToString(from));
}

ScanDriver::ScanDriver(string table_name,
                       ScanSpec spec,
                       ScanConfiguration config,
                       shared_ptr<RegionLocator> locator,
                       shared_ptr<StubFactory> stub_factory,
                       shared_ptr<rpc::Scheduler> scheduler,
                       shared_ptr<AdvancedScanConsumer> consumer)
    : table_name_(std::move(table_name)),
      spec_(std::move(spec)),
      config_(std::move(config)),
      locator_(std::move(locator)),
      stub_factory_(std::move(stub_factory)),
      scheduler_(std::move(scheduler)),
      consumer_(std::move(consumer)),
      trace_(std::make_shared<Trace>("scan of " + table_name_)),
      include_start_row_(true),
      reload_location_(false),
      state_(State::IDLE) {
  if (spec_.metrics_enabled()) {
    metrics_ = std::make_shared<ScanMetrics>(spec_.region_metrics_enabled());
  }
}

ScanDriver::~ScanDriver() {
}

ScanDriver::State ScanDriver::state() const {
  lock_guard<mutex> l(lock_);
  return state_;
}

bool ScanDriver::Transition(Event event) {
  lock_guard<mutex> l(lock_);
  State next;
  Status s = NextState(state_, event, &next);
  if (!s.ok()) {
    LOG(DFATAL) << s.ToString();
    return false;
  }
  VLOG(2) << trace_->name() << ": " << ScanDriverStateToString(state_) << " -> "
          << ScanDriverStateToString(next);
  state_ = next;
  return true;
}

void ScanDriver::Start() {
  spec_.Normalize();
  Status s = spec_.Validate();
  if (!s.ok()) {
    Fail(Event::INVALID_SPEC, s.CloneAndPrepend("invalid scan"));
    return;
  }
  if (!Transition(Event::START)) {
    return;
  }
  trace_->Message("Starting " + spec_.ToString());

  shared_ptr<ScanContext> ctx = std::make_shared<ScanContext>();
  ctx->table_name = table_name_;
  ctx->spec = spec_;
  ctx->config = config_;
  ctx->locator = locator_;
  ctx->stub_factory = stub_factory_;
  ctx->scheduler = scheduler_;
  ctx->metrics = metrics_;
  ctx->trace = trace_;
  ctx_ = std::move(ctx);
  cache_ = NewScanResultCache(spec_);

  start_row_ = spec_.start_row();
  include_start_row_ = spec_.include_start_row();
  reload_location_ = false;

  if (metrics_) {
    consumer_->OnScanMetricsCreated(metrics_);
  }
  OpenRegion();
}

void ScanDriver::OpenRegion() {
  if (!Transition(Event::OPEN_ISSUED)) {
    return;
  }
  if (metrics_) {
    metrics_->MoveToNextRegion();
  }
  trace_->Message("Opening region at " + Slice(start_row_).ToDebugString());

  shared_ptr<ScanDriver> self = shared_from_this();
  OpenCursorCallback cb = [self](const Status& s, unique_ptr<OpenedCursor> opened) {
    self->CursorOpened(s, std::move(opened));
  };
  int32_t row_budget = cache_->RowBudget(spec_.caching());
  if (spec_.consistency() == ScanSpec::Consistency::TIMELINE) {
    std::make_shared<TimelineConsistentRead>(
        ctx_, start_row_, include_start_row_, reload_location_, row_budget)->Call(cb);
  } else {
    std::make_shared<OpenScannerCaller>(
        ctx_, start_row_, include_start_row_, 0, reload_location_, row_budget)->Call(cb);
  }
}

void ScanDriver::CursorOpened(const Status& status, unique_ptr<OpenedCursor> opened) {
  if (!status.ok()) {
    Fail(Event::OPEN_FAILED, status);
    return;
  }
  if (!Transition(Event::CURSOR_OPENED)) {
    return;
  }
  const RegionLocation& loc = opened->cursor->location;
  if (metrics_) {
    metrics_->InitRegionInfo(loc.region.encoded_name(), loc.server, opened->open_metrics);
  }
  trace_->Message("Pulling " + opened->cursor->ToString() +
                  (loc.via_replica() ? " (secondary replica)" : "") +
                  (loc.is_remote ? " (remote)" : ""));
  puller_ = std::make_shared<RegionPuller>(ctx_, std::move(opened), cache_.get(),
                                           consumer_.get());
  shared_ptr<ScanDriver> self = shared_from_this();
  puller_->Start([self](const RegionPuller::Outcome& outcome) {
    self->PullerDone(outcome);
  });
}

void ScanDriver::PullerDone(const RegionPuller::Outcome& outcome) {
  puller_.reset();
  switch (outcome.verdict) {
    case RegionPuller::Verdict::REGION_EXHAUSTED:
      if (!outcome.has_more) {
        break;
      }
      if (!Transition(Event::REGION_EXHAUSTED)) {
        return;
      }
      start_row_ = outcome.next_start_row;
      include_start_row_ = outcome.next_start_inclusive;
      reload_location_ = outcome.reload_location;
      OpenRegion();
      return;
    case RegionPuller::Verdict::SCAN_COMPLETE:
      break;
    case RegionPuller::Verdict::ERROR:
      Fail(Event::PULL_FAILED, outcome.status);
      return;
  }
  Complete();
}

void ScanDriver::Complete() {
  if (!Transition(Event::SCAN_COMPLETE)) {
    return;
  }
  trace_->End(Status::OK());
  if (metrics_) {
    VLOG(1) << trace_->name() << " complete: " << metrics_->ToString();
  }
  consumer_->OnComplete();
}

void ScanDriver::Fail(Event event, const Status& status) {
  if (!Transition(event)) {
    return;
  }
  LOG(WARNING) << trace_->name() << " failed: " << status.ToString();
  trace_->End(status);
  consumer_->OnError(status);
}

} // namespace client
} // namespace kvscan
