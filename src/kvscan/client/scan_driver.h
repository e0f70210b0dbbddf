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
#ifndef KVSCAN_CLIENT_SCAN_DRIVER_H
#define KVSCAN_CLIENT_SCAN_DRIVER_H

#include <memory>
#include <mutex>
#include <string>

#include "kvscan/client/open_scanner_caller.h"
#include "kvscan/client/region_puller.h"
#include "kvscan/client/scan_configuration.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {

class Trace;

namespace rpc {
class Scheduler;
} // namespace rpc

namespace client {

class AdvancedScanConsumer;
class RegionLocator;
class ScanMetrics;
class ScanResultCache;
class StubFactory;
struct ScanContext;

// Drives one scan across all the regions of its key range, one region at a
// time and in key order.
//
// For each region the driver opens a scanner at the current start row
// (racing the replicas of the region for timeline-consistent scans), then
// hands the scanner to a RegionPuller. The outcome of the puller decides
// whether the driver moves on to the next region, completes, or fails.
//
// The states of the driver and the transitions between them are explicit:
//
//   IDLE --START--> LOCATING_REGION --OPEN_ISSUED--> OPENING_CURSOR
//   OPENING_CURSOR --CURSOR_OPENED--> PULLING
//   PULLING --REGION_EXHAUSTED--> LOCATING_REGION
//   PULLING --SCAN_COMPLETE--> COMPLETED
//   IDLE --INVALID_SPEC--> FAILED
//   OPENING_CURSOR --OPEN_FAILED--> FAILED
//   PULLING --PULL_FAILED--> FAILED
//
// The consumer gets OnScanMetricsCreated() first when metrics are enabled,
// then the rows, then exactly one of OnComplete() and OnError(). The trace
// of the scan is ended exactly once, when the driver reaches COMPLETED or
// FAILED.
class ScanDriver : public std::enable_shared_from_this<ScanDriver> {
 public:
  enum class State {
    IDLE,
    LOCATING_REGION,
    OPENING_CURSOR,
    PULLING,
    COMPLETED,
    FAILED,
  };

  enum class Event {
    START,
    INVALID_SPEC,
    OPEN_ISSUED,
    CURSOR_OPENED,
    OPEN_FAILED,
    REGION_EXHAUSTED,
    SCAN_COMPLETE,
    PULL_FAILED,
  };

  // The transition function of the driver. Returns IllegalState if 'event'
  // cannot happen in state 'from'.
  static Status NextState(State from, Event event, State* to) WARN_UNUSED_RESULT;

  ScanDriver(std::string table_name,
             ScanSpec spec,
             ScanConfiguration config,
             std::shared_ptr<RegionLocator> locator,
             std::shared_ptr<StubFactory> stub_factory,
             std::shared_ptr<rpc::Scheduler> scheduler,
             std::shared_ptr<AdvancedScanConsumer> consumer);
  ~ScanDriver();

  // Starts the scan. Returns at once; the consumer is called back from the
  // threads completing the RPCs. May be called only once.
  void Start();

  State state() const;

  const std::shared_ptr<Trace>& trace() const { return trace_; }

  // Null unless the scan has metrics enabled.
  const std::shared_ptr<ScanMetrics>& metrics() const { return metrics_; }

 private:
  // Applies 'event' to the current state. An invalid transition is a bug;
  // returns false if it happens.
  bool Transition(Event event);

  void OpenRegion();
  void CursorOpened(const Status& status, std::unique_ptr<OpenedCursor> opened);
  void PullerDone(const RegionPuller::Outcome& outcome);

  void Complete();
  void Fail(Event event, const Status& status);

  std::string table_name_;
  ScanSpec spec_;
  ScanConfiguration config_;
  std::shared_ptr<RegionLocator> locator_;
  std::shared_ptr<StubFactory> stub_factory_;
  std::shared_ptr<rpc::Scheduler> scheduler_;
  const std::shared_ptr<AdvancedScanConsumer> consumer_;
  const std::shared_ptr<Trace> trace_;
  std::shared_ptr<ScanMetrics> metrics_;

  // Built by Start() once the scan spec is valid.
  std::shared_ptr<const ScanContext> ctx_;
  std::unique_ptr<ScanResultCache> cache_;

  // Where the next region is opened.
  std::string start_row_;
  bool include_start_row_;
  bool reload_location_;

  std::shared_ptr<RegionPuller> puller_;

  // Protects 'state_', which tests read while the scan runs.
  mutable std::mutex lock_;
  State state_;

  DISALLOW_COPY_AND_ASSIGN(ScanDriver);
};

const char* ScanDriverStateToString(ScanDriver::State state);
const char* ScanDriverEventToString(ScanDriver::Event event);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_DRIVER_H
