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
//
// The interfaces through which a scan pushes its rows to the application.
//
// Two kinds of consumers are supported. A ScanConsumer only deals with whole
// rows and stops the scan by returning false from OnNext(). An
// AdvancedScanConsumer additionally receives heartbeats and row fragments
// (when the scan allows partial results) and controls the scan through a
// ScanController, which can suspend the scan without holding a thread.
//
// Both follow the same contract:
//  - OnScanMetricsCreated() is called at most once, before any row, and only
//    if the scan has metrics enabled.
//  - OnNext() is called zero or more times with non-empty batches of rows in
//    strictly increasing key order, never delivering a row twice.
//  - exactly one of OnError() and OnComplete() is called, last.
//
// The callbacks of one scan never run concurrently, but they may run on any
// thread.
#ifndef KVSCAN_CLIENT_SCAN_CONSUMER_H
#define KVSCAN_CLIENT_SCAN_CONSUMER_H

#include <memory>
#include <vector>

#include "kvscan/client/row_result.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

class ScanMetrics;

// Resumes a suspended scan.
class ScanResumer {
 public:
  virtual ~ScanResumer() {}

  // Continues the scan. May be called from any thread, at most once; later
  // calls are ignored.
  virtual void Resume() = 0;
};

// Lets an AdvancedScanConsumer control the scan from within OnNext() or
// OnHeartbeat(). The controller is only valid for the duration of the
// callback it was passed to.
class ScanController {
 public:
  virtual ~ScanController() {}

  // Stops fetching rows once the current callback returns, keeping the
  // server-side scanner open. Returns the handle to resume the scan, or
  // nullptr if the scan was already terminated or suspended.
  virtual std::shared_ptr<ScanResumer> Suspend() = 0;

  // Finishes the scan once the current callback returns. The scan then
  // completes normally: OnComplete() is called.
  virtual void Terminate() = 0;
};

class ScanConsumer {
 public:
  virtual ~ScanConsumer() {}

  virtual void OnScanMetricsCreated(const std::shared_ptr<ScanMetrics>& /* metrics */) {}

  // Returns false to stop the scan early. This is not an error: the scan
  // completes with OnComplete().
  virtual bool OnNext(const std::vector<RowResult>& rows) = 0;

  virtual void OnError(const Status& status) = 0;

  virtual void OnComplete() = 0;
};

class AdvancedScanConsumer {
 public:
  virtual ~AdvancedScanConsumer() {}

  virtual void OnScanMetricsCreated(const std::shared_ptr<ScanMetrics>& /* metrics */) {}

  // With partial results allowed, 'rows' may hold fragments of rows; the
  // fragments of one row arrive in order and RowResult::partial() is set on
  // all but the last one.
  virtual void OnNext(const std::vector<RowResult>& rows, ScanController* controller) = 0;

  // Called when the server reported progress without returning rows.
  virtual void OnHeartbeat(ScanController* /* controller */) {}

  virtual void OnError(const Status& status) = 0;

  virtual void OnComplete() = 0;
};

// Adapts a ScanConsumer to the AdvancedScanConsumer interface which the scan
// machinery drives.
class SimpleConsumerAdapter : public AdvancedScanConsumer {
 public:
  explicit SimpleConsumerAdapter(std::shared_ptr<ScanConsumer> consumer);

  void OnScanMetricsCreated(const std::shared_ptr<ScanMetrics>& metrics) override;
  void OnNext(const std::vector<RowResult>& rows, ScanController* controller) override;
  void OnError(const Status& status) override;
  void OnComplete() override;

 private:
  const std::shared_ptr<ScanConsumer> consumer_;

  DISALLOW_COPY_AND_ASSIGN(SimpleConsumerAdapter);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_CONSUMER_H
