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
#ifndef KVSCAN_CLIENT_REGION_PULLER_H
#define KVSCAN_CLIENT_REGION_PULLER_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "kvscan/client/client.pb.h"
#include "kvscan/client/open_scanner_caller.h"
#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_consumer.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/rpc.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

class ScanResultCache;
struct ScanContext;

// Pulls the rows of one region out of an open scanner and hands them to the
// consumer through the result cache.
//
// Continue calls are strictly sequential: the next call is only sent once
// the previous one completed and its rows were delivered. Transient errors
// are retried on the same scanner with backoff. An expired scanner, an
// out-of-order answer or a moved region end the puller with a request to
// re-open the region at the position just past the last accepted row.
//
// The puller reports exactly one outcome.
class RegionPuller : public std::enable_shared_from_this<RegionPuller> {
 public:
  enum class Verdict {
    // No more rows in this region. The scan goes on at 'next_start_row'.
    REGION_EXHAUSTED,
    // The scan has no more rows: the last region was exhausted, the stop row
    // or the row limit was reached, or the consumer terminated the scan.
    SCAN_COMPLETE,
    // An unrecoverable error.
    ERROR,
  };

  struct Outcome {
    Outcome()
        : verdict(Verdict::ERROR),
          has_more(false),
          next_start_inclusive(true),
          reload_location(false) {
    }

    std::string ToString() const;

    Verdict verdict;

    // Whether another region lies within the scan range.
    bool has_more;

    // Where the scan continues, for REGION_EXHAUSTED.
    std::string next_start_row;
    bool next_start_inclusive;

    // The cached location of the region is stale and must be resolved again.
    bool reload_location;

    // The error, for ERROR.
    Status status;
  };

  typedef std::function<void(const Outcome& outcome)> OutcomeCallback;

  // 'cache' and 'consumer' must outlive the puller.
  RegionPuller(std::shared_ptr<const ScanContext> ctx,
               std::unique_ptr<OpenedCursor> opened,
               ScanResultCache* cache,
               AdvancedScanConsumer* consumer);
  ~RegionPuller();

  // Delivers the rows returned by the open call and pulls the rest of the
  // region. 'callback' runs exactly once.
  void Start(OutcomeCallback callback);

  const CursorHandle& cursor() const { return *cursor_; }

 private:
  class Controller;
  class Resumer;

  void HandleBatch(const RowBatch& batch);

  // Delivers the queued rows, then decides what comes next.
  void DeliverAndContinue();

  // Acts on what the consumer did with the controller during a callback.
  // Returns true if delivery goes on right away.
  bool AfterCallback(const Controller& controller);

  void SendContinue();
  void ContinueDone();
  void Retry(const MonoDelta& pause, const Status& why);

  void ResumeFromSuspension();
  void ScheduleLeaseRenewal();
  void SendRenewal();

  // Best-effort close of the server-side scanner, when the scan stops before
  // the server exhausted it.
  void CloseScanner();

  void Reopen(bool reload_location);
  void FinishRegion();
  void FinishScan(const std::string& why);
  void Fail(const Status& status);
  void Finish(const Outcome& outcome);

  const std::shared_ptr<const ScanContext> ctx_;
  const std::unique_ptr<CursorHandle> cursor_;
  const std::string open_start_row_;
  const bool open_start_inclusive_;
  RowBatch first_batch_;
  ScanResultCache* const cache_;
  AdvancedScanConsumer* const consumer_;

  rpc::RpcRetrier retrier_;
  ScanRequestPB req_;
  ScanResponsePB resp_;

  // The server reported that the region, or the whole scan, has no more rows.
  bool region_done_;
  bool scan_done_;

  OutcomeCallback callback_;

  // Protects the lease deadline of 'cursor_', which renewals update while
  // the scan is suspended, and 'resumer_'.
  mutable std::mutex lock_;
  std::weak_ptr<Resumer> resumer_;

  DISALLOW_COPY_AND_ASSIGN(RegionPuller);
};

const char* VerdictToString(RegionPuller::Verdict verdict);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_REGION_PULLER_H
