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
#ifndef KVSCAN_CLIENT_OPEN_SCANNER_CALLER_H
#define KVSCAN_CLIENT_OPEN_SCANNER_CALLER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "kvscan/client/client.pb.h"
#include "kvscan/client/region_location.h"
#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_metrics.h"
#include "kvscan/client/scan_rpc_status.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/rpc.h"
#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

class RegionServerStub;
struct ScanContext;

// A scanner opened on a region server.
struct CursorHandle {
  CursorHandle()
      : scanner_id(0),
        next_call_seq(0) {
  }

  // Records that the server extended the lease by 'ttl_ms' from now. A zero
  // ttl means the server did not announce a lease.
  void RenewLease(uint32_t ttl_ms);

  // True if the lease announced by the server has run out at 'now'.
  bool LeaseExpired(const MonoTime& now) const;

  std::string ToString() const;

  uint64_t scanner_id;
  RegionLocation location;

  // Lease announced by the server; uninitialized if none.
  MonoDelta lease;
  MonoTime lease_deadline;

  std::shared_ptr<RegionServerStub> stub;

  // Controller of the calls sent on this scanner.
  rpc::RpcController controller;

  // Sequence number of the next continue call.
  uint64_t next_call_seq;

 private:
  DISALLOW_COPY_AND_ASSIGN(CursorHandle);
};

// The result of opening a scanner: the scanner itself and the rows which
// came back with the open call.
struct OpenedCursor {
  std::unique_ptr<CursorHandle> cursor;
  RowBatch first_batch;

  // Where the scanner starts.
  std::string start_row;
  bool include_start_row;

  // The calls made to open the scanner, to be booked against its region
  // once the scan adopts it.
  ScanMetrics::RegionMetrics open_metrics;
};

typedef std::function<void(const Status& status,
                           std::unique_ptr<OpenedCursor> opened)> OpenCursorCallback;

// Locates the region holding a start row and opens a scanner on one of its
// replicas, retrying as configured. A region moved answer invalidates the
// cached location and locates the region again.
class OpenScannerCaller : public std::enable_shared_from_this<OpenScannerCaller> {
 public:
  OpenScannerCaller(std::shared_ptr<const ScanContext> ctx,
                    std::string start_row,
                    bool include_start_row,
                    int replica_id,
                    bool reload_location,
                    int32_t row_budget);

  // Starts the call. 'callback' runs exactly once.
  void Call(OpenCursorCallback callback);

  int replica_id() const { return replica_id_; }

 private:
  void Locate();
  void LocateDone(const Status& status, const RegionLocation& location);
  void SendOpen();
  void OpenDone();
  void Retry(const MonoDelta& pause, const Status& why);
  void Finish(const Status& status, std::unique_ptr<OpenedCursor> opened);

  const std::shared_ptr<const ScanContext> ctx_;
  const std::string start_row_;
  const bool include_start_row_;
  const int replica_id_;
  bool reload_location_;
  const int32_t row_budget_;

  rpc::RpcRetrier retrier_;
  RegionLocation location_;
  std::shared_ptr<RegionServerStub> stub_;
  ScanRequestPB req_;
  ScanResponsePB resp_;
  rpc::RpcController controller_;
  OpenCursorCallback callback_;

  // Calls made by this caller. They reach the region counters only if the
  // scan pulls from the scanner this caller opens.
  ScanMetrics::RegionMetrics open_metrics_;

  DISALLOW_COPY_AND_ASSIGN(OpenScannerCaller);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_OPEN_SCANNER_CALLER_H
