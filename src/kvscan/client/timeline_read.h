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
#ifndef KVSCAN_CLIENT_TIMELINE_READ_H
#define KVSCAN_CLIENT_TIMELINE_READ_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kvscan/client/open_scanner_caller.h"
#include "kvscan/client/region_location.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

struct ScanContext;

// Opens a scanner for a timeline-consistent scan. The primary replica is
// tried first; if it has not answered within the primary call timeout (or
// failed), the same open call is sent to every secondary replica. The first
// replica to open a scanner wins. Results arriving after the winner are
// ignored: those scanners are left to expire on the server. The read fails
// only once every replica failed, with the error of the primary.
//
// This class is thread-safe: the replica calls may complete concurrently.
class TimelineConsistentRead : public std::enable_shared_from_this<TimelineConsistentRead> {
 public:
  TimelineConsistentRead(std::shared_ptr<const ScanContext> ctx,
                         std::string start_row,
                         bool include_start_row,
                         bool reload_location,
                         int32_t row_budget);

  // Starts the race. 'callback' runs exactly once.
  void Call(OpenCursorCallback callback);

 private:
  void LaunchSecondaries();
  void SecondariesLocated(const Status& status, const RegionLocations& locations);
  void StartReplica(int replica_id);
  void ReplicaDone(int replica_id, const Status& status,
                   std::unique_ptr<OpenedCursor> opened);

  // Called with 'lock_' held when one outstanding operation failed.
  // Returns true if that was the last one and the read failed.
  bool OperationFailedUnlocked(const Status& status);

  const std::shared_ptr<const ScanContext> ctx_;
  const std::string start_row_;
  const bool include_start_row_;
  const bool reload_location_;
  const int32_t row_budget_;

  std::mutex lock_;
  OpenCursorCallback callback_;
  bool done_;
  bool secondaries_launched_;

  // Replica calls and locate calls still running.
  int pending_;
  Status primary_error_;
  Status first_error_;

  std::vector<std::shared_ptr<OpenScannerCaller>> callers_;

  DISALLOW_COPY_AND_ASSIGN(TimelineConsistentRead);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_TIMELINE_READ_H
