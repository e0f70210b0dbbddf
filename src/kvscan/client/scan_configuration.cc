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

#include "kvscan/client/scan_configuration.h"

#include <string>

#include <gflags/gflags.h>

DEFINE_int32(scanner_max_attempts, 16,
             "Maximum number of attempts of a single scanner open or continue "
             "step before the scan fails.");
DEFINE_int32(scanner_pause_ms, 100,
             "Base pause in milliseconds between two attempts of a scanner call. "
             "The pause grows exponentially with the attempt number.");
DEFINE_int32(scanner_pause_server_overloaded_ms, 1000,
             "Base pause in milliseconds between two attempts of a scanner call "
             "when the region server reported that it is overloaded.");
DEFINE_int32(scanner_timeout_ms, 60000,
             "Time budget in milliseconds of one scanner open or continue step, "
             "retries included.");
DEFINE_int32(scanner_rpc_timeout_ms, 10000,
             "Timeout in milliseconds of a single scanner RPC.");
DEFINE_int32(scanner_primary_call_timeout_ms, 1000,
             "For timeline-consistent scans, how long to wait for the primary "
             "replica before sending the open call to the secondary replicas.");
DEFINE_int32(scanner_start_log_errors_count, 5,
             "Retried scanner errors are logged as warnings only once the attempt "
             "number exceeds this value.");
DEFINE_int32(scanner_caching, 100,
             "Default number of rows requested per scanner RPC.");

namespace kvscan {
namespace client {

ScanConfiguration::ScanConfiguration()
    : max_attempts_(FLAGS_scanner_max_attempts),
      pause_(MonoDelta::FromMilliseconds(FLAGS_scanner_pause_ms)),
      pause_server_overloaded_(
          MonoDelta::FromMilliseconds(FLAGS_scanner_pause_server_overloaded_ms)),
      scan_timeout_(MonoDelta::FromMilliseconds(FLAGS_scanner_timeout_ms)),
      rpc_timeout_(MonoDelta::FromMilliseconds(FLAGS_scanner_rpc_timeout_ms)),
      primary_call_timeout_(MonoDelta::FromMilliseconds(FLAGS_scanner_primary_call_timeout_ms)),
      start_log_errors_count_(FLAGS_scanner_start_log_errors_count) {
  if (pause_server_overloaded_ < pause_) {
    pause_server_overloaded_ = pause_;
  }
}

Status ScanConfiguration::SetMaxAttempts(int max_attempts) {
  if (max_attempts < 1) {
    return Status::InvalidArgument("max attempts must be at least 1",
                                   std::to_string(max_attempts));
  }
  max_attempts_ = max_attempts;
  return Status::OK();
}

Status ScanConfiguration::SetPause(const MonoDelta& pause) {
  if (!pause.Initialized() || pause.ToNanoseconds() < 0) {
    return Status::InvalidArgument("pause must not be negative");
  }
  pause_ = pause;
  if (pause_server_overloaded_ < pause_) {
    pause_server_overloaded_ = pause_;
  }
  return Status::OK();
}

Status ScanConfiguration::SetPauseServerOverloaded(const MonoDelta& pause) {
  if (!pause.Initialized() || pause < pause_) {
    return Status::InvalidArgument(
        "overloaded pause must not be shorter than the regular pause",
        pause.ToString() + " < " + pause_.ToString());
  }
  pause_server_overloaded_ = pause;
  return Status::OK();
}

Status ScanConfiguration::SetScanTimeout(const MonoDelta& timeout) {
  if (!timeout.Initialized() || timeout.ToNanoseconds() <= 0) {
    return Status::InvalidArgument("scan timeout must be positive");
  }
  scan_timeout_ = timeout;
  return Status::OK();
}

Status ScanConfiguration::SetRpcTimeout(const MonoDelta& timeout) {
  if (!timeout.Initialized() || timeout.ToNanoseconds() <= 0) {
    return Status::InvalidArgument("RPC timeout must be positive");
  }
  rpc_timeout_ = timeout;
  return Status::OK();
}

Status ScanConfiguration::SetPrimaryCallTimeout(const MonoDelta& timeout) {
  if (!timeout.Initialized() || timeout.ToNanoseconds() < 0) {
    return Status::InvalidArgument("primary call timeout must not be negative");
  }
  primary_call_timeout_ = timeout;
  return Status::OK();
}

Status ScanConfiguration::SetStartLogErrorsCount(int count) {
  if (count < 0) {
    return Status::InvalidArgument("start log errors count must not be negative",
                                   std::to_string(count));
  }
  start_log_errors_count_ = count;
  return Status::OK();
}

} // namespace client
} // namespace kvscan
