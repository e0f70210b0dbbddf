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
#ifndef KVSCAN_CLIENT_SCAN_CONFIGURATION_H
#define KVSCAN_CLIENT_SCAN_CONFIGURATION_H

#include <cstdint>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

// The retry policy of a scan. The defaults are taken from the command line
// flags at construction; every option can be overridden per scan.
class ScanConfiguration {
 public:
  ScanConfiguration();

  // Maximum number of attempts of one open or continue step.
  Status SetMaxAttempts(int max_attempts) WARN_UNUSED_RESULT;

  // Base pause between attempts.
  Status SetPause(const MonoDelta& pause) WARN_UNUSED_RESULT;

  // Base pause between attempts when the server reported overload. Must not
  // be shorter than the regular pause.
  Status SetPauseServerOverloaded(const MonoDelta& pause) WARN_UNUSED_RESULT;

  // Time budget of one open or continue step, retries included.
  Status SetScanTimeout(const MonoDelta& timeout) WARN_UNUSED_RESULT;

  // Time budget of a single RPC.
  Status SetRpcTimeout(const MonoDelta& timeout) WARN_UNUSED_RESULT;

  // How long a timeline-consistent read waits for the primary replica before
  // racing the secondaries. Zero races immediately.
  Status SetPrimaryCallTimeout(const MonoDelta& timeout) WARN_UNUSED_RESULT;

  // Retry errors are logged as warnings only after this many attempts.
  Status SetStartLogErrorsCount(int count) WARN_UNUSED_RESULT;

  int max_attempts() const { return max_attempts_; }
  const MonoDelta& pause() const { return pause_; }
  const MonoDelta& pause_server_overloaded() const { return pause_server_overloaded_; }
  const MonoDelta& scan_timeout() const { return scan_timeout_; }
  const MonoDelta& rpc_timeout() const { return rpc_timeout_; }
  const MonoDelta& primary_call_timeout() const { return primary_call_timeout_; }
  int start_log_errors_count() const { return start_log_errors_count_; }

 private:
  int max_attempts_;
  MonoDelta pause_;
  MonoDelta pause_server_overloaded_;
  MonoDelta scan_timeout_;
  MonoDelta rpc_timeout_;
  MonoDelta primary_call_timeout_;
  int start_log_errors_count_;
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_CONFIGURATION_H
