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
#ifndef KVSCAN_CLIENT_SCAN_RPC_STATUS_H
#define KVSCAN_CLIENT_SCAN_RPC_STATUS_H

#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {

namespace rpc {
class RpcController;
} // namespace rpc

namespace client {

// The outcome of one scan RPC, as relevant to deciding what to do next.
struct ScanRpcStatus {
  enum Result {
    OK,

    // The server no longer serves the region, or the region moved to another
    // server. The location must be resolved again.
    REGION_MOVED,

    // The scanner on the server side expired or was reset.
    SCANNER_EXPIRED,

    // The server saw a continue call with an unexpected sequence number,
    // typically a retry of a call which it already answered.
    OUT_OF_ORDER,

    // The server is overloaded; retry after the longer pause.
    SERVER_OVERLOADED,

    // The server received the request but was not ready to serve it right
    // away, for example because the region is still opening.
    SERVICE_UNAVAILABLE,

    // Another RPC-system error (e.g. NetworkError because the server was down).
    RPC_ERROR,

    // The deadline for an individual RPC was exceeded, but there is time left
    // for another attempt.
    RPC_DEADLINE_EXCEEDED,

    // The deadline of the whole step was exceeded.
    OVERALL_DEADLINE_EXCEEDED,

    // The server closed the connection after sending a connection-level
    // exception. No scanner survives it.
    CONNECTION_FATAL,

    // The server flagged the exception as not retriable.
    DO_NOT_RETRY,

    // The request was malformed, or refers to something which does not
    // exist or which the caller may not access.
    INVALID_REQUEST,
  };

  // True if the same call may simply be sent again after a pause.
  bool retriable() const;

  // True if the scanner must be re-opened at the resume position.
  bool needs_reopen() const;

  Result result;
  Status status;
};

const char* ScanRpcStatusResultToString(ScanRpcStatus::Result result);

// Classifies the outcome of a finished scan RPC. 'overall_deadline' is the
// deadline of the step the call belongs to; a call which timed out at that
// deadline leaves no time for another attempt.
ScanRpcStatus AnalyzeScanResponse(const rpc::RpcController& controller,
                                  const MonoTime& overall_deadline);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_RPC_STATUS_H
