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

#include "kvscan/client/scan_rpc_status.h"

#include <glog/logging.h>

#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/rpc_header.pb.h"

namespace kvscan {
namespace client {

bool ScanRpcStatus::retriable() const {
  switch (result) {
    case SERVER_OVERLOADED:
    case SERVICE_UNAVAILABLE:
    case RPC_ERROR:
    case RPC_DEADLINE_EXCEEDED:
      return true;
    default:
      return false;
  }
}

bool ScanRpcStatus::needs_reopen() const {
  return result == REGION_MOVED || result == SCANNER_EXPIRED || result == OUT_OF_ORDER;
}

const char* ScanRpcStatusResultToString(ScanRpcStatus::Result result) {
  switch (result) {
    case ScanRpcStatus::OK: return "OK";
    case ScanRpcStatus::REGION_MOVED: return "REGION_MOVED";
    case ScanRpcStatus::SCANNER_EXPIRED: return "SCANNER_EXPIRED";
    case ScanRpcStatus::OUT_OF_ORDER: return "OUT_OF_ORDER";
    case ScanRpcStatus::SERVER_OVERLOADED: return "SERVER_OVERLOADED";
    case ScanRpcStatus::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
    case ScanRpcStatus::RPC_ERROR: return "RPC_ERROR";
    case ScanRpcStatus::RPC_DEADLINE_EXCEEDED: return "RPC_DEADLINE_EXCEEDED";
    case ScanRpcStatus::OVERALL_DEADLINE_EXCEEDED: return "OVERALL_DEADLINE_EXCEEDED";
    case ScanRpcStatus::CONNECTION_FATAL: return "CONNECTION_FATAL";
    case ScanRpcStatus::DO_NOT_RETRY: return "DO_NOT_RETRY";
    case ScanRpcStatus::INVALID_REQUEST: return "INVALID_REQUEST";
  }
  LOG(FATAL) << "unknown scan RPC result " << static_cast<int>(result);
  return "UNKNOWN";
}

ScanRpcStatus AnalyzeScanResponse(const rpc::RpcController& controller,
                                  const MonoTime& overall_deadline) {
  const Status rpc_status = controller.status();
  if (rpc_status.ok()) {
    return ScanRpcStatus{ScanRpcStatus::OK, Status::OK()};
  }

  // Exceptions sent back by the server: the server is up and answered.
  if (rpc_status.IsRemoteError()) {
    const rpc::ExceptionResponsePB* err = controller.error_response();
    DCHECK(err);
    if (controller.connection_fatal()) {
      return ScanRpcStatus{ScanRpcStatus::CONNECTION_FATAL, rpc_status};
    }
    if (err == nullptr) {
      return ScanRpcStatus{ScanRpcStatus::RPC_ERROR, rpc_status};
    }
    if (err->do_not_retry()) {
      return ScanRpcStatus{ScanRpcStatus::DO_NOT_RETRY, rpc_status};
    }
    if (err->server_overloaded()) {
      return ScanRpcStatus{ScanRpcStatus::SERVER_OVERLOADED, rpc_status};
    }
    switch (err->code()) {
      case rpc::NOT_SERVING_REGION: // fall-through
      case rpc::REGION_MOVED:
        return ScanRpcStatus{ScanRpcStatus::REGION_MOVED, rpc_status};
      case rpc::UNKNOWN_SCANNER: // fall-through
      case rpc::SCANNER_RESET:
        return ScanRpcStatus{ScanRpcStatus::SCANNER_EXPIRED, rpc_status};
      case rpc::OUT_OF_ORDER_SCANNER_NEXT:
        return ScanRpcStatus{ScanRpcStatus::OUT_OF_ORDER, rpc_status};
      case rpc::REGION_TOO_BUSY: // fall-through
      case rpc::CALL_QUEUE_TOO_BIG:
        return ScanRpcStatus{ScanRpcStatus::SERVER_OVERLOADED, rpc_status};
      case rpc::REGION_OPENING:
        return ScanRpcStatus{ScanRpcStatus::SERVICE_UNAVAILABLE, rpc_status};
      case rpc::INVALID_REQUEST: // fall-through
      case rpc::ACCESS_DENIED: // fall-through
      case rpc::TABLE_NOT_FOUND:
        return ScanRpcStatus{ScanRpcStatus::INVALID_REQUEST, rpc_status};
      default:
        return ScanRpcStatus{ScanRpcStatus::RPC_ERROR, rpc_status};
    }
  }

  if (rpc_status.IsTimedOut()) {
    if (overall_deadline.Initialized() && controller.deadline() >= overall_deadline) {
      return ScanRpcStatus{ScanRpcStatus::OVERALL_DEADLINE_EXCEEDED, rpc_status};
    }
    return ScanRpcStatus{ScanRpcStatus::RPC_DEADLINE_EXCEEDED, rpc_status};
  }
  if (rpc_status.IsServiceUnavailable()) {
    return ScanRpcStatus{ScanRpcStatus::SERVICE_UNAVAILABLE, rpc_status};
  }
  if (rpc_status.IsCorruption() || rpc_status.IsNotSupported()) {
    // The response could not be decoded: sending the call again would not
    // help.
    return ScanRpcStatus{ScanRpcStatus::DO_NOT_RETRY, rpc_status};
  }
  return ScanRpcStatus{ScanRpcStatus::RPC_ERROR, rpc_status};
}

} // namespace client
} // namespace kvscan
