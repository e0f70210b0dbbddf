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

#include <memory>

#include <gtest/gtest.h>

#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/rpc_header.pb.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/test_util.h"

using std::unique_ptr;

namespace kvscan {
namespace client {

class ScanRpcStatusTest : public KvScanTest {
 protected:
  static ScanRpcStatus::Result AnalyzeException(rpc::ServerErrorCodePB code,
                                                bool do_not_retry = false,
                                                bool overloaded = false,
                                                bool connection_fatal = false) {
    unique_ptr<rpc::ExceptionResponsePB> err(new rpc::ExceptionResponsePB());
    err->set_exception_class_name("org.apache.hadoop.hbase.SomeException");
    err->set_code(code);
    err->set_do_not_retry(do_not_retry);
    err->set_server_overloaded(overloaded);
    rpc::RpcController controller;
    controller.MarkRemoteError(std::move(err), connection_fatal);
    return AnalyzeScanResponse(controller, MonoTime()).result;
  }

  static ScanRpcStatus::Result AnalyzeLocal(const Status& s) {
    rpc::RpcController controller;
    controller.MarkFailed(s);
    return AnalyzeScanResponse(controller, MonoTime()).result;
  }
};

TEST_F(ScanRpcStatusTest, TestSuccess) {
  rpc::RpcController controller;
  controller.MarkSucceeded("");
  ScanRpcStatus status = AnalyzeScanResponse(controller, MonoTime::Now());
  ASSERT_EQ(ScanRpcStatus::OK, status.result);
  ASSERT_TRUE(status.status.ok());
  ASSERT_FALSE(status.retriable());
  ASSERT_FALSE(status.needs_reopen());
}

TEST_F(ScanRpcStatusTest, TestServerExceptions) {
  ASSERT_EQ(ScanRpcStatus::REGION_MOVED, AnalyzeException(rpc::NOT_SERVING_REGION));
  ASSERT_EQ(ScanRpcStatus::REGION_MOVED, AnalyzeException(rpc::REGION_MOVED));
  ASSERT_EQ(ScanRpcStatus::SCANNER_EXPIRED, AnalyzeException(rpc::UNKNOWN_SCANNER));
  ASSERT_EQ(ScanRpcStatus::SCANNER_EXPIRED, AnalyzeException(rpc::SCANNER_RESET));
  ASSERT_EQ(ScanRpcStatus::OUT_OF_ORDER,
            AnalyzeException(rpc::OUT_OF_ORDER_SCANNER_NEXT));
  ASSERT_EQ(ScanRpcStatus::SERVER_OVERLOADED, AnalyzeException(rpc::REGION_TOO_BUSY));
  ASSERT_EQ(ScanRpcStatus::SERVER_OVERLOADED, AnalyzeException(rpc::CALL_QUEUE_TOO_BIG));
  ASSERT_EQ(ScanRpcStatus::SERVICE_UNAVAILABLE, AnalyzeException(rpc::REGION_OPENING));
  ASSERT_EQ(ScanRpcStatus::INVALID_REQUEST, AnalyzeException(rpc::TABLE_NOT_FOUND));
  ASSERT_EQ(ScanRpcStatus::RPC_ERROR, AnalyzeException(rpc::UNKNOWN_ERROR));
}

TEST_F(ScanRpcStatusTest, TestExceptionFlagsTakePrecedence) {
  ASSERT_EQ(ScanRpcStatus::DO_NOT_RETRY,
            AnalyzeException(rpc::REGION_OPENING, true));
  ASSERT_EQ(ScanRpcStatus::SERVER_OVERLOADED,
            AnalyzeException(rpc::UNKNOWN_ERROR, false, true));
  ASSERT_EQ(ScanRpcStatus::CONNECTION_FATAL,
            AnalyzeException(rpc::UNKNOWN_ERROR, false, false, true));
}

TEST_F(ScanRpcStatusTest, TestLocalFailures) {
  ASSERT_EQ(ScanRpcStatus::RPC_ERROR, AnalyzeLocal(Status::NetworkError("refused")));
  ASSERT_EQ(ScanRpcStatus::SERVICE_UNAVAILABLE,
            AnalyzeLocal(Status::ServiceUnavailable("queue full")));
  ASSERT_EQ(ScanRpcStatus::DO_NOT_RETRY, AnalyzeLocal(Status::Corruption("bad frame")));
  ASSERT_EQ(ScanRpcStatus::RPC_DEADLINE_EXCEEDED,
            AnalyzeLocal(Status::TimedOut("call timed out")));
}

TEST_F(ScanRpcStatusTest, TestTimeoutAtOverallDeadline) {
  MonoTime overall = MonoTime::Now() + MonoDelta::FromSeconds(1);
  {
    rpc::RpcController controller;
    controller.set_deadline(overall);
    controller.MarkFailed(Status::TimedOut("call timed out"));
    ASSERT_EQ(ScanRpcStatus::OVERALL_DEADLINE_EXCEEDED,
              AnalyzeScanResponse(controller, overall).result);
  }
  {
    rpc::RpcController controller;
    controller.set_deadline(overall - MonoDelta::FromMilliseconds(500));
    controller.MarkFailed(Status::TimedOut("call timed out"));
    ScanRpcStatus status = AnalyzeScanResponse(controller, overall);
    ASSERT_EQ(ScanRpcStatus::RPC_DEADLINE_EXCEEDED, status.result);
    ASSERT_TRUE(status.retriable());
  }
}

TEST_F(ScanRpcStatusTest, TestRetriableAndReopen) {
  ScanRpcStatus s{ScanRpcStatus::OUT_OF_ORDER, Status::OK()};
  ASSERT_TRUE(s.needs_reopen());
  ASSERT_FALSE(s.retriable());
  s.result = ScanRpcStatus::SERVER_OVERLOADED;
  ASSERT_TRUE(s.retriable());
  s.result = ScanRpcStatus::DO_NOT_RETRY;
  ASSERT_FALSE(s.retriable());
  ASSERT_FALSE(s.needs_reopen());
  ASSERT_STREQ("DO_NOT_RETRY", ScanRpcStatusResultToString(s.result));
}

} // namespace client
} // namespace kvscan
