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

#include "kvscan/rpc/rpc_controller.h"

#include <string>

#include <gtest/gtest.h>

#include "kvscan/rpc/constants.h"
#include "kvscan/rpc/rpc_header.pb.h"
#include "kvscan/rpc/serialization.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::string;

namespace kvscan {
namespace rpc {

class RpcControllerTest : public KvScanTest {
 protected:
  static string ExceptionFrame(int32_t call_id, ServerErrorCodePB code) {
    ResponseHeaderPB header;
    header.set_call_id(call_id);
    ExceptionResponsePB* exc = header.mutable_exception();
    exc->set_exception_class_name("org.apache.hadoop.hbase.NotServingRegionException");
    exc->set_code(code);
    string frame;
    serialization::SerializeResponse(&header, nullptr, Slice(), &frame);
    return frame;
  }
};

TEST_F(RpcControllerTest, TestSuccessKeepsCellBlock) {
  UserInformationPB body;
  body.set_effective_user("scanner");
  ResponseHeaderPB header;
  header.set_call_id(3);
  string frame;
  serialization::SerializeResponse(&header, &body, Slice("cells"), &frame);

  RpcController controller;
  UserInformationPB response;
  controller.CompleteFromFrame(Slice(frame), &response);
  ASSERT_TRUE(controller.finished());
  ASSERT_OK(controller.status());
  ASSERT_EQ("scanner", response.effective_user());
  ASSERT_EQ("cells", controller.response_cell_block().ToString());
  ASSERT_TRUE(controller.error_response() == nullptr);

  controller.Reset();
  ASSERT_FALSE(controller.finished());
  ASSERT_TRUE(controller.response_cell_block().empty());
}

TEST_F(RpcControllerTest, TestRemoteError) {
  string frame = ExceptionFrame(7, NOT_SERVING_REGION);
  RpcController controller;
  UserInformationPB response;
  controller.CompleteFromFrame(Slice(frame), &response);
  Status s = controller.status();
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "NotServingRegionException");
  ASSERT_STR_CONTAINS(s.ToString(), "NOT_SERVING_REGION");
  ASSERT_FALSE(controller.connection_fatal());
  ASSERT_TRUE(controller.error_response() != nullptr);
  ASSERT_EQ(NOT_SERVING_REGION, controller.error_response()->code());
}

TEST_F(RpcControllerTest, TestConnectionFatalError) {
  string frame = ExceptionFrame(kFatalConnectionCallId, UNKNOWN_ERROR);
  RpcController controller;
  UserInformationPB response;
  controller.CompleteFromFrame(Slice(frame), &response);
  ASSERT_TRUE(controller.status().IsRemoteError());
  ASSERT_TRUE(controller.connection_fatal());
}

TEST_F(RpcControllerTest, TestInvalidBody) {
  // An empty message lacks the required field of the expected response.
  ConnectionHeaderPB body;
  ResponseHeaderPB header;
  header.set_call_id(1);
  string frame;
  serialization::SerializeResponse(&header, &body, Slice(), &frame);

  RpcController controller;
  UserInformationPB response;
  controller.CompleteFromFrame(Slice(frame), &response);
  Status s = controller.status();
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "invalid response body");
}

TEST_F(RpcControllerTest, TestMalformedFrame) {
  RpcController controller;
  UserInformationPB response;
  controller.CompleteFromFrame(Slice("\x00\x01", 2), &response);
  ASSERT_TRUE(controller.status().IsCorruption()) << controller.status().ToString();
}

TEST_F(RpcControllerTest, TestMarkFailed) {
  RpcController controller;
  controller.set_timeout(MonoDelta::FromSeconds(1));
  ASSERT_LE(controller.timeout(), MonoDelta::FromSeconds(1));
  controller.MarkFailed(Status::TimedOut("call timed out"));
  ASSERT_TRUE(controller.finished());
  ASSERT_TRUE(controller.status().IsTimedOut());
  ASSERT_FALSE(controller.connection_fatal());
}

} // namespace rpc
} // namespace kvscan
