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

#include "kvscan/rpc/serialization.h"

#include <string>

#include <gtest/gtest.h>

#include "kvscan/client/client.pb.h"
#include "kvscan/gutil/endian.h"
#include "kvscan/rpc/constants.h"
#include "kvscan/rpc/rpc_header.pb.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using kvscan::client::ScanRequestPB;
using kvscan::client::ScanResponsePB;
using std::string;

namespace kvscan {
namespace rpc {
namespace serialization {

class SerializationTest : public KvScanTest {
 protected:
  // Builds the frame of a response carrying 'resp' and 'cell_block'.
  static string ResponseFrame(const ScanResponsePB& resp, const string& cell_block) {
    ResponseHeaderPB header;
    header.set_call_id(7);
    string frame;
    SerializeResponse(&header, &resp, Slice(cell_block), &frame);
    return frame;
  }

  // Rewrites the length prefix of 'frame' after its size changed.
  static void FixLengthPrefix(string* frame) {
    NetworkByteOrder::Store32(&(*frame)[0], frame->size() - kMsgLengthPrefixLength);
  }
};

TEST_F(SerializationTest, TestRequestRoundTrip) {
  RequestHeaderPB header;
  header.set_call_id(42);
  header.set_method_name("Scan");
  header.set_priority(200);
  NameBytesPairPB* attr = header.add_attribute();
  attr->set_name("trace-id");
  attr->set_value("abc");

  ScanRequestPB req;
  req.set_scanner_id(1234);
  req.set_number_of_rows(2);
  req.set_next_call_seq(3);

  string frame;
  SerializeRequest(&header, req, Slice("cells"), &frame);
  ASSERT_EQ(frame.size() - kMsgLengthPrefixLength, NetworkByteOrder::Load32(frame.data()));

  RequestHeaderPB parsed_header;
  Slice body;
  Slice cell_block;
  ASSERT_OK(ParseRequest(Slice(frame), &parsed_header, &body, &cell_block));
  ASSERT_EQ(42, parsed_header.call_id());
  ASSERT_EQ("Scan", parsed_header.method_name());
  ASSERT_EQ(200, parsed_header.priority());
  ASSERT_TRUE(parsed_header.request_param());
  ASSERT_EQ(5, parsed_header.cell_block_meta().length());
  ASSERT_EQ(1, parsed_header.attribute_size());
  ASSERT_EQ("trace-id", parsed_header.attribute(0).name());
  ASSERT_EQ("cells", cell_block.ToString());

  ScanRequestPB parsed_req;
  ASSERT_TRUE(parsed_req.ParseFromArray(body.data(), body.size()));
  ASSERT_EQ(1234, parsed_req.scanner_id());
  ASSERT_EQ(2, parsed_req.number_of_rows());
  ASSERT_EQ(3, parsed_req.next_call_seq());
}

TEST_F(SerializationTest, TestResponseWithoutCellBlock) {
  ScanResponsePB resp;
  resp.set_scanner_id(9);
  resp.set_more_results_in_region(false);
  string frame = ResponseFrame(resp, "");

  ResponseHeaderPB header;
  Slice body;
  Slice cell_block;
  ASSERT_OK(ParseResponse(Slice(frame), &header, &body, &cell_block));
  ASSERT_EQ(7, header.call_id());
  ASSERT_FALSE(header.has_cell_block_meta());
  ASSERT_TRUE(cell_block.empty());
  ScanResponsePB parsed;
  ASSERT_TRUE(parsed.ParseFromArray(body.data(), body.size()));
  ASSERT_EQ(9, parsed.scanner_id());
  ASSERT_FALSE(parsed.more_results_in_region());
}

TEST_F(SerializationTest, TestExceptionResponseHasNoBody) {
  ResponseHeaderPB header;
  header.set_call_id(kFatalConnectionCallId);
  header.mutable_exception()->set_exception_class_name("FatalConnectionException");
  header.mutable_exception()->set_do_not_retry(true);
  string frame;
  SerializeResponse(&header, nullptr, Slice(), &frame);

  ResponseHeaderPB parsed;
  Slice body;
  Slice cell_block;
  ASSERT_OK(ParseResponse(Slice(frame), &parsed, &body, &cell_block));
  ASSERT_EQ(kFatalConnectionCallId, parsed.call_id());
  ASSERT_EQ("FatalConnectionException", parsed.exception().exception_class_name());
  ASSERT_TRUE(parsed.exception().do_not_retry());
  ASSERT_TRUE(body.empty());
}

TEST_F(SerializationTest, TestMalformedFrames) {
  ScanResponsePB resp;
  resp.set_scanner_id(9);
  string frame = ResponseFrame(resp, "block");

  ResponseHeaderPB header;
  Slice body;
  Slice cell_block;

  // Shorter than the length prefix.
  Status s = ParseResponse(Slice(frame.data(), 3), &header, &body, &cell_block);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "not enough bytes for length header");

  // The length prefix disagrees with the frame.
  string truncated = frame.substr(0, frame.size() - 1);
  s = ParseResponse(Slice(truncated), &header, &body, &cell_block);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "length prefix does not match");

  // The cell block is shorter than announced.
  FixLengthPrefix(&truncated);
  s = ParseResponse(Slice(truncated), &header, &body, &cell_block);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "cell block too short");

  // Trailing garbage after the cell block.
  string padded = frame + "xx";
  FixLengthPrefix(&padded);
  s = ParseResponse(Slice(padded), &header, &body, &cell_block);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "2 extra bytes at end of packet");
}

TEST_F(SerializationTest, TestConnHeaderRoundTrip) {
  ConnectionHeaderPB header;
  header.mutable_user_info()->set_effective_user("alice");
  header.set_service_name(kClientServiceName);
  header.set_cell_block_codec_class(kKeyValueCodecClass);

  string buf;
  SerializeConnHeader(kAuthSimple, header, &buf);
  ASSERT_EQ(kPreambleLength + kMsgLengthPrefixLength + header.ByteSizeLong(), buf.size());
  ASSERT_EQ(string(kMagicNumber), buf.substr(0, kMagicNumberLength));
  ASSERT_EQ(kCurrentRpcVersion, static_cast<uint8_t>(buf[kMagicNumberLength]));
  ASSERT_EQ(kAuthSimple, static_cast<uint8_t>(buf[kMagicNumberLength + 1]));

  uint8_t auth = 0;
  ConnectionHeaderPB parsed;
  ASSERT_OK(ParseConnHeader(Slice(buf), &auth, &parsed));
  ASSERT_EQ(kAuthSimple, auth);
  ASSERT_EQ("alice", parsed.user_info().effective_user());
  ASSERT_EQ(kClientServiceName, parsed.service_name());
  ASSERT_EQ(kKeyValueCodecClass, parsed.cell_block_codec_class());
  ASSERT_FALSE(parsed.has_cell_block_compressor_class());

  // One byte short of the announced header.
  parsed.Clear();
  Status s = ParseConnHeader(Slice(buf.data(), buf.size() - 1), &auth, &parsed);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
}

TEST_F(SerializationTest, TestValidateConnHeader) {
  uint8_t auth = 0;
  string good = string(kMagicNumber) + static_cast<char>(kCurrentRpcVersion) +
      static_cast<char>(kAuthKerberos);
  ASSERT_OK(ValidateConnHeader(Slice(good), &auth));
  ASSERT_EQ(kAuthKerberos, auth);

  Status s = ValidateConnHeader(Slice(good.data(), good.size() - 1), &auth);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "preamble length");

  s = ValidateConnHeader(Slice("GET / "), &auth);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "HTTP client");

  s = ValidateConnHeader(Slice("ABCD\x00\x50", 6), &auth);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "magic number");

  string bad_version = good;
  bad_version[kMagicNumberLength] = 9;
  s = ValidateConnHeader(Slice(bad_version), &auth);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unsupported RPC version");

  string bad_auth = good;
  bad_auth[kMagicNumberLength + 1] = 1;
  s = ValidateConnHeader(Slice(bad_auth), &auth);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "authentication method");
}

} // namespace serialization
} // namespace rpc
} // namespace kvscan
