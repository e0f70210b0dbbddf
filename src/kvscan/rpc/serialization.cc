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

#include <cstring>
#include <string>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/message_lite.h>

#include "kvscan/gutil/endian.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/constants.h"
#include "kvscan/rpc/rpc_header.pb.h"

DEFINE_int32(rpc_max_message_size, 50 * 1024 * 1024,
             "The maximum size of a message that any RPC that the client sends "
             "or expects to receive. Larger messages are logged as suspicious.");

using google::protobuf::MessageLite;
using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;
using std::string;

namespace kvscan {
namespace rpc {
namespace serialization {

enum {
  kHeaderPosVersion = 0,
  kHeaderPosAuthProto = 1
};

namespace {

uint8_t* MutableData(string* buf) {
  return reinterpret_cast<uint8_t*>(&(*buf)[0]);
}

// Reads the 4-byte total length and the varint-delimited header of a frame.
Status ParseLengthAndHeader(const Slice& buf,
                            CodedInputStream* in,
                            MessageLite* parsed_header) {
  if (PREDICT_FALSE(buf.size() < kMsgLengthPrefixLength)) {
    return Status::Corruption("Invalid packet: not enough bytes for length header",
                              buf.ToDebugString(64));
  }
  uint32_t total_len = NetworkByteOrder::Load32(buf.data());
  if (PREDICT_FALSE(total_len + kMsgLengthPrefixLength != buf.size())) {
    return Status::Corruption(
        "Invalid packet: length prefix does not match the frame size",
        std::to_string(total_len) + " vs " +
        std::to_string(buf.size() - kMsgLengthPrefixLength));
  }
  CHECK(in->Skip(kMsgLengthPrefixLength));

  uint32_t header_len;
  if (PREDICT_FALSE(!in->ReadVarint32(&header_len))) {
    return Status::Corruption("Invalid packet: missing header delimiter",
                              buf.ToDebugString(64));
  }
  CodedInputStream::Limit l = in->PushLimit(header_len);
  if (PREDICT_FALSE(!parsed_header->ParseFromCodedStream(in))) {
    return Status::Corruption("Invalid packet: header too short",
                              buf.ToDebugString(64));
  }
  in->PopLimit(l);
  return Status::OK();
}

// Reads a varint-delimited message body and returns it as a slice of 'buf'.
Status ParseDelimitedBody(const Slice& buf,
                          CodedInputStream* in,
                          Slice* parsed_main_message) {
  uint32_t main_msg_len;
  if (PREDICT_FALSE(!in->ReadVarint32(&main_msg_len))) {
    return Status::Corruption("Invalid packet: missing main msg length",
                              buf.ToDebugString(64));
  }
  int main_msg_offset = in->CurrentPosition();
  if (PREDICT_FALSE(!in->Skip(main_msg_len))) {
    return Status::Corruption(
        "Invalid packet: data too short, expected " + std::to_string(main_msg_len) +
        " byte main_msg", buf.ToDebugString(64));
  }
  *parsed_main_message = Slice(buf.data() + main_msg_offset, main_msg_len);
  return Status::OK();
}

// Takes the trailing cell block of 'cell_block_len' bytes and checks that
// nothing follows it.
Status ParseCellBlock(const Slice& buf,
                      CodedInputStream* in,
                      uint32_t cell_block_len,
                      Slice* parsed_cell_block) {
  size_t offset = in->CurrentPosition();
  size_t remaining = buf.size() - offset;
  if (PREDICT_FALSE(remaining < cell_block_len)) {
    return Status::Corruption(
        "Invalid packet: cell block too short, expected " +
        std::to_string(cell_block_len) + " bytes, got " + std::to_string(remaining));
  }
  if (PREDICT_FALSE(remaining > cell_block_len)) {
    return Status::Corruption(
        "Invalid packet: " + std::to_string(remaining - cell_block_len) +
        " extra bytes at end of packet");
  }
  *parsed_cell_block = Slice(buf.data() + offset, cell_block_len);
  return Status::OK();
}

} // anonymous namespace

void SerializeMessage(const MessageLite& message, string* param_buf,
                      int additional_size) {
  size_t pb_size = message.ByteSizeLong();
  size_t recorded_size = pb_size + additional_size;
  size_t size_with_delim = pb_size + CodedOutputStream::VarintSize32(recorded_size);
  size_t total_size = size_with_delim + additional_size;

  if (total_size > static_cast<size_t>(FLAGS_rpc_max_message_size)) {
    LOG(WARNING) << "Serialized " << message.GetTypeName() << " (" << total_size
                 << " bytes) is larger than the maximum configured RPC message size ("
                 << FLAGS_rpc_max_message_size << " bytes). "
                 << "Sending anyway, but peer may reject the data.";
  }

  param_buf->resize(size_with_delim);
  uint8_t* dst = MutableData(param_buf);
  dst = CodedOutputStream::WriteVarint32ToArray(recorded_size, dst);
  dst = message.SerializeWithCachedSizesToArray(dst);
  DCHECK_EQ(dst, MutableData(param_buf) + size_with_delim);
}

void SerializeHeader(const MessageLite& header,
                     size_t param_len,
                     string* header_buf) {
  CHECK(header.IsInitialized())
      << "RPC header missing fields: " << header.InitializationErrorString();

  // Compute all the lengths for the packet.
  size_t header_pb_len = header.ByteSizeLong();
  size_t header_tot_len = kMsgLengthPrefixLength        // Int prefix for the total length.
      + CodedOutputStream::VarintSize32(header_pb_len)  // Varint delimiter for header PB.
      + header_pb_len;                                  // Length for the header PB itself.
  size_t total_size = header_tot_len + param_len;

  header_buf->resize(header_tot_len);
  uint8_t* dst = MutableData(header_buf);

  // 1. The length for the whole frame, not including the 4-byte
  // length prefix.
  NetworkByteOrder::Store32(dst, total_size - kMsgLengthPrefixLength);
  dst += sizeof(uint32_t);

  // 2. The varint-prefixed header PB.
  dst = CodedOutputStream::WriteVarint32ToArray(header_pb_len, dst);
  dst = header.SerializeWithCachedSizesToArray(dst);

  // We should have used the whole buffer we allocated.
  DCHECK_EQ(dst, MutableData(header_buf) + header_tot_len);
}

void SerializeRequest(RequestHeaderPB* header,
                      const MessageLite& param,
                      const Slice& cell_block,
                      string* out) {
  header->set_request_param(true);
  if (cell_block.empty()) {
    header->clear_cell_block_meta();
  } else {
    header->mutable_cell_block_meta()->set_length(cell_block.size());
  }
  string param_buf;
  SerializeMessage(param, &param_buf);
  SerializeHeader(*header, param_buf.size() + cell_block.size(), out);
  out->append(param_buf);
  out->append(reinterpret_cast<const char*>(cell_block.data()), cell_block.size());
}

void SerializeResponse(ResponseHeaderPB* header,
                       const MessageLite* body,
                       const Slice& cell_block,
                       string* out) {
  DCHECK(body != nullptr || header->has_exception());
  if (cell_block.empty()) {
    header->clear_cell_block_meta();
  } else {
    header->mutable_cell_block_meta()->set_length(cell_block.size());
  }
  string body_buf;
  if (!header->has_exception()) {
    SerializeMessage(*body, &body_buf);
  }
  SerializeHeader(*header, body_buf.size() + cell_block.size(), out);
  out->append(body_buf);
  out->append(reinterpret_cast<const char*>(cell_block.data()), cell_block.size());
}

Status ParseRequest(const Slice& buf,
                    RequestHeaderPB* parsed_header,
                    Slice* parsed_main_message,
                    Slice* parsed_cell_block) {
  CodedInputStream in(buf.data(), buf.size());
  RETURN_NOT_OK(ParseLengthAndHeader(buf, &in, parsed_header));
  if (parsed_header->request_param()) {
    RETURN_NOT_OK(ParseDelimitedBody(buf, &in, parsed_main_message));
  } else {
    *parsed_main_message = Slice();
  }
  uint32_t cell_block_len = parsed_header->has_cell_block_meta() ?
      parsed_header->cell_block_meta().length() : 0;
  return ParseCellBlock(buf, &in, cell_block_len, parsed_cell_block);
}

Status ParseResponse(const Slice& buf,
                     ResponseHeaderPB* parsed_header,
                     Slice* parsed_main_message,
                     Slice* parsed_cell_block) {
  CodedInputStream in(buf.data(), buf.size());
  RETURN_NOT_OK(ParseLengthAndHeader(buf, &in, parsed_header));
  if (parsed_header->has_exception()) {
    *parsed_main_message = Slice();
  } else {
    RETURN_NOT_OK(ParseDelimitedBody(buf, &in, parsed_main_message));
  }
  uint32_t cell_block_len = parsed_header->has_cell_block_meta() ?
      parsed_header->cell_block_meta().length() : 0;
  return ParseCellBlock(buf, &in, cell_block_len, parsed_cell_block);
}

void SerializeConnHeader(uint8_t auth_method,
                         const ConnectionHeaderPB& header,
                         string* out) {
  size_t header_len = header.ByteSizeLong();
  out->resize(kPreambleLength + kMsgLengthPrefixLength + header_len);
  uint8_t* buf = MutableData(out);
  memcpy(buf, kMagicNumber, kMagicNumberLength);
  buf += kMagicNumberLength;
  buf[kHeaderPosVersion] = kCurrentRpcVersion;
  buf[kHeaderPosAuthProto] = auth_method;
  buf += kHeaderFlagsLength;
  NetworkByteOrder::Store32(buf, header_len);
  buf += kMsgLengthPrefixLength;
  buf = header.SerializeWithCachedSizesToArray(buf);
  DCHECK_EQ(buf, MutableData(out) + out->size());
}

// validate the entire rpc preamble (magic number + flags)
Status ValidateConnHeader(const Slice& slice, uint8_t* auth_method) {
  if (PREDICT_FALSE(slice.size() != kPreambleLength)) {
    return Status::InvalidArgument("Invalid RPC preamble length",
                                   std::to_string(slice.size()));
  }

  // validate actual magic
  if (!slice.starts_with(kMagicNumber)) {
    if (slice.starts_with("GET ") ||
        slice.starts_with("POST") ||
        slice.starts_with("HEAD")) {
      return Status::InvalidArgument("invalid negotiation, appears to be an HTTP client on "
                                     "the RPC port");
    }
    return Status::InvalidArgument("connection must begin with magic number", kMagicNumber);
  }

  const uint8_t* data = slice.data() + kMagicNumberLength;

  // validate version
  if (data[kHeaderPosVersion] != kCurrentRpcVersion) {
    return Status::InvalidArgument(
        "Unsupported RPC version",
        "Received: " + std::to_string(data[kHeaderPosVersion]) +
        ", Supported: " + std::to_string(kCurrentRpcVersion));
  }

  uint8_t auth = data[kHeaderPosAuthProto];
  if (auth != kAuthSimple && auth != kAuthKerberos && auth != kAuthToken) {
    return Status::InvalidArgument("Unsupported authentication method",
                                   std::to_string(auth));
  }
  *auth_method = auth;
  return Status::OK();
}

Status ParseConnHeader(const Slice& buf,
                       uint8_t* auth_method,
                       ConnectionHeaderPB* header) {
  if (PREDICT_FALSE(buf.size() < kPreambleLength + kMsgLengthPrefixLength)) {
    return Status::Corruption("Invalid connection header: too short",
                              buf.ToDebugString(64));
  }
  RETURN_NOT_OK(ValidateConnHeader(Slice(buf.data(), kPreambleLength), auth_method));
  const uint8_t* len_pos = buf.data() + kPreambleLength;
  uint32_t header_len = NetworkByteOrder::Load32(len_pos);
  size_t available = buf.size() - kPreambleLength - kMsgLengthPrefixLength;
  if (PREDICT_FALSE(header_len != available)) {
    return Status::Corruption(
        "Invalid connection header: length mismatch",
        std::to_string(header_len) + " vs " + std::to_string(available));
  }
  if (PREDICT_FALSE(!header->ParseFromArray(len_pos + kMsgLengthPrefixLength,
                                            header_len))) {
    return Status::Corruption("Invalid connection header: unparseable message");
  }
  return Status::OK();
}

} // namespace serialization
} // namespace rpc
} // namespace kvscan
