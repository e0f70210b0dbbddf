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
#ifndef KVSCAN_RPC_SERIALIZATION_H
#define KVSCAN_RPC_SERIALIZATION_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "kvscan/util/slice.h"
#include "kvscan/util/status.h"

namespace google {
namespace protobuf {
class MessageLite;
} // namespace protobuf
} // namespace google

namespace kvscan {
namespace rpc {

class ConnectionHeaderPB;
class RequestHeaderPB;
class ResponseHeaderPB;

namespace serialization {

// Serialize the request param into a buffer which is allocated by this function.
// Uses the message's cached size by calling MessageLite::GetCachedSize().
// In:  Protobuf Message to serialize,
//      optional parameter for additional buffer space required.
// Out: The string in 'param_buf' will be populated with the varint-delimited
//      serialized message.
void SerializeMessage(const google::protobuf::MessageLite& message,
                      std::string* param_buf,
                      int additional_size = 0);

// Serialize the request or response header into a buffer which is allocated
// by this function. Includes leading 4-byte length prefix and the
// varint-delimited header.
// In:  Protobuf header to serialize,
//      Length of the message param following this header in the frame.
// Out: string to be populated with the serialized header.
void SerializeHeader(const google::protobuf::MessageLite& header,
                     size_t param_len,
                     std::string* header_buf);

// Serialize a complete call: header, method parameter and optional trailing
// cell block. The cell block metadata of 'header' is filled in from
// 'cell_block'.
void SerializeRequest(RequestHeaderPB* header,
                      const google::protobuf::MessageLite& param,
                      const Slice& cell_block,
                      std::string* out);

// Same as SerializeRequest(), for the server side of a call. When 'header'
// carries an exception, 'body' may be null and no body is written.
void SerializeResponse(ResponseHeaderPB* header,
                       const google::protobuf::MessageLite* body,
                       const Slice& cell_block,
                       std::string* out);

// Deserialize a request frame into its header, main message and trailing
// cell block. The main message and cell block are slices into 'buf'.
Status ParseRequest(const Slice& buf,
                    RequestHeaderPB* parsed_header,
                    Slice* parsed_main_message,
                    Slice* parsed_cell_block) WARN_UNUSED_RESULT;

// Deserialize a response frame. When the header carries an exception the
// main message is empty. Returns Corruption on a malformed frame.
Status ParseResponse(const Slice& buf,
                     ResponseHeaderPB* parsed_header,
                     Slice* parsed_main_message,
                     Slice* parsed_cell_block) WARN_UNUSED_RESULT;

// Serialize the connection preamble (magic number, protocol version and
// authentication method) followed by the length-prefixed connection header.
void SerializeConnHeader(uint8_t auth_method,
                         const ConnectionHeaderPB& header,
                         std::string* out);

// Validate the connection preamble ('slice' must be exactly
// kPreambleLength bytes) and extract the authentication method.
Status ValidateConnHeader(const Slice& slice, uint8_t* auth_method) WARN_UNUSED_RESULT;

// Parse a complete preamble plus connection header, as produced by
// SerializeConnHeader().
Status ParseConnHeader(const Slice& buf,
                       uint8_t* auth_method,
                       ConnectionHeaderPB* header) WARN_UNUSED_RESULT;

} // namespace serialization
} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_SERIALIZATION_H
