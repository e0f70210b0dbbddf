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
#ifndef KVSCAN_RPC_CONSTANTS_H
#define KVSCAN_RPC_CONSTANTS_H

#include <cstdint>

namespace kvscan {
namespace rpc {

// Magic number that starts every connection preamble.
extern const char* const kMagicNumber;

// Name of the region server service, as sent in the connection header.
extern const char* const kClientServiceName;

// Codec class names understood by the cell block codec.
extern const char* const kKeyValueCodecClass;

// Current version of the RPC protocol.
static const uint8_t kCurrentRpcVersion = 0;

// Authentication methods, as carried by the preamble.
static const uint8_t kAuthSimple = 80;
static const uint8_t kAuthKerberos = 81;
static const uint8_t kAuthToken = 82;

// Call id reserved for connection-fatal exceptions sent by the server right
// before it closes the socket.
static const int32_t kFatalConnectionCallId = -1;

static const uint8_t kMagicNumberLength = 4;
static const uint8_t kHeaderFlagsLength = 2;

// The preamble is the magic number, the version byte and the auth byte.
static const uint8_t kPreambleLength = kMagicNumberLength + kHeaderFlagsLength;

// There is a 4-byte length prefix before any packet.
static const uint8_t kMsgLengthPrefixLength = 4;

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_CONSTANTS_H
