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
#ifndef KVSCAN_RPC_RPC_CONTROLLER_H
#define KVSCAN_RPC_RPC_CONTROLLER_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/status.h"

namespace google {
namespace protobuf {
class MessageLite;
} // namespace protobuf
} // namespace google

namespace kvscan {
namespace rpc {

class ExceptionResponsePB;

// Controller for managing properties of a single RPC call, on the client side.
//
// An RpcController maps to exactly one call and is not thread-safe. The
// caller sets properties such as the deadline, the priority and the request
// attributes before sending the call; the transport completes the controller
// when the response (or a failure) arrives.
class RpcController {
 public:
  RpcController();
  ~RpcController();

  // Reset this controller so it may be used with another call.
  void Reset();

  // Return true if the call has finished.
  bool finished() const;

  // Return the current status of a call.
  //
  // A call is "OK" status until it finishes, at which point it may either
  // remain in "OK" status (if the call was successful), or change to an
  // error status: a local failure (for example NetworkError or TimedOut),
  // or RemoteError if the server answered with an exception.
  Status status() const;

  // If status() returns a RemoteError object, then this function returns
  // the exception sent by the server. Otherwise returns nullptr.
  // The returned pointer is only valid as long as the controller object.
  const ExceptionResponsePB* error_response() const;

  // True if the exception arrived on the connection-fatal call id: the
  // server closed the connection right after sending it.
  bool connection_fatal() const { return connection_fatal_; }

  // Set the timeout for the call, relative to now.
  void set_timeout(const MonoDelta& timeout);

  // Like a timeout, but based on a fixed point in time instead of a delta.
  //
  // Using an uninitialized deadline means the call won't time out.
  void set_deadline(const MonoTime& deadline);

  const MonoTime& deadline() const { return deadline_; }

  // Timeout remaining until the deadline, or an uninitialized delta if no
  // deadline is set.
  MonoDelta timeout() const;

  void set_priority(uint32_t priority) { priority_ = priority; }
  uint32_t priority() const { return priority_; }

  // Opaque attributes sent in the request header.
  void AddRequestAttribute(const std::string& name, const std::string& value);
  const std::map<std::string, std::string>& request_attributes() const {
    return request_attributes_;
  }

  // The cell block which trailed the response, empty if cells travelled in
  // the response body.
  Slice response_cell_block() const { return Slice(response_cell_block_); }

  // The following are called by the transport to complete the call.

  // Marks the call as successfully finished, taking ownership of the
  // response cell block.
  void MarkSucceeded(std::string cell_block);

  // Marks the call as failed before any response was received.
  void MarkFailed(const Status& status);

  // Marks the call as failed with an exception sent by the server.
  void MarkRemoteError(std::unique_ptr<ExceptionResponsePB> error,
                       bool connection_fatal);

  // Completes the call from a serialized response frame, decoding the body
  // into 'response'. A malformed frame fails the call with Corruption.
  void CompleteFromFrame(const Slice& frame,
                         google::protobuf::MessageLite* response);

 private:
  bool finished_;
  Status status_;
  std::unique_ptr<ExceptionResponsePB> error_response_;
  bool connection_fatal_;
  MonoTime deadline_;
  uint32_t priority_;
  std::map<std::string, std::string> request_attributes_;
  std::string response_cell_block_;

  DISALLOW_COPY_AND_ASSIGN(RpcController);
};

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_RPC_CONTROLLER_H
