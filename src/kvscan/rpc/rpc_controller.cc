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

#include <utility>

#include <glog/logging.h>
#include <google/protobuf/message_lite.h>

#include "kvscan/rpc/constants.h"
#include "kvscan/rpc/rpc_header.pb.h"
#include "kvscan/rpc/serialization.h"

using std::string;
using std::unique_ptr;

namespace kvscan {
namespace rpc {

RpcController::RpcController()
    : finished_(false),
      connection_fatal_(false),
      priority_(0) {
}

RpcController::~RpcController() {
}

void RpcController::Reset() {
  finished_ = false;
  status_ = Status::OK();
  error_response_.reset();
  connection_fatal_ = false;
  deadline_ = MonoTime();
  priority_ = 0;
  request_attributes_.clear();
  response_cell_block_.clear();
}

bool RpcController::finished() const {
  return finished_;
}

Status RpcController::status() const {
  return status_;
}

const ExceptionResponsePB* RpcController::error_response() const {
  return error_response_.get();
}

void RpcController::set_timeout(const MonoDelta& timeout) {
  DCHECK(!finished_);
  set_deadline(MonoTime::Now() + timeout);
}

void RpcController::set_deadline(const MonoTime& deadline) {
  DCHECK(!finished_);
  deadline_ = deadline;
}

MonoDelta RpcController::timeout() const {
  if (!deadline_.Initialized()) {
    return MonoDelta();
  }
  return deadline_ - MonoTime::Now();
}

void RpcController::AddRequestAttribute(const string& name, const string& value) {
  request_attributes_[name] = value;
}

void RpcController::MarkSucceeded(string cell_block) {
  DCHECK(!finished_);
  finished_ = true;
  status_ = Status::OK();
  response_cell_block_ = std::move(cell_block);
}

void RpcController::MarkFailed(const Status& status) {
  DCHECK(!finished_);
  DCHECK(!status.ok());
  finished_ = true;
  status_ = status;
}

void RpcController::MarkRemoteError(unique_ptr<ExceptionResponsePB> error,
                                    bool connection_fatal) {
  DCHECK(!finished_);
  finished_ = true;
  status_ = Status::RemoteError(error->exception_class_name(),
                                ServerErrorCodePB_Name(error->code()));
  connection_fatal_ = connection_fatal;
  error_response_ = std::move(error);
}

void RpcController::CompleteFromFrame(const Slice& frame,
                                      google::protobuf::MessageLite* response) {
  ResponseHeaderPB header;
  Slice body;
  Slice cell_block;
  Status s = serialization::ParseResponse(frame, &header, &body, &cell_block);
  if (!s.ok()) {
    MarkFailed(s);
    return;
  }
  if (header.has_exception()) {
    unique_ptr<ExceptionResponsePB> error(header.release_exception());
    MarkRemoteError(std::move(error), header.call_id() == kFatalConnectionCallId);
    return;
  }
  if (!response->ParseFromArray(body.data(), body.size())) {
    MarkFailed(Status::Corruption("invalid response body",
                                  response->InitializationErrorString()));
    return;
  }
  MarkSucceeded(cell_block.ToString());
}

} // namespace rpc
} // namespace kvscan
