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

#include "kvscan/util/status.h"

#include <cstdio>
#include <string>

#include <glog/logging.h>

namespace kvscan {

Status::Status(Code code, const Slice& msg, const Slice& msg2,
               int16_t posix_code)
    : code_(code),
      posix_code_(posix_code) {
  DCHECK(code != kOk);
  message_.assign(reinterpret_cast<const char*>(msg.data()), msg.size());
  if (!msg2.empty()) {
    message_.append(": ");
    message_.append(reinterpret_cast<const char*>(msg2.data()), msg2.size());
  }
}

std::string Status::CodeAsString() const {
  const char* type;
  switch (code_) {
    case kOk:
      type = "OK";
      break;
    case kNotFound:
      type = "Not found";
      break;
    case kCorruption:
      type = "Corruption";
      break;
    case kNotSupported:
      type = "Not implemented";
      break;
    case kInvalidArgument:
      type = "Invalid argument";
      break;
    case kIOError:
      type = "IO error";
      break;
    case kAlreadyPresent:
      type = "Already present";
      break;
    case kRuntimeError:
      type = "Runtime error";
      break;
    case kNetworkError:
      type = "Network error";
      break;
    case kIllegalState:
      type = "Illegal state";
      break;
    case kServiceUnavailable:
      type = "Service unavailable";
      break;
    case kTimedOut:
      type = "Timed out";
      break;
    case kAborted:
      type = "Aborted";
      break;
    case kRemoteError:
      type = "Remote error";
      break;
    case kIncomplete:
      type = "Incomplete";
      break;
    default:
      LOG(FATAL) << "unknown status code: " << static_cast<int>(code_);
  }
  return std::string(type);
}

std::string Status::ToString() const {
  std::string result(CodeAsString());
  if (ok()) {
    return result;
  }

  result.append(": ");
  result.append(message_);
  if (posix_code_ != -1) {
    char buf[64];
    snprintf(buf, sizeof(buf), " (error %d)", posix_code_);
    result.append(buf);
  }
  return result;
}

Status Status::CloneAndPrepend(const Slice& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code_, msg, Slice(message_), posix_code_);
}

Status Status::CloneAndAppend(const Slice& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code_, Slice(message_), msg, posix_code_);
}

} // namespace kvscan
