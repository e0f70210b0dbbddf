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
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.
#ifndef KVSCAN_UTIL_STATUS_H
#define KVSCAN_UTIL_STATUS_H

#include <cstdint>
#include <ostream>
#include <string>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/slice.h"

// Return the given status if it is not OK.
#define RETURN_NOT_OK(s) do { \
    const ::kvscan::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s; \
  } while (0)

// Return the given status if it is not OK, but first clone it and
// prepend the given message.
#define RETURN_NOT_OK_PREPEND(s, msg) do { \
    const ::kvscan::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s.CloneAndPrepend(msg); \
  } while (0)

// Emit a warning if 'to_call' returns a bad status.
#define WARN_NOT_OK(to_call, warning_prefix) do { \
    const ::kvscan::Status& _s = (to_call); \
    if (PREDICT_FALSE(!_s.ok())) { \
      LOG(WARNING) << (warning_prefix) << ": " << _s.ToString(); \
    } \
  } while (0)

#define CHECK_OK(s) do { \
    const ::kvscan::Status& _s = (s); \
    CHECK(_s.ok()) << "Bad status: " << _s.ToString(); \
  } while (0)

#define DCHECK_OK(s) DCHECK((s).ok()) << "Bad status: " << (s).ToString()

namespace kvscan {

class Status {
 public:
  // Create a success status.
  Status() : code_(kOk), posix_code_(-1) {}

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status NotFound(const Slice& msg, const Slice& msg2 = Slice(),
                         int16_t posix_code = -1) {
    return Status(kNotFound, msg, msg2, posix_code);
  }
  static Status Corruption(const Slice& msg, const Slice& msg2 = Slice(),
                           int16_t posix_code = -1) {
    return Status(kCorruption, msg, msg2, posix_code);
  }
  static Status NotSupported(const Slice& msg, const Slice& msg2 = Slice(),
                             int16_t posix_code = -1) {
    return Status(kNotSupported, msg, msg2, posix_code);
  }
  static Status InvalidArgument(const Slice& msg, const Slice& msg2 = Slice(),
                                int16_t posix_code = -1) {
    return Status(kInvalidArgument, msg, msg2, posix_code);
  }
  static Status IOError(const Slice& msg, const Slice& msg2 = Slice(),
                        int16_t posix_code = -1) {
    return Status(kIOError, msg, msg2, posix_code);
  }
  static Status AlreadyPresent(const Slice& msg, const Slice& msg2 = Slice(),
                               int16_t posix_code = -1) {
    return Status(kAlreadyPresent, msg, msg2, posix_code);
  }
  static Status RuntimeError(const Slice& msg, const Slice& msg2 = Slice(),
                             int16_t posix_code = -1) {
    return Status(kRuntimeError, msg, msg2, posix_code);
  }
  static Status NetworkError(const Slice& msg, const Slice& msg2 = Slice(),
                             int16_t posix_code = -1) {
    return Status(kNetworkError, msg, msg2, posix_code);
  }
  static Status IllegalState(const Slice& msg, const Slice& msg2 = Slice(),
                             int16_t posix_code = -1) {
    return Status(kIllegalState, msg, msg2, posix_code);
  }
  static Status ServiceUnavailable(const Slice& msg, const Slice& msg2 = Slice(),
                                   int16_t posix_code = -1) {
    return Status(kServiceUnavailable, msg, msg2, posix_code);
  }
  static Status TimedOut(const Slice& msg, const Slice& msg2 = Slice(),
                         int16_t posix_code = -1) {
    return Status(kTimedOut, msg, msg2, posix_code);
  }
  static Status Aborted(const Slice& msg, const Slice& msg2 = Slice(),
                        int16_t posix_code = -1) {
    return Status(kAborted, msg, msg2, posix_code);
  }
  static Status RemoteError(const Slice& msg, const Slice& msg2 = Slice(),
                            int16_t posix_code = -1) {
    return Status(kRemoteError, msg, msg2, posix_code);
  }
  static Status Incomplete(const Slice& msg, const Slice& msg2 = Slice(),
                           int16_t posix_code = -1) {
    return Status(kIncomplete, msg, msg2, posix_code);
  }

  // Returns true iff the status indicates success.
  bool ok() const { return code_ == kOk; }

  bool IsNotFound() const { return code_ == kNotFound; }
  bool IsCorruption() const { return code_ == kCorruption; }
  bool IsNotSupported() const { return code_ == kNotSupported; }
  bool IsInvalidArgument() const { return code_ == kInvalidArgument; }
  bool IsIOError() const { return code_ == kIOError; }
  bool IsAlreadyPresent() const { return code_ == kAlreadyPresent; }
  bool IsRuntimeError() const { return code_ == kRuntimeError; }
  bool IsNetworkError() const { return code_ == kNetworkError; }
  bool IsIllegalState() const { return code_ == kIllegalState; }
  bool IsServiceUnavailable() const { return code_ == kServiceUnavailable; }
  bool IsTimedOut() const { return code_ == kTimedOut; }
  bool IsAborted() const { return code_ == kAborted; }
  bool IsRemoteError() const { return code_ == kRemoteError; }
  bool IsIncomplete() const { return code_ == kIncomplete; }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  // Return a string representation of the status code, without the message
  // text or posix code information.
  std::string CodeAsString() const;

  // Return the message portion of the Status. For non-OK statuses,
  // this may be an empty slice.
  Slice message() const { return Slice(message_); }

  // Get the POSIX code associated with this Status, or -1 if there is none.
  int16_t posix_code() const { return posix_code_; }

  // Return a new Status object with the same state plus an additional leading
  // message.
  Status CloneAndPrepend(const Slice& msg) const;

  // Same as CloneAndPrepend, but appends to the message instead.
  Status CloneAndAppend(const Slice& msg) const;

 private:
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kNotSupported = 3,
    kInvalidArgument = 4,
    kIOError = 5,
    kAlreadyPresent = 6,
    kRuntimeError = 7,
    kNetworkError = 8,
    kIllegalState = 9,
    kServiceUnavailable = 10,
    kTimedOut = 11,
    kAborted = 12,
    kRemoteError = 13,
    kIncomplete = 14,
  };

  Status(Code code, const Slice& msg, const Slice& msg2, int16_t posix_code);

  Code code_;
  int16_t posix_code_;
  std::string message_;
};

inline std::ostream& operator<<(std::ostream& o, const Status& s) {
  return o << s.ToString();
}

} // namespace kvscan

#endif // KVSCAN_UTIL_STATUS_H
