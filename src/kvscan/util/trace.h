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
#ifndef KVSCAN_UTIL_TRACE_H
#define KVSCAN_UTIL_TRACE_H

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {

// A trace for one long-running operation (for example a whole scan). This
// collects timestamped entries from whichever threads run the operation's
// continuations, and records how the operation ended.
//
// A Trace is never installed as ambient thread state: every component that
// wants to annotate it receives it explicitly.
//
// This class is thread-safe.
class Trace {
 public:
  explicit Trace(std::string name);
  ~Trace();

  // Logs a message into the trace buffer. Messages logged after End() are
  // dropped.
  void Message(const std::string& msg);

  // Records the final outcome and closes the trace. Must be called exactly
  // once; returns false (and does nothing) on any later call.
  bool End(const Status& status);

  bool ended() const;

  // The status passed to End(), or OK if the trace has not ended.
  Status final_status() const;

  const std::string& name() const { return name_; }

  // Number of messages recorded so far.
  size_t num_entries() const;

  // Dump the trace buffer to the given output stream.
  void Dump(std::ostream* out) const;

  // Dump the trace buffer as a string.
  std::string DumpToString() const;

 private:
  struct TraceEntry {
    MonoTime timestamp;
    std::string message;
  };

  const std::string name_;
  const MonoTime start_time_;

  // Lock protecting all the members below.
  mutable std::mutex lock_;
  std::vector<TraceEntry> entries_;
  bool ended_;
  MonoTime end_time_;
  Status final_status_;

  DISALLOW_COPY_AND_ASSIGN(Trace);
};

} // namespace kvscan

#endif // KVSCAN_UTIL_TRACE_H
