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

#include "kvscan/util/trace.h"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

#include <glog/logging.h>

using std::string;

namespace kvscan {

Trace::Trace(string name)
    : name_(std::move(name)),
      start_time_(MonoTime::Now()),
      ended_(false) {
}

Trace::~Trace() {
  if (!ended_) {
    VLOG(1) << "trace " << name_ << " destroyed without being ended";
  }
}

void Trace::Message(const string& msg) {
  std::lock_guard<std::mutex> l(lock_);
  if (ended_) {
    return;
  }
  entries_.push_back({ MonoTime::Now(), msg });
}

bool Trace::End(const Status& status) {
  std::lock_guard<std::mutex> l(lock_);
  if (ended_) {
    LOG(ERROR) << "trace " << name_ << " ended twice; first with "
                << final_status_.ToString() << ", then with " << status.ToString();
    return false;
  }
  ended_ = true;
  end_time_ = MonoTime::Now();
  final_status_ = status;
  return true;
}

bool Trace::ended() const {
  std::lock_guard<std::mutex> l(lock_);
  return ended_;
}

Status Trace::final_status() const {
  std::lock_guard<std::mutex> l(lock_);
  return final_status_;
}

size_t Trace::num_entries() const {
  std::lock_guard<std::mutex> l(lock_);
  return entries_.size();
}

void Trace::Dump(std::ostream* out) const {
  std::lock_guard<std::mutex> l(lock_);
  *out << name_ << std::endl;
  for (const TraceEntry& e : entries_) {
    *out << std::setw(10) << (e.timestamp - start_time_).ToMicroseconds() << "us "
         << e.message << std::endl;
  }
  if (ended_) {
    *out << std::setw(10) << (end_time_ - start_time_).ToMicroseconds() << "us "
         << "ended: " << final_status_.ToString() << std::endl;
  }
}

string Trace::DumpToString() const {
  std::ostringstream s;
  Dump(&s);
  return s.str();
}

} // namespace kvscan
