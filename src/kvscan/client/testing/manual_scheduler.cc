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

#include "kvscan/client/testing/manual_scheduler.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "kvscan/util/status.h"

using std::lock_guard;
using std::mutex;
using std::vector;

namespace kvscan {
namespace client {

ManualScheduler::ManualScheduler()
    : now_nanos_(0),
      next_seq_(0) {
}

ManualScheduler::~ManualScheduler() {
  if (!tasks_.empty()) {
    VLOG(1) << "Destroying manual scheduler with " << tasks_.size() << " pending tasks";
  }
}

void ManualScheduler::Schedule(StatusCallback task, const MonoDelta& delay) {
  lock_guard<mutex> l(lock_);
  int64_t delay_nanos = delay.Initialized() ? std::max<int64_t>(0, delay.ToNanoseconds()) : 0;
  delays_.push_back(MonoDelta::FromNanoseconds(delay_nanos));
  tasks_.emplace(TaskKey(now_nanos_ + delay_nanos, next_seq_++), std::move(task));
}

bool ManualScheduler::RunNext() {
  StatusCallback task;
  {
    lock_guard<mutex> l(lock_);
    if (tasks_.empty()) {
      return false;
    }
    auto it = tasks_.begin();
    now_nanos_ = std::max(now_nanos_, it->first.first);
    task = std::move(it->second);
    tasks_.erase(it);
  }
  task(Status::OK());
  return true;
}

int ManualScheduler::RunUntilIdle(int max_tasks) {
  int ran = 0;
  while (ran < max_tasks && RunNext()) {
    ran++;
  }
  return ran;
}

void ManualScheduler::AbortAll() {
  while (true) {
    StatusCallback task;
    {
      lock_guard<mutex> l(lock_);
      if (tasks_.empty()) {
        return;
      }
      auto it = tasks_.begin();
      task = std::move(it->second);
      tasks_.erase(it);
    }
    task(Status::Aborted("scheduler aborted"));
  }
}

size_t ManualScheduler::num_pending() const {
  lock_guard<mutex> l(lock_);
  return tasks_.size();
}

MonoDelta ManualScheduler::now() const {
  lock_guard<mutex> l(lock_);
  return MonoDelta::FromNanoseconds(now_nanos_);
}

vector<MonoDelta> ManualScheduler::delays() const {
  lock_guard<mutex> l(lock_);
  return delays_;
}

} // namespace client
} // namespace kvscan
