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

#include "kvscan/rpc/timer_thread.h"

#include <chrono>
#include <system_error>
#include <utility>

#include <glog/logging.h>

using std::lock_guard;
using std::mutex;
using std::unique_lock;
using std::vector;

namespace kvscan {
namespace rpc {

TimerThread::TimerThread()
    : next_seq_(0),
      started_(false),
      shutdown_(false) {
}

TimerThread::~TimerThread() {
  Shutdown();
}

Status TimerThread::Start() {
  lock_guard<mutex> l(lock_);
  CHECK(!started_) << "timer thread already started";
  if (shutdown_) {
    return Status::IllegalState("timer thread was shut down");
  }
  try {
    thread_ = std::thread([this]() { this->RunThread(); });
  } catch (const std::system_error& e) {
    return Status::RuntimeError("unable to start timer thread", e.what());
  }
  started_ = true;
  return Status::OK();
}

void TimerThread::Shutdown() {
  vector<StatusCallback> aborted;
  {
    lock_guard<mutex> l(lock_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    while (!tasks_.empty()) {
      aborted.emplace_back(tasks_.top().callback);
      tasks_.pop();
    }
  }
  cond_.notify_all();
  if (thread_.joinable()) {
    CHECK(thread_.get_id() != std::this_thread::get_id())
        << "timer thread cannot shut itself down";
    thread_.join();
  }
  if (!aborted.empty()) {
    VLOG(1) << "Aborting " << aborted.size() << " pending timer task(s)";
  }
  for (const auto& cb : aborted) {
    cb(Status::Aborted("timer thread is shutting down"));
  }
}

void TimerThread::Schedule(StatusCallback task, const MonoDelta& delay) {
  {
    lock_guard<mutex> l(lock_);
    if (!shutdown_) {
      Task t;
      t.due = MonoTime::Now() + delay;
      t.seq = next_seq_++;
      t.callback = std::move(task);
      tasks_.emplace(std::move(t));
      cond_.notify_all();
      return;
    }
  }
  task(Status::Aborted("timer thread is shutting down"));
}

size_t TimerThread::num_pending() const {
  lock_guard<mutex> l(lock_);
  return tasks_.size();
}

void TimerThread::RunThread() {
  unique_lock<mutex> l(lock_);
  while (!shutdown_) {
    if (tasks_.empty()) {
      cond_.wait(l);
      continue;
    }
    MonoTime now = MonoTime::Now();
    const MonoTime due = tasks_.top().due;
    if (now < due) {
      cond_.wait_for(l, std::chrono::nanoseconds((due - now).ToNanoseconds()));
      continue;
    }
    StatusCallback cb = tasks_.top().callback;
    tasks_.pop();
    l.unlock();
    cb(Status::OK());
    l.lock();
  }
}

} // namespace rpc
} // namespace kvscan
