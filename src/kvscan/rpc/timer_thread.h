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
#ifndef KVSCAN_RPC_TIMER_THREAD_H
#define KVSCAN_RPC_TIMER_THREAD_H

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"
#include "kvscan/util/status_callback.h"

namespace kvscan {
namespace rpc {

// A Scheduler backed by one background thread. Tasks run on that thread in
// order of their due time; tasks due at the same time run in the order they
// were scheduled.
//
// Tasks which are still pending when the timer shuts down are run with an
// Aborted status, as are tasks scheduled after shutdown.
class TimerThread : public Scheduler {
 public:
  TimerThread();
  ~TimerThread() override;

  Status Start() WARN_UNUSED_RESULT;

  // Stops the background thread and aborts every pending task. Must not be
  // called from a task.
  void Shutdown();

  void Schedule(StatusCallback task, const MonoDelta& delay) override;

  // Number of tasks waiting to run.
  size_t num_pending() const;

 private:
  struct Task {
    MonoTime due;
    uint64_t seq;
    StatusCallback callback;
  };

  // Orders the queue so that the earliest due task is on top.
  struct TaskLater {
    bool operator()(const Task& a, const Task& b) const {
      if (a.due != b.due) {
        return a.due > b.due;
      }
      return a.seq > b.seq;
    }
  };

  void RunThread();

  mutable std::mutex lock_;
  std::condition_variable cond_;
  std::priority_queue<Task, std::vector<Task>, TaskLater> tasks_;
  uint64_t next_seq_;
  bool started_;
  bool shutdown_;
  std::thread thread_;

  DISALLOW_COPY_AND_ASSIGN(TimerThread);
};

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_TIMER_THREAD_H
