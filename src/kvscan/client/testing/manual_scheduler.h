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
#ifndef KVSCAN_CLIENT_TESTING_MANUAL_SCHEDULER_H
#define KVSCAN_CLIENT_TESTING_MANUAL_SCHEDULER_H

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status_callback.h"

namespace kvscan {
namespace client {

// A Scheduler for tests. Nothing runs until the test asks for it; tasks then
// run on the calling thread in order of their due time on a virtual clock,
// which jumps forward to each task as it runs. Delays therefore cost no
// wall time.
//
// This class is thread-safe; tasks may schedule more tasks.
class ManualScheduler : public rpc::Scheduler {
 public:
  ManualScheduler();
  ~ManualScheduler() override;

  void Schedule(StatusCallback task, const MonoDelta& delay) override;

  // Runs the earliest pending task. Returns false if none is pending.
  bool RunNext();

  // Runs tasks until none is pending or 'max_tasks' ran. Returns the number
  // of tasks which ran.
  int RunUntilIdle(int max_tasks = 100000);

  // Runs every pending task with an Aborted status, including the tasks they
  // schedule in turn.
  void AbortAll();

  size_t num_pending() const;

  // Time elapsed on the virtual clock.
  MonoDelta now() const;

  // The delays of all the tasks scheduled so far, in scheduling order.
  std::vector<MonoDelta> delays() const;

 private:
  // Pending tasks, keyed by virtual due time and scheduling order.
  typedef std::pair<int64_t, uint64_t> TaskKey;

  mutable std::mutex lock_;
  std::map<TaskKey, StatusCallback> tasks_;
  std::vector<MonoDelta> delays_;
  int64_t now_nanos_;
  uint64_t next_seq_;

  DISALLOW_COPY_AND_ASSIGN(ManualScheduler);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_TESTING_MANUAL_SCHEDULER_H
