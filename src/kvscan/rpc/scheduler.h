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
#ifndef KVSCAN_RPC_SCHEDULER_H
#define KVSCAN_RPC_SCHEDULER_H

#include "kvscan/util/monotime.h"
#include "kvscan/util/status_callback.h"

namespace kvscan {
namespace rpc {

// Runs tasks after a delay. Used for retry backoff, lease renewal and the
// replica race timer.
//
// The task receives OK when it runs normally, or Aborted if the scheduler
// was shut down before the task was due; in the latter case the task must
// not start new work.
class Scheduler {
 public:
  virtual ~Scheduler() {}

  virtual void Schedule(StatusCallback task, const MonoDelta& delay) = 0;
};

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_SCHEDULER_H
