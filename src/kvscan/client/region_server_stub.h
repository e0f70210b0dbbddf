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
#ifndef KVSCAN_CLIENT_REGION_SERVER_STUB_H
#define KVSCAN_CLIENT_REGION_SERVER_STUB_H

#include <memory>
#include <string>

#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/response_callback.h"
#include "kvscan/util/status.h"

namespace kvscan {

namespace rpc {
class RpcController;
} // namespace rpc

namespace client {

class ScanRequestPB;
class ScanResponsePB;

// Client side of the scan method of one region server.
class RegionServerStub {
 public:
  virtual ~RegionServerStub() {}

  // Sends 'req' and invokes 'callback' once the call finished. On success
  // 'resp' holds the response and the controller holds the trailing cell
  // block, if any. 'req', 'resp' and 'controller' must stay alive until the
  // callback ran.
  virtual void ScanAsync(const ScanRequestPB& req,
                         ScanResponsePB* resp,
                         rpc::RpcController* controller,
                         const rpc::ResponseCallback& callback) = 0;
};

// Hands out the stub of a region server given its "host:port".
class StubFactory {
 public:
  virtual ~StubFactory() {}

  virtual Status GetStub(const std::string& server,
                         std::shared_ptr<RegionServerStub>* stub) WARN_UNUSED_RESULT = 0;
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_REGION_SERVER_STUB_H
