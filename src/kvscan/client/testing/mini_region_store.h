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
#ifndef KVSCAN_CLIENT_TESTING_MINI_REGION_STORE_H
#define KVSCAN_CLIENT_TESTING_MINI_REGION_STORE_H

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kvscan/client/region_location.h"
#include "kvscan/client/region_locator.h"
#include "kvscan/client/region_server_stub.h"
#include "kvscan/common/cell.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/rpc/response_callback.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {

namespace rpc {
class ExceptionResponsePB;
class RequestHeaderPB;
class RpcController;
class Scheduler;
} // namespace rpc

namespace client {

class ScanRequestPB;
class ScanResponsePB;

// An in-memory table split into regions, served by fake region servers.
//
// The store plays both the region locator and the region servers of a
// scan. Every call is framed and parsed with the real wire format, and its
// answer is delivered through the scheduler, as a network would. Tests can
// inject faults per server, delay a server, move regions around and
// inspect every call the servers received.
//
// The locator side keeps its own location cache, so that a moved region is
// only noticed once a server rejects the stale location.
//
// This class is thread-safe.
class MiniRegionStore : public RegionLocator,
                        public StubFactory,
                        public std::enable_shared_from_this<MiniRegionStore> {
 public:
  struct Options {
    Options();

    std::string table;

    // Start keys of the regions after the first one, in increasing order.
    std::vector<std::string> split_keys;

    // Number of replicas of each region, the default one included.
    int num_replicas;

    // Scanner lease announced to clients.
    uint32_t scanner_ttl_ms;

    // Cells returned per response at most; a row which does not fit is
    // split into partial results. Zero for no bound.
    int max_cells_per_response;

    // Ship the cells of the responses in a cell block rather than in the
    // response body.
    bool use_cell_blocks;

    // The server local to the client; every other server is remote.
    std::string local_server;
  };

  enum class Fault {
    // A local network error; the call never reached the server.
    NETWORK_ERROR,
    // The call timed out locally.
    TIMED_OUT,
    // The region is still opening on the server.
    REGION_OPENING,
    // The server's call queue is full.
    SERVER_OVERLOADED,
    // The server does not serve the region.
    NOT_SERVING_REGION,
    // The server dropped the scanner.
    SCANNER_EXPIRED,
    // The server rejects the call sequence number.
    OUT_OF_ORDER,
    // A server exception flagged as not retriable.
    DO_NOT_RETRY,
    // An exception which kills the connection.
    CONNECTION_FATAL,
    // The server answers with a heartbeat and no rows.
    HEARTBEAT,
    // The server rewinds the scanner to the start of its previous batch, so
    // that the answer overlaps rows which were already sent.
    REPLAY,
    // The server handles the call but the answer is lost on the way back.
    LOST_RESPONSE,
  };

  // A call received by one of the servers.
  struct Call {
    enum Kind {
      OPEN,
      CONTINUE,
      RENEW,
      CLOSE,
    };

    std::string ToString() const;

    std::string server;
    Kind kind;
    std::string region_name;
    std::string start_row;
    bool include_start_row;
    uint64_t scanner_id;
    uint64_t call_seq;
    uint32_t number_of_rows;
    uint32_t priority;
    std::map<std::string, std::string> attributes;
    bool faulted;
  };

  MiniRegionStore(std::shared_ptr<rpc::Scheduler> scheduler, Options options);
  ~MiniRegionStore();

  // Adds a cell to the table.
  void Put(const Cell& cell);

  // Adds a row with 'num_cells' cells in family "f".
  void PutRow(const std::string& row, int num_cells = 1);

  // Name of the server hosting replica 'replica_id' of region 'region_index'.
  std::string ServerFor(int region_index, int replica_id = 0) const;

  // Moves replica 'replica_id' of a region to another server. The locator
  // cache keeps pointing to the old server until it is invalidated.
  void MoveRegion(int region_index, int replica_id, const std::string& new_server);

  // The next 'count' open or continue calls received by 'server' fail with
  // 'fault'.
  void InjectFault(const std::string& server, Fault fault, int count = 1);

  // The next 'count' locate calls fail with 'status'.
  void InjectLocateFault(const Status& status, int count = 1);

  // Delays the answers of 'server'.
  void SetServerDelay(const std::string& server, const MonoDelta& delay);

  std::vector<Call> calls() const;

  // Number of open scanners on all servers.
  int num_open_scanners() const;

  int num_locate_calls() const;
  int num_invalidations() const;

  // RegionLocator implementation.
  void LocateRegion(const std::string& table,
                    const std::string& row,
                    int replica_id,
                    bool reload,
                    const MonoTime& deadline,
                    const RegionLocationCallback& callback) override;
  void LocateRegionReplicas(const std::string& table,
                            const std::string& row,
                            bool reload,
                            const MonoTime& deadline,
                            const RegionLocationsCallback& callback) override;
  void InvalidateCachedLocation(const RegionLocation& location) override;

  // StubFactory implementation.
  Status GetStub(const std::string& server,
                 std::shared_ptr<RegionServerStub>* stub) override;

 private:
  class Stub;
  friend class Stub;

  struct Region {
    RegionInfo info;
    // Server of each replica.
    std::vector<std::string> servers;
  };

  // Position of a scanner: the next cell to return is cell 'cell_offset' of
  // the first row at or after 'row'.
  struct Position {
    Position() : cell_offset(0) {}

    std::string row;
    size_t cell_offset;
  };

  struct Scanner {
    uint64_t id;
    std::string server;
    int region_index;
    int replica_id;
    std::string stop_row;
    bool include_stop_row;
    Position position;
    Position previous;
    uint64_t next_call_seq;
    MonoTime lease_deadline;
  };

  // Frames 'req' like a client connection would, hands it to the server
  // side and schedules the delivery of the answer.
  void HandleCall(const std::string& server,
                  const ScanRequestPB& req,
                  ScanResponsePB* resp,
                  rpc::RpcController* controller,
                  const rpc::ResponseCallback& callback);

  // Serves a parsed request. Returns false and fills 'error' if the call
  // fails with a server exception, setting 'connection_fatal' if the
  // exception kills the connection. Sets 'local_error' for faults which the
  // client notices without an answer. Must hold 'lock_'.
  bool HandleScanUnlocked(const std::string& server,
                          const rpc::RequestHeaderPB& header,
                          const ScanRequestPB& req,
                          ScanResponsePB* resp,
                          rpc::ExceptionResponsePB* error,
                          bool* connection_fatal,
                          Status* local_error);

  // Fills 'resp' with up to 'num_rows' rows of the scanner, advancing it.
  void ServeUnlocked(Scanner* scanner, uint32_t num_rows, ScanResponsePB* resp);

  int FindRegionUnlocked(const std::string& row) const;
  int FindRegionByNameUnlocked(const std::string& region_name, int* replica_id) const;
  RegionLocation LocationUnlocked(int region_index, int replica_id, bool reload);
  bool PopFaultUnlocked(const std::string& server, Fault* fault);

  const std::shared_ptr<rpc::Scheduler> scheduler_;
  const Options options_;

  mutable std::mutex lock_;
  std::vector<Region> regions_;
  std::map<std::string, std::vector<Cell>> rows_;
  std::map<uint64_t, Scanner> scanners_;
  uint64_t next_scanner_id_;
  int32_t next_call_id_;

  // Locator cache: region encoded name to server, per replica.
  std::map<std::string, std::string> location_cache_;

  std::map<std::string, std::deque<Fault>> faults_;
  std::deque<Status> locate_faults_;
  std::map<std::string, MonoDelta> delays_;
  std::map<std::string, std::shared_ptr<Stub>> stubs_;
  std::vector<Call> calls_;
  int num_locate_calls_;
  int num_invalidations_;

  DISALLOW_COPY_AND_ASSIGN(MiniRegionStore);
};

const char* FaultToString(MiniRegionStore::Fault fault);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_TESTING_MINI_REGION_STORE_H
