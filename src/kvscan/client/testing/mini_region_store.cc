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

#include "kvscan/client/testing/mini_region_store.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "kvscan/client/client.pb.h"
#include "kvscan/client/row_result.h"
#include "kvscan/common/key_util.h"
#include "kvscan/rpc/cell_block.h"
#include "kvscan/rpc/constants.h"
#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/rpc/rpc_header.pb.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/rpc/serialization.h"
#include "kvscan/util/slice.h"

using kvscan::rpc::ExceptionResponsePB;
using kvscan::rpc::RequestHeaderPB;
using kvscan::rpc::ResponseHeaderPB;
using kvscan::rpc::RpcController;
using kvscan::rpc::ServerErrorCodePB;
using std::lock_guard;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::vector;

namespace kvscan {
namespace client {

namespace {

void SetError(const char* exception_class, ServerErrorCodePB code, const string& msg,
              ExceptionResponsePB* error) {
  error->set_exception_class_name(exception_class);
  error->set_code(code);
  error->set_stack_trace(msg);
}

} // anonymous namespace

const char* FaultToString(MiniRegionStore::Fault fault) {
  switch (fault) {
    case MiniRegionStore::Fault::NETWORK_ERROR: return "NETWORK_ERROR";
    case MiniRegionStore::Fault::TIMED_OUT: return "TIMED_OUT";
    case MiniRegionStore::Fault::REGION_OPENING: return "REGION_OPENING";
    case MiniRegionStore::Fault::SERVER_OVERLOADED: return "SERVER_OVERLOADED";
    case MiniRegionStore::Fault::NOT_SERVING_REGION: return "NOT_SERVING_REGION";
    case MiniRegionStore::Fault::SCANNER_EXPIRED: return "SCANNER_EXPIRED";
    case MiniRegionStore::Fault::OUT_OF_ORDER: return "OUT_OF_ORDER";
    case MiniRegionStore::Fault::DO_NOT_RETRY: return "DO_NOT_RETRY";
    case MiniRegionStore::Fault::CONNECTION_FATAL: return "CONNECTION_FATAL";
    case MiniRegionStore::Fault::HEARTBEAT: return "HEARTBEAT";
    case MiniRegionStore::Fault::REPLAY: return "REPLAY";
    case MiniRegionStore::Fault::LOST_RESPONSE: return "LOST_RESPONSE";
  }
  LOG(FATAL) << "unknown fault";
  return "";
}

string MiniRegionStore::Call::ToString() const {
  static const char* const kKindNames[] = { "OPEN", "CONTINUE", "RENEW", "CLOSE" };
  string ret = string(kKindNames[kind]) + " on " + server;
  if (kind == OPEN) {
    ret += " at " + Slice(start_row).ToDebugString() +
           (include_start_row ? " (inclusive)" : " (exclusive)");
  } else {
    ret += " scanner " + std::to_string(scanner_id) + " seq " + std::to_string(call_seq);
  }
  if (faulted) {
    ret += " (faulted)";
  }
  return ret;
}

MiniRegionStore::Options::Options()
    : table("test-table"),
      num_replicas(1),
      scanner_ttl_ms(60000),
      max_cells_per_response(0),
      use_cell_blocks(false) {
}

// The client side of a connection to one server.
class MiniRegionStore::Stub : public RegionServerStub {
 public:
  Stub(MiniRegionStore* store, string server)
      : store_(store),
        server_(std::move(server)) {
  }

  void ScanAsync(const ScanRequestPB& req,
                 ScanResponsePB* resp,
                 RpcController* controller,
                 const rpc::ResponseCallback& callback) override {
    store_->HandleCall(server_, req, resp, controller, callback);
  }

 private:
  MiniRegionStore* const store_;
  const string server_;
};

MiniRegionStore::MiniRegionStore(shared_ptr<rpc::Scheduler> scheduler, Options options)
    : scheduler_(std::move(scheduler)),
      options_(std::move(options)),
      next_scanner_id_(1),
      next_call_id_(0),
      num_locate_calls_(0),
      num_invalidations_(0) {
  CHECK_GE(options_.num_replicas, 1);
  vector<string> starts;
  starts.push_back(kEmptyRowKey);
  starts.insert(starts.end(), options_.split_keys.begin(), options_.split_keys.end());
  for (size_t i = 0; i < starts.size(); i++) {
    const string& end = i + 1 < starts.size() ? starts[i + 1] : kEmptyRowKey;
    CHECK(end.empty() || starts[i] < end) << "split keys must increase";
    Region region;
    region.info = RegionInfo(options_.table, starts[i], end, i + 1);
    for (int r = 0; r < options_.num_replicas; r++) {
      region.servers.push_back("rs-" + std::to_string(i) + "-" + std::to_string(r) + ":16020");
    }
    regions_.push_back(std::move(region));
  }
}

MiniRegionStore::~MiniRegionStore() {
}

void MiniRegionStore::Put(const Cell& cell) {
  lock_guard<mutex> l(lock_);
  vector<Cell>& cells = rows_[cell.row];
  auto it = std::upper_bound(cells.begin(), cells.end(), cell,
                             [](const Cell& a, const Cell& b) {
                               return CompareCellsInRow(a, b) < 0;
                             });
  cells.insert(it, cell);
}

void MiniRegionStore::PutRow(const string& row, int num_cells) {
  for (int i = 0; i < num_cells; i++) {
    string qualifier = std::to_string(i);
    qualifier = "q" + string(qualifier.size() < 3 ? 3 - qualifier.size() : 0, '0') + qualifier;
    Put(Cell(row, "f", qualifier, 1, row + "-" + std::to_string(i)));
  }
}

string MiniRegionStore::ServerFor(int region_index, int replica_id) const {
  lock_guard<mutex> l(lock_);
  CHECK_GE(region_index, 0);
  CHECK_LT(region_index, static_cast<int>(regions_.size()));
  return regions_[region_index].servers[replica_id];
}

void MiniRegionStore::MoveRegion(int region_index, int replica_id, const string& new_server) {
  lock_guard<mutex> l(lock_);
  regions_[region_index].servers[replica_id] = new_server;
}

void MiniRegionStore::InjectFault(const string& server, Fault fault, int count) {
  lock_guard<mutex> l(lock_);
  for (int i = 0; i < count; i++) {
    faults_[server].push_back(fault);
  }
}

void MiniRegionStore::InjectLocateFault(const Status& status, int count) {
  lock_guard<mutex> l(lock_);
  for (int i = 0; i < count; i++) {
    locate_faults_.push_back(status);
  }
}

void MiniRegionStore::SetServerDelay(const string& server, const MonoDelta& delay) {
  lock_guard<mutex> l(lock_);
  delays_[server] = delay;
}

vector<MiniRegionStore::Call> MiniRegionStore::calls() const {
  lock_guard<mutex> l(lock_);
  return calls_;
}

int MiniRegionStore::num_open_scanners() const {
  lock_guard<mutex> l(lock_);
  return scanners_.size();
}

int MiniRegionStore::num_locate_calls() const {
  lock_guard<mutex> l(lock_);
  return num_locate_calls_;
}

int MiniRegionStore::num_invalidations() const {
  lock_guard<mutex> l(lock_);
  return num_invalidations_;
}

void MiniRegionStore::LocateRegion(const string& table,
                                   const string& row,
                                   int replica_id,
                                   bool reload,
                                   const MonoTime& /* deadline */,
                                   const RegionLocationCallback& callback) {
  Status s;
  RegionLocation location;
  {
    lock_guard<mutex> l(lock_);
    num_locate_calls_++;
    if (!locate_faults_.empty()) {
      s = locate_faults_.front();
      locate_faults_.pop_front();
    } else if (table != options_.table) {
      s = Status::NotFound("table not found", table);
    } else if (replica_id < 0 || replica_id >= options_.num_replicas) {
      s = Status::NotFound("no such replica", std::to_string(replica_id));
    } else {
      location = LocationUnlocked(FindRegionUnlocked(row), replica_id, reload);
    }
  }
  scheduler_->Schedule([callback, s, location](const Status& st) {
    callback(st.ok() ? s : st, location);
  }, MonoDelta::FromNanoseconds(0));
}

void MiniRegionStore::LocateRegionReplicas(const string& table,
                                           const string& row,
                                           bool reload,
                                           const MonoTime& /* deadline */,
                                           const RegionLocationsCallback& callback) {
  Status s;
  vector<RegionLocation> locations;
  {
    lock_guard<mutex> l(lock_);
    num_locate_calls_++;
    if (!locate_faults_.empty()) {
      s = locate_faults_.front();
      locate_faults_.pop_front();
    } else if (table != options_.table) {
      s = Status::NotFound("table not found", table);
    } else {
      int index = FindRegionUnlocked(row);
      for (int r = 0; r < options_.num_replicas; r++) {
        locations.push_back(LocationUnlocked(index, r, reload));
      }
    }
  }
  RegionLocations locs(std::move(locations));
  scheduler_->Schedule([callback, s, locs](const Status& st) {
    callback(st.ok() ? s : st, locs);
  }, MonoDelta::FromNanoseconds(0));
}

void MiniRegionStore::InvalidateCachedLocation(const RegionLocation& location) {
  lock_guard<mutex> l(lock_);
  num_invalidations_++;
  location_cache_.erase(location.region.encoded_name());
}

Status MiniRegionStore::GetStub(const string& server, shared_ptr<RegionServerStub>* stub) {
  lock_guard<mutex> l(lock_);
  shared_ptr<Stub>& s = stubs_[server];
  if (!s) {
    s = std::make_shared<Stub>(this, server);
  }
  *stub = s;
  return Status::OK();
}

int MiniRegionStore::FindRegionUnlocked(const string& row) const {
  for (int i = regions_.size() - 1; i > 0; i--) {
    if (regions_[i].info.start_key() <= row) {
      return i;
    }
  }
  return 0;
}

int MiniRegionStore::FindRegionByNameUnlocked(const string& region_name,
                                              int* replica_id) const {
  for (size_t i = 0; i < regions_.size(); i++) {
    for (int r = 0; r < options_.num_replicas; r++) {
      if (regions_[i].info.ForReplica(r).region_name() == region_name) {
        *replica_id = r;
        return i;
      }
    }
  }
  return -1;
}

RegionLocation MiniRegionStore::LocationUnlocked(int region_index, int replica_id,
                                                 bool reload) {
  RegionInfo info = regions_[region_index].info.ForReplica(replica_id);
  auto it = location_cache_.find(info.encoded_name());
  if (reload || it == location_cache_.end()) {
    it = location_cache_.emplace(info.encoded_name(), string()).first;
    it->second = regions_[region_index].servers[replica_id];
  }
  string server = it->second;
  bool is_remote = server != options_.local_server;
  return RegionLocation(std::move(info), std::move(server), is_remote);
}

bool MiniRegionStore::PopFaultUnlocked(const string& server, Fault* fault) {
  auto it = faults_.find(server);
  if (it == faults_.end() || it->second.empty()) {
    return false;
  }
  *fault = it->second.front();
  it->second.pop_front();
  return true;
}

void MiniRegionStore::HandleCall(const string& server,
                                 const ScanRequestPB& req,
                                 ScanResponsePB* resp,
                                 RpcController* controller,
                                 const rpc::ResponseCallback& callback) {
  // Client side: frame the call.
  RequestHeaderPB header;
  int32_t call_id;
  {
    lock_guard<mutex> l(lock_);
    call_id = next_call_id_++;
  }
  header.set_call_id(call_id);
  header.set_method_name("Scan");
  header.set_priority(controller->priority());
  if (controller->timeout().Initialized()) {
    header.set_timeout(std::max<int64_t>(0, controller->timeout().ToMilliseconds()));
  }
  for (const auto& attr : controller->request_attributes()) {
    rpc::NameBytesPairPB* pb = header.add_attribute();
    pb->set_name(attr.first);
    pb->set_value(attr.second);
  }
  string request_frame;
  rpc::serialization::SerializeRequest(&header, req, Slice(), &request_frame);

  // Server side: parse the call and handle it.
  RequestHeaderPB parsed_header;
  Slice body;
  Slice request_cell_block;
  CHECK_OK(rpc::serialization::ParseRequest(Slice(request_frame), &parsed_header, &body,
                                            &request_cell_block));
  ScanRequestPB server_req;
  CHECK(server_req.ParseFromArray(body.data(), body.size()));

  ScanResponsePB server_resp;
  ExceptionResponsePB error;
  bool connection_fatal = false;
  Status local_error;
  bool ok;
  MonoDelta delay = MonoDelta::FromNanoseconds(0);
  {
    lock_guard<mutex> l(lock_);
    ok = HandleScanUnlocked(server, parsed_header, server_req, &server_resp, &error,
                            &connection_fatal, &local_error);
    auto it = delays_.find(server);
    if (it != delays_.end()) {
      delay = it->second;
    }
  }

  if (!local_error.ok()) {
    scheduler_->Schedule([controller, callback, local_error](const Status& s) {
      controller->MarkFailed(s.ok() ? local_error : s);
      callback();
    }, delay);
    return;
  }

  // Server side: frame the answer.
  ResponseHeaderPB resp_header;
  resp_header.set_call_id(connection_fatal ? rpc::kFatalConnectionCallId : call_id);
  string response_frame;
  if (!ok) {
    *resp_header.mutable_exception() = error;
    rpc::serialization::SerializeResponse(&resp_header, nullptr, Slice(), &response_frame);
  } else if (options_.use_cell_blocks && server_resp.results_size() > 0) {
    vector<Cell> cells;
    for (const ResultPB& result : server_resp.results()) {
      server_resp.add_cells_per_result(result.cell_size());
      server_resp.add_partial_flag_per_result(result.partial());
      for (const CellPB& cell : result.cell()) {
        cells.push_back(CellFromPB(cell));
      }
    }
    server_resp.clear_results();
    string cell_block;
    rpc::EncodeCellBlock(cells, &cell_block);
    rpc::serialization::SerializeResponse(&resp_header, &server_resp, Slice(cell_block),
                                          &response_frame);
  } else {
    rpc::serialization::SerializeResponse(&resp_header, &server_resp, Slice(),
                                          &response_frame);
  }

  // Client side: the answer arrives.
  scheduler_->Schedule([resp, controller, callback, response_frame](const Status& s) {
    if (!s.ok()) {
      controller->MarkFailed(s);
    } else {
      controller->CompleteFromFrame(Slice(response_frame), resp);
    }
    callback();
  }, delay);
}

bool MiniRegionStore::HandleScanUnlocked(const string& server,
                                         const RequestHeaderPB& header,
                                         const ScanRequestPB& req,
                                         ScanResponsePB* resp,
                                         ExceptionResponsePB* error,
                                         bool* connection_fatal,
                                         Status* local_error) {
  Call call;
  call.server = server;
  if (req.has_region()) {
    call.kind = Call::OPEN;
  } else if (req.close_scanner()) {
    call.kind = Call::CLOSE;
  } else if (req.renew()) {
    call.kind = Call::RENEW;
  } else {
    call.kind = Call::CONTINUE;
  }
  call.region_name = req.region().region_name();
  call.start_row = req.scan().start_row();
  call.include_start_row = req.scan().include_start_row();
  call.scanner_id = req.scanner_id();
  call.call_seq = req.next_call_seq();
  call.number_of_rows = req.number_of_rows();
  call.priority = header.priority();
  for (const rpc::NameBytesPairPB& attr : header.attribute()) {
    call.attributes[attr.name()] = attr.value();
  }
  Fault fault = Fault::NETWORK_ERROR;
  bool has_fault = (call.kind == Call::OPEN || call.kind == Call::CONTINUE) &&
      PopFaultUnlocked(server, &fault);
  call.faulted = has_fault;
  calls_.push_back(call);

  if (has_fault) {
    VLOG(1) << "Injecting " << FaultToString(fault) << " into " << call.ToString();
    switch (fault) {
      case Fault::NETWORK_ERROR:
        *local_error = Status::NetworkError("injected network error", server);
        return false;
      case Fault::TIMED_OUT:
        *local_error = Status::TimedOut("injected timeout", server);
        return false;
      case Fault::REGION_OPENING:
        SetError("RegionOpeningException", rpc::REGION_OPENING, "region is opening", error);
        return false;
      case Fault::SERVER_OVERLOADED:
        SetError("CallQueueTooBigException", rpc::CALL_QUEUE_TOO_BIG, "call queue is full",
                 error);
        error->set_server_overloaded(true);
        return false;
      case Fault::NOT_SERVING_REGION:
        SetError("NotServingRegionException", rpc::NOT_SERVING_REGION,
                 "region is not online", error);
        return false;
      case Fault::SCANNER_EXPIRED:
        scanners_.erase(req.scanner_id());
        SetError("UnknownScannerException", rpc::UNKNOWN_SCANNER,
                 "unknown scanner " + std::to_string(req.scanner_id()), error);
        return false;
      case Fault::OUT_OF_ORDER:
        SetError("OutOfOrderScannerNextException", rpc::OUT_OF_ORDER_SCANNER_NEXT,
                 "expected another call sequence number", error);
        return false;
      case Fault::DO_NOT_RETRY:
        SetError("DoNotRetryIOException", rpc::UNKNOWN_ERROR, "injected failure", error);
        error->set_do_not_retry(true);
        return false;
      case Fault::CONNECTION_FATAL:
        SetError("FatalConnectionException", rpc::UNKNOWN_ERROR, "connection closed", error);
        *connection_fatal = true;
        return false;
      case Fault::HEARTBEAT:
      case Fault::REPLAY:
      case Fault::LOST_RESPONSE:
        break;
    }
  }

  MonoTime now = MonoTime::Now();
  MonoDelta ttl = MonoDelta::FromMilliseconds(options_.scanner_ttl_ms);

  if (call.kind == Call::OPEN) {
    int replica_id = 0;
    int index = FindRegionByNameUnlocked(req.region().region_name(), &replica_id);
    if (index < 0 || regions_[index].servers[replica_id] != server) {
      SetError("NotServingRegionException", rpc::NOT_SERVING_REGION,
               "region " + req.region().region_name() + " is not online on " + server, error);
      return false;
    }
    const RegionInfo& info = regions_[index].info;
    Scanner scanner;
    scanner.id = next_scanner_id_++;
    scanner.server = server;
    scanner.region_index = index;
    scanner.replica_id = replica_id;
    scanner.stop_row = req.scan().stop_row();
    scanner.include_stop_row = req.scan().include_stop_row();
    const string& start = req.scan().start_row();
    if (start < info.start_key()) {
      scanner.position.row = info.start_key();
    } else if (req.scan().include_start_row()) {
      scanner.position.row = start;
    } else {
      scanner.position.row = key_util::ClosestRowAfter(start);
    }
    scanner.previous = scanner.position;
    scanner.next_call_seq = 0;
    scanner.lease_deadline = now + ttl;

    resp->set_scanner_id(scanner.id);
    resp->set_ttl(options_.scanner_ttl_ms);
    resp->set_stale(replica_id != 0);
    if (has_fault && fault == Fault::HEARTBEAT) {
      resp->set_heartbeat_message(true);
      resp->set_more_results_in_region(true);
      resp->set_more_results(true);
    } else {
      ServeUnlocked(&scanner, req.number_of_rows(), resp);
    }
    if (resp->more_results_in_region()) {
      scanners_.emplace(scanner.id, scanner);
    }
  } else {
    auto it = scanners_.find(req.scanner_id());
    if (it == scanners_.end() || it->second.server != server) {
      SetError("UnknownScannerException", rpc::UNKNOWN_SCANNER,
               "unknown scanner " + std::to_string(req.scanner_id()), error);
      return false;
    }
    Scanner* scanner = &it->second;
    if (now > scanner->lease_deadline) {
      scanners_.erase(it);
      SetError("UnknownScannerException", rpc::UNKNOWN_SCANNER,
               "lease of scanner " + std::to_string(req.scanner_id()) + " expired", error);
      return false;
    }
    if (call.kind == Call::CLOSE) {
      scanners_.erase(it);
      resp->set_more_results_in_region(false);
      return true;
    }
    scanner->lease_deadline = now + ttl;
    resp->set_scanner_id(scanner->id);
    resp->set_ttl(options_.scanner_ttl_ms);
    if (call.kind == Call::RENEW) {
      return true;
    }
    if (req.next_call_seq() != scanner->next_call_seq) {
      SetError("OutOfOrderScannerNextException", rpc::OUT_OF_ORDER_SCANNER_NEXT,
               "expected call sequence " + std::to_string(scanner->next_call_seq) +
               ", got " + std::to_string(req.next_call_seq()), error);
      return false;
    }
    if (regions_[scanner->region_index].servers[scanner->replica_id] != server) {
      scanners_.erase(it);
      SetError("NotServingRegionException", rpc::NOT_SERVING_REGION,
               "region moved away from " + server, error);
      return false;
    }
    scanner->next_call_seq++;
    resp->set_stale(scanner->replica_id != 0);
    if (has_fault && fault == Fault::HEARTBEAT) {
      resp->set_heartbeat_message(true);
      resp->set_more_results_in_region(true);
      resp->set_more_results(true);
      return true;
    }
    if (has_fault && fault == Fault::REPLAY) {
      scanner->position = scanner->previous;
    }
    ServeUnlocked(scanner, req.number_of_rows(), resp);
    if (!resp->more_results_in_region()) {
      scanners_.erase(it);
    }
  }

  if (has_fault && fault == Fault::LOST_RESPONSE) {
    *local_error = Status::NetworkError("connection reset while reading the response",
                                        server);
  }
  return true;
}

void MiniRegionStore::ServeUnlocked(Scanner* scanner, uint32_t num_rows,
                                    ScanResponsePB* resp) {
  scanner->previous = scanner->position;
  const RegionInfo& info = regions_[scanner->region_index].info;
  auto in_scan = [&](const string& row) {
    if (!info.ContainsRow(row)) {
      return false;
    }
    if (scanner->stop_row.empty()) {
      return true;
    }
    return scanner->include_stop_row ? row <= scanner->stop_row : row < scanner->stop_row;
  };

  const size_t max_cells = options_.max_cells_per_response;
  size_t cells_sent = 0;
  uint32_t rows_sent = 0;
  auto it = rows_.lower_bound(scanner->position.row);
  while (it != rows_.end() && in_scan(it->first) && rows_sent < num_rows) {
    const vector<Cell>& cells = it->second;
    size_t offset = it->first == scanner->position.row ? scanner->position.cell_offset : 0;
    size_t take = cells.size() - offset;
    if (max_cells > 0) {
      take = std::min(take, max_cells - cells_sent);
    }
    if (take == 0) {
      break;
    }
    ResultPB* result = resp->add_results();
    for (size_t i = offset; i < offset + take; i++) {
      CellToPB(cells[i], result->add_cell());
    }
    cells_sent += take;
    rows_sent++;
    if (offset + take < cells.size()) {
      result->set_partial(true);
      scanner->position.row = it->first;
      scanner->position.cell_offset = offset + take;
      break;
    }
    scanner->position.row = key_util::ClosestRowAfter(it->first);
    scanner->position.cell_offset = 0;
    ++it;
  }

  auto next = rows_.lower_bound(scanner->position.row);
  bool more_in_region = next != rows_.end() && in_scan(next->first);
  resp->set_more_results_in_region(more_in_region);
  resp->set_more_results(more_in_region ||
                         !key_util::IsLastRegionForScan(info.end_key(), scanner->stop_row,
                                                        scanner->include_stop_row));
}

} // namespace client
} // namespace kvscan
