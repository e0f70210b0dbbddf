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
#ifndef KVSCAN_CLIENT_ROW_RESULT_H
#define KVSCAN_CLIENT_ROW_RESULT_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "kvscan/common/cell.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {

namespace rpc {
class RpcController;
} // namespace rpc

namespace client {

class CellPB;
class ScanResponsePB;

// The cells of one row, in the order the server returned them. A partial
// row is a fragment: more cells of the same row follow in a later result.
class RowResult {
 public:
  RowResult() : partial_(false) {}
  RowResult(std::vector<Cell> cells, bool partial)
      : cells_(std::move(cells)),
        partial_(partial) {
  }

  // The row key, or the empty string if the result has no cells.
  const std::string& row() const;

  const std::vector<Cell>& cells() const { return cells_; }
  std::vector<Cell>* mutable_cells() { return &cells_; }

  bool empty() const { return cells_.empty(); }

  bool partial() const { return partial_; }
  void set_partial(bool partial) { partial_ = partial; }

  // Approximate number of bytes of the row on the wire.
  size_t EncodedSize() const;

  std::string ToString() const;

 private:
  std::vector<Cell> cells_;
  bool partial_;
};

bool operator==(const RowResult& a, const RowResult& b);

// The decoded content of one scan response.
struct RowBatch {
  RowBatch()
      : more_results_in_region(true),
        more_results(true),
        heartbeat(false),
        stale(false) {
  }

  // True if more rows of the current region may follow the last row.
  bool may_have_more_cells_for_row() const {
    return !rows.empty() && rows.back().partial();
  }

  std::vector<RowResult> rows;

  // False once the region has no more rows for the scan.
  bool more_results_in_region;

  // False once the scan reached its stop row; no further region needs to be
  // visited.
  bool more_results;

  // The server replied without rows to show that the scan is progressing.
  bool heartbeat;

  // The rows were served by a secondary replica.
  bool stale;
};

void CellToPB(const Cell& cell, CellPB* pb);
Cell CellFromPB(const CellPB& pb);

// Decodes the rows of 'resp'. Rows travel either inside the response body or
// in the controller's cell block, split according to the response's
// cells-per-result list.
Status RowBatchFromResponse(const ScanResponsePB& resp,
                            const rpc::RpcController& controller,
                            RowBatch* batch) WARN_UNUSED_RESULT;

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_ROW_RESULT_H
