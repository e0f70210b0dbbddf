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

#include "kvscan/client/row_result.h"

#include <iterator>

#include "kvscan/client/client.pb.h"
#include "kvscan/common/key_util.h"
#include "kvscan/rpc/cell_block.h"
#include "kvscan/rpc/rpc_controller.h"
#include "kvscan/util/slice.h"

using std::string;
using std::vector;

namespace kvscan {
namespace client {

const string& RowResult::row() const {
  if (cells_.empty()) {
    return kEmptyRowKey;
  }
  return cells_.front().row;
}

size_t RowResult::EncodedSize() const {
  size_t size = 0;
  for (const Cell& cell : cells_) {
    size += cell.EncodedSize();
  }
  return size;
}

string RowResult::ToString() const {
  string ret = "RowResult(" + Slice(row()).ToDebugString() + ", " +
      std::to_string(cells_.size()) + " cells";
  if (partial_) {
    ret += ", partial";
  }
  ret += ")";
  return ret;
}

bool operator==(const RowResult& a, const RowResult& b) {
  return a.partial() == b.partial() && a.cells() == b.cells();
}

void CellToPB(const Cell& cell, CellPB* pb) {
  pb->set_row(cell.row);
  pb->set_family(cell.family);
  pb->set_qualifier(cell.qualifier);
  pb->set_timestamp(static_cast<uint64_t>(cell.timestamp));
  pb->set_cell_type(static_cast<CellTypePB>(cell.type));
  pb->set_value(cell.value);
}

Cell CellFromPB(const CellPB& pb) {
  return Cell(pb.row(), pb.family(), pb.qualifier(),
              static_cast<int64_t>(pb.timestamp()), pb.value(),
              static_cast<CellType>(pb.cell_type()));
}

Status RowBatchFromResponse(const ScanResponsePB& resp,
                            const rpc::RpcController& controller,
                            RowBatch* batch) {
  batch->rows.clear();
  batch->more_results_in_region = !resp.has_more_results_in_region() ||
      resp.more_results_in_region();
  batch->more_results = !resp.has_more_results() || resp.more_results();
  batch->heartbeat = resp.heartbeat_message();
  batch->stale = resp.stale();

  if (resp.results_size() > 0) {
    for (const ResultPB& result : resp.results()) {
      vector<Cell> cells;
      cells.reserve(result.cell_size());
      for (const CellPB& cell : result.cell()) {
        cells.emplace_back(CellFromPB(cell));
      }
      batch->rows.emplace_back(std::move(cells), result.partial());
    }
    return Status::OK();
  }

  if (resp.cells_per_result_size() == 0) {
    return Status::OK();
  }
  vector<Cell> cells;
  RETURN_NOT_OK_PREPEND(rpc::DecodeCellBlock(controller.response_cell_block(), &cells),
                        "invalid cell block in scan response");
  size_t offset = 0;
  for (int i = 0; i < resp.cells_per_result_size(); i++) {
    size_t count = resp.cells_per_result(i);
    if (offset + count > cells.size()) {
      return Status::Corruption(
          "scan response announces more cells than its cell block holds",
          std::to_string(offset + count) + " > " + std::to_string(cells.size()));
    }
    vector<Cell> row_cells(std::make_move_iterator(cells.begin() + offset),
                           std::make_move_iterator(cells.begin() + offset + count));
    offset += count;
    bool partial = i < resp.partial_flag_per_result_size() &&
        resp.partial_flag_per_result(i);
    batch->rows.emplace_back(std::move(row_cells), partial);
  }
  if (offset != cells.size()) {
    return Status::Corruption("scan response cell block holds unclaimed cells",
                              std::to_string(cells.size() - offset));
  }
  return Status::OK();
}

} // namespace client
} // namespace kvscan
