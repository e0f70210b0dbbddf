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

#include "kvscan/rpc/cell_block.h"

#include <cstdint>
#include <iterator>
#include <limits>
#include <utility>

#include <glog/logging.h>

#include "kvscan/gutil/endian.h"
#include "kvscan/rpc/constants.h"

using std::string;
using std::vector;

namespace kvscan {
namespace rpc {

namespace {

// Key bytes which are not row, family or qualifier: row length, family
// length, timestamp and type.
const size_t kKeyInfrastructureSize = 2 + 1 + 8 + 1;

// Key length and value length.
const size_t kLengthsSize = 4 + 4;

void PutFixed16(string* dst, uint16_t v) {
  char buf[sizeof(v)];
  NetworkByteOrder::Store16(buf, v);
  dst->append(buf, sizeof(buf));
}

void PutFixed32(string* dst, uint32_t v) {
  char buf[sizeof(v)];
  NetworkByteOrder::Store32(buf, v);
  dst->append(buf, sizeof(buf));
}

void PutFixed64(string* dst, uint64_t v) {
  char buf[sizeof(v)];
  NetworkByteOrder::Store64(buf, v);
  dst->append(buf, sizeof(buf));
}

// Consumes 'n' bytes from the front of 'input' into 'out'.
bool GetBytes(Slice* input, size_t n, string* out) {
  if (input->size() < n) {
    return false;
  }
  out->assign(reinterpret_cast<const char*>(input->data()), n);
  input->remove_prefix(n);
  return true;
}

Status DecodeOneCell(Slice* input, Cell* cell) {
  if (input->size() < sizeof(uint32_t)) {
    return Status::Corruption("truncated cell length");
  }
  uint32_t cell_len = NetworkByteOrder::Load32(input->data());
  input->remove_prefix(sizeof(uint32_t));
  if (input->size() < cell_len || cell_len < kLengthsSize) {
    return Status::Corruption("truncated cell",
                              "expected " + std::to_string(cell_len) + " bytes, " +
                              std::to_string(input->size()) + " available");
  }
  Slice kv(input->data(), cell_len);
  input->remove_prefix(cell_len);

  uint32_t key_len = NetworkByteOrder::Load32(kv.data());
  uint32_t value_len = NetworkByteOrder::Load32(kv.data() + 4);
  kv.remove_prefix(kLengthsSize);
  if (static_cast<uint64_t>(key_len) + value_len != kv.size() ||
      key_len < kKeyInfrastructureSize) {
    return Status::Corruption("inconsistent cell lengths",
                              "key " + std::to_string(key_len) + ", value " +
                              std::to_string(value_len) + ", cell " +
                              std::to_string(cell_len));
  }

  Slice key(kv.data(), key_len);
  uint16_t row_len = NetworkByteOrder::Load16(key.data());
  key.remove_prefix(2);
  if (!GetBytes(&key, row_len, &cell->row) || key.empty()) {
    return Status::Corruption("row length overruns cell key");
  }
  uint8_t family_len = key[0];
  key.remove_prefix(1);
  if (!GetBytes(&key, family_len, &cell->family)) {
    return Status::Corruption("family length overruns cell key");
  }
  if (key.size() < 8 + 1) {
    return Status::Corruption("cell key too short for timestamp and type");
  }
  size_t qualifier_len = key.size() - 8 - 1;
  CHECK(GetBytes(&key, qualifier_len, &cell->qualifier));
  cell->timestamp = static_cast<int64_t>(NetworkByteOrder::Load64(key.data()));
  key.remove_prefix(8);
  uint8_t type = key[0];
  if (!IsValidCellType(type)) {
    return Status::Corruption("unknown cell type", std::to_string(type));
  }
  cell->type = static_cast<CellType>(type);

  cell->value.assign(reinterpret_cast<const char*>(kv.data() + key_len), value_len);
  return Status::OK();
}

} // anonymous namespace

Status CheckCellBlockCodec(const string& codec_class,
                           const string& compressor_class) {
  if (!compressor_class.empty()) {
    return Status::NotSupported("cell block compression is not supported",
                                compressor_class);
  }
  if (!codec_class.empty() && codec_class != kKeyValueCodecClass) {
    return Status::NotSupported("unsupported cell block codec", codec_class);
  }
  return Status::OK();
}

void EncodeCellBlock(const vector<Cell>& cells, string* dst) {
  for (const Cell& cell : cells) {
    CHECK_LE(cell.row.size(), std::numeric_limits<uint16_t>::max());
    CHECK_LE(cell.family.size(), std::numeric_limits<uint8_t>::max());
    uint32_t key_len = kKeyInfrastructureSize + cell.row.size() +
        cell.family.size() + cell.qualifier.size();
    uint32_t value_len = cell.value.size();

    PutFixed32(dst, kLengthsSize + key_len + value_len);
    PutFixed32(dst, key_len);
    PutFixed32(dst, value_len);
    PutFixed16(dst, cell.row.size());
    dst->append(cell.row);
    dst->push_back(static_cast<char>(cell.family.size()));
    dst->append(cell.family);
    dst->append(cell.qualifier);
    PutFixed64(dst, static_cast<uint64_t>(cell.timestamp));
    dst->push_back(static_cast<char>(cell.type));
    dst->append(cell.value);
  }
}

Status DecodeCellBlock(const Slice& block, vector<Cell>* cells) {
  Slice input = block;
  vector<Cell> decoded;
  while (!input.empty()) {
    Cell cell;
    RETURN_NOT_OK_PREPEND(DecodeOneCell(&input, &cell),
                          "unable to decode cell " + std::to_string(decoded.size()));
    decoded.emplace_back(std::move(cell));
  }
  cells->insert(cells->end(),
                std::make_move_iterator(decoded.begin()),
                std::make_move_iterator(decoded.end()));
  return Status::OK();
}

} // namespace rpc
} // namespace kvscan
