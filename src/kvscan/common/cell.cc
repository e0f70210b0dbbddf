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

#include "kvscan/common/cell.h"

#include <sstream>

#include "kvscan/util/slice.h"

using std::string;

namespace kvscan {

const char* CellTypeToString(CellType type) {
  switch (type) {
    case CellType::MINIMUM: return "Minimum";
    case CellType::PUT: return "Put";
    case CellType::DELETE: return "Delete";
    case CellType::DELETE_FAMILY_VERSION: return "DeleteFamilyVersion";
    case CellType::DELETE_COLUMN: return "DeleteColumn";
    case CellType::DELETE_FAMILY: return "DeleteFamily";
    case CellType::MAXIMUM: return "Maximum";
  }
  return "Unknown";
}

bool IsValidCellType(uint8_t b) {
  switch (static_cast<CellType>(b)) {
    case CellType::MINIMUM:
    case CellType::PUT:
    case CellType::DELETE:
    case CellType::DELETE_FAMILY_VERSION:
    case CellType::DELETE_COLUMN:
    case CellType::DELETE_FAMILY:
    case CellType::MAXIMUM:
      return true;
  }
  return false;
}

size_t Cell::EncodedSize() const {
  // Matches the KeyValue layout used by the cell block codec: two length
  // prefixes, a 2-byte row length, a 1-byte family length, the timestamp and
  // the type byte.
  return 4 + 4 + 2 + row.size() + 1 + family.size() + qualifier.size() + 8 + 1 +
      value.size();
}

string Cell::ToString() const {
  std::ostringstream s;
  s << Slice(row).ToDebugString() << "/" << Slice(family).ToDebugString() << ":"
    << Slice(qualifier).ToDebugString() << "/" << timestamp << "/"
    << CellTypeToString(type);
  return s.str();
}

int CompareCellsInRow(const Cell& a, const Cell& b) {
  int c = Slice(a.family).compare(Slice(b.family));
  if (c != 0) {
    return c;
  }
  c = Slice(a.qualifier).compare(Slice(b.qualifier));
  if (c != 0) {
    return c;
  }
  // Newer versions sort first.
  if (a.timestamp != b.timestamp) {
    return a.timestamp > b.timestamp ? -1 : 1;
  }
  if (a.type != b.type) {
    return static_cast<uint8_t>(a.type) > static_cast<uint8_t>(b.type) ? -1 : 1;
  }
  return 0;
}

int CompareCells(const Cell& a, const Cell& b) {
  int c = Slice(a.row).compare(Slice(b.row));
  if (c != 0) {
    return c;
  }
  return CompareCellsInRow(a, b);
}

bool operator==(const Cell& a, const Cell& b) {
  return CompareCells(a, b) == 0 && a.value == b.value;
}

} // namespace kvscan
