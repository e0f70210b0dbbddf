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
#ifndef KVSCAN_COMMON_CELL_H
#define KVSCAN_COMMON_CELL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace kvscan {

// The type of a cell, as stored by the region servers. The numeric values are
// part of the cell block encoding.
enum class CellType : uint8_t {
  MINIMUM = 0,
  PUT = 4,
  DELETE = 8,
  DELETE_FAMILY_VERSION = 10,
  DELETE_COLUMN = 12,
  DELETE_FAMILY = 14,
  MAXIMUM = 255,
};

const char* CellTypeToString(CellType type);

// Returns true if 'b' is the numeric value of a known cell type.
bool IsValidCellType(uint8_t b);

// A single versioned value of one column of one row.
struct Cell {
  Cell()
      : timestamp(0),
        type(CellType::PUT) {
  }

  Cell(std::string row, std::string family, std::string qualifier,
       int64_t timestamp, std::string value, CellType type = CellType::PUT)
      : row(std::move(row)),
        family(std::move(family)),
        qualifier(std::move(qualifier)),
        timestamp(timestamp),
        type(type),
        value(std::move(value)) {
  }

  // Approximate number of bytes this cell occupies on the wire.
  size_t EncodedSize() const;

  std::string ToString() const;

  std::string row;
  std::string family;
  std::string qualifier;
  int64_t timestamp;
  CellType type;
  std::string value;
};

// Compares two cells of the same row in the order the region servers return
// them: family, then qualifier, then newest timestamp first, then type with
// the larger type code first.
int CompareCellsInRow(const Cell& a, const Cell& b);

// Like CompareCellsInRow(), but orders by row key first.
int CompareCells(const Cell& a, const Cell& b);

bool operator==(const Cell& a, const Cell& b);

} // namespace kvscan

#endif // KVSCAN_COMMON_CELL_H
