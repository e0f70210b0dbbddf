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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/common/cell.h"
#include "kvscan/rpc/constants.h"
#include "kvscan/util/test_macros.h"

using std::string;
using std::vector;

namespace kvscan {
namespace rpc {

TEST(CellBlockTest, TestEncodeDecode) {
  vector<Cell> cells = {
    Cell("row1", "f", "q1", 10, "value1"),
    Cell("row1", "f", "q2", 9, "", CellType::DELETE_COLUMN),
    Cell("row2", "family", "", 1, string("\x00\xff", 2)),
  };
  string block;
  EncodeCellBlock(cells, &block);

  vector<Cell> decoded;
  ASSERT_OK(DecodeCellBlock(Slice(block), &decoded));
  ASSERT_EQ(cells.size(), decoded.size());
  for (size_t i = 0; i < cells.size(); i++) {
    EXPECT_EQ(cells[i], decoded[i]) << cells[i].ToString() << " vs " << decoded[i].ToString();
  }
}

TEST(CellBlockTest, TestLayout) {
  string block;
  EncodeCellBlock({ Cell("r1", "f", "q", 5, "v") }, &block);
  // Cell length, key and value lengths, then a 16-byte key and the value.
  ASSERT_EQ(29, block.size());
  ASSERT_EQ(string("\x00\x00\x00\x19", 4), block.substr(0, 4));
  ASSERT_EQ(string("\x00\x00\x00\x10", 4), block.substr(4, 4));
  ASSERT_EQ(string("\x00\x00\x00\x01", 4), block.substr(8, 4));
  ASSERT_EQ(string("\x00\x02r1\x01" "fq", 7), block.substr(12, 7));
  ASSERT_EQ(static_cast<char>(CellType::PUT), block[27]);
  ASSERT_EQ('v', block[28]);
}

TEST(CellBlockTest, TestEmptyBlock) {
  vector<Cell> decoded;
  ASSERT_OK(DecodeCellBlock(Slice(), &decoded));
  ASSERT_TRUE(decoded.empty());
}

TEST(CellBlockTest, TestTruncatedBlocks) {
  string block;
  EncodeCellBlock({ Cell("r1", "f", "q", 5, "v"), Cell("r2", "f", "q", 5, "w") }, &block);
  // Every strict prefix which does not end on a cell boundary is corrupt.
  for (size_t len = 1; len < block.size(); len++) {
    if (len == block.size() / 2) {
      continue;
    }
    vector<Cell> decoded;
    Status s = DecodeCellBlock(Slice(block.data(), len), &decoded);
    ASSERT_TRUE(s.IsCorruption()) << "length " << len << ": " << s.ToString();
    ASSERT_TRUE(decoded.empty());
  }
}

TEST(CellBlockTest, TestBadCellType) {
  string block;
  EncodeCellBlock({ Cell("r1", "f", "q", 5, "v") }, &block);
  block[27] = 3;
  vector<Cell> decoded;
  Status s = DecodeCellBlock(Slice(block), &decoded);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unknown cell type");
}

TEST(CellBlockTest, TestInconsistentLengths) {
  string block;
  EncodeCellBlock({ Cell("r1", "f", "q", 5, "v") }, &block);
  // Claim a longer value than the cell holds.
  block[11] = 2;
  vector<Cell> decoded;
  Status s = DecodeCellBlock(Slice(block), &decoded);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "inconsistent cell lengths");
}

TEST(CellBlockTest, TestCodecCheck) {
  ASSERT_OK(CheckCellBlockCodec("", ""));
  ASSERT_OK(CheckCellBlockCodec(kKeyValueCodecClass, ""));
  Status s = CheckCellBlockCodec(kKeyValueCodecClass, "GzipCodec");
  ASSERT_TRUE(s.IsNotSupported()) << s.ToString();
  s = CheckCellBlockCodec("MessageCodec", "");
  ASSERT_TRUE(s.IsNotSupported()) << s.ToString();
}

} // namespace rpc
} // namespace kvscan
