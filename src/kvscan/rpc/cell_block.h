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
//
// Encoding of cell blocks: the compact trailer which carries the cells of a
// scan response outside of the protobuf body.
//
// Each cell is laid out as:
//
//   uint32  length of the remaining bytes of the cell
//   uint32  key length
//   uint32  value length
//   uint16  row length
//   bytes   row
//   uint8   family length
//   bytes   family
//   bytes   qualifier (the remainder of the key)
//   uint64  timestamp
//   uint8   cell type
//   bytes   value
//
// All integers are big-endian.
#ifndef KVSCAN_RPC_CELL_BLOCK_H
#define KVSCAN_RPC_CELL_BLOCK_H

#include <string>
#include <vector>

#include "kvscan/common/cell.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/slice.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace rpc {

// Verifies that the codec and compressor negotiated for a connection can be
// handled. Only the key-value codec without compression is supported; an
// empty codec means cells travel inside the protobuf bodies.
Status CheckCellBlockCodec(const std::string& codec_class,
                           const std::string& compressor_class) WARN_UNUSED_RESULT;

// Appends the encoding of 'cells' to 'dst'.
void EncodeCellBlock(const std::vector<Cell>& cells, std::string* dst);

// Decodes every cell of 'block' and appends them to 'cells'.
// Returns Corruption if the block is truncated or malformed, in which case
// 'cells' is left unmodified.
Status DecodeCellBlock(const Slice& block, std::vector<Cell>* cells) WARN_UNUSED_RESULT;

} // namespace rpc
} // namespace kvscan

#endif // KVSCAN_RPC_CELL_BLOCK_H
