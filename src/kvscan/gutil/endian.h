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
#ifndef KVSCAN_GUTIL_ENDIAN_H
#define KVSCAN_GUTIL_ENDIAN_H

#include <cstdint>
#include <cstring>

// Utilities to load and store integers in network (big-endian) byte order
// from and to possibly unaligned memory.
class NetworkByteOrder {
 public:
  static uint16_t Load16(const void* p) {
    uint16_t v;
    memcpy(&v, p, sizeof(v));
    return FromHost16(v);
  }
  static void Store16(void* p, uint16_t v) {
    v = FromHost16(v);
    memcpy(p, &v, sizeof(v));
  }
  static uint32_t Load32(const void* p) {
    uint32_t v;
    memcpy(&v, p, sizeof(v));
    return FromHost32(v);
  }
  static void Store32(void* p, uint32_t v) {
    v = FromHost32(v);
    memcpy(p, &v, sizeof(v));
  }
  static uint64_t Load64(const void* p) {
    uint64_t v;
    memcpy(&v, p, sizeof(v));
    return FromHost64(v);
  }
  static void Store64(void* p, uint64_t v) {
    v = FromHost64(v);
    memcpy(p, &v, sizeof(v));
  }

  // The conversions are their own inverse.
  static uint16_t FromHost16(uint16_t x) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap16(x);
#else
    return x;
#endif
  }
  static uint32_t FromHost32(uint32_t x) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap32(x);
#else
    return x;
#endif
  }
  static uint64_t FromHost64(uint64_t x) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap64(x);
#else
    return x;
#endif
  }
};

#endif // KVSCAN_GUTIL_ENDIAN_H
