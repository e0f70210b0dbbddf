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
// Slice is a simple structure containing a pointer into some external
// storage and a size.  The user of a Slice must ensure that the slice
// is not used after the corresponding external storage has been
// deallocated.
#ifndef KVSCAN_UTIL_SLICE_H
#define KVSCAN_UTIL_SLICE_H

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include <glog/logging.h>

namespace kvscan {

class Slice {
 public:
  // Create an empty slice.
  Slice() : data_(reinterpret_cast<const uint8_t*>("")), size_(0) {}

  // Create a slice that refers to d[0,n-1].
  Slice(const uint8_t* d, size_t n) : data_(d), size_(n) {}
  Slice(const char* d, size_t n)
      : data_(reinterpret_cast<const uint8_t*>(d)), size_(n) {}

  // Create a slice that refers to the contents of "s"
  Slice(const std::string& s) // NOLINT(runtime/explicit)
      : data_(reinterpret_cast<const uint8_t*>(s.data())), size_(s.size()) {}

  // Create a slice that refers to s[0,strlen(s)-1]
  Slice(const char* s) // NOLINT(runtime/explicit)
      : data_(reinterpret_cast<const uint8_t*>(s)), size_(strlen(s)) {}

  const uint8_t* data() const { return data_; }

  size_t size() const { return size_; }

  bool empty() const { return size_ == 0; }

  // REQUIRES: n < size()
  const uint8_t& operator[](size_t n) const {
    DCHECK_LT(n, size());
    return data_[n];
  }

  void clear() {
    data_ = reinterpret_cast<const uint8_t*>("");
    size_ = 0;
  }

  // Drop the first "n" bytes from this slice.
  void remove_prefix(size_t n) {
    DCHECK_LE(n, size());
    data_ += n;
    size_ -= n;
  }

  std::string ToString() const {
    return std::string(reinterpret_cast<const char*>(data_), size_);
  }

  // Like ToString(), but non-printable bytes are hex-escaped.
  std::string ToDebugString(size_t max_len = 0) const {
    size_t bytes_to_print = size_;
    bool abbreviated = false;
    if (max_len != 0 && bytes_to_print > max_len) {
      bytes_to_print = max_len;
      abbreviated = true;
    }
    std::string ret;
    ret.reserve(bytes_to_print);
    for (size_t i = 0; i < bytes_to_print; i++) {
      if (!isgraph(data_[i])) {
        char buf[5];
        snprintf(buf, sizeof(buf), "\\x%02x", data_[i] & 0xff);
        ret.append(buf);
      } else {
        ret.push_back(static_cast<char>(data_[i]));
      }
    }
    if (abbreviated) {
      ret.append("...");
    }
    return ret;
  }

  // Three-way comparison.  Returns value:
  //   <  0 iff "*this" <  "b",
  //   == 0 iff "*this" == "b",
  //   >  0 iff "*this" >  "b"
  int compare(const Slice& b) const;

  // Return true iff "x" is a prefix of "*this"
  bool starts_with(const Slice& x) const {
    return ((size_ >= x.size_) &&
            (memcmp(data_, x.data_, x.size_) == 0));
  }

 private:
  const uint8_t* data_;
  size_t size_;

  // Intentionally copyable
};

inline bool operator==(const Slice& x, const Slice& y) {
  return ((x.size() == y.size()) &&
          (memcmp(x.data(), y.data(), x.size()) == 0));
}

inline bool operator!=(const Slice& x, const Slice& y) {
  return !(x == y);
}

inline int Slice::compare(const Slice& b) const {
  const size_t min_len = (size_ < b.size_) ? size_ : b.size_;
  int r = memcmp(data_, b.data_, min_len);
  if (r == 0) {
    if (size_ < b.size_) r = -1;
    else if (size_ > b.size_) r = +1;
  }
  return r;
}

} // namespace kvscan

#endif // KVSCAN_UTIL_SLICE_H
