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
#ifndef KVSCAN_UTIL_MONOTIME_H
#define KVSCAN_UTIL_MONOTIME_H

#include <cstdint>
#include <string>

namespace kvscan {

class MonoTime;

// Represent an elapsed duration of time -- i.e the delta between
// two MonoTime instances.
class MonoDelta {
 public:
  static MonoDelta FromSeconds(double seconds);
  static MonoDelta FromMilliseconds(int64_t ms);
  static MonoDelta FromMicroseconds(int64_t us);
  static MonoDelta FromNanoseconds(int64_t ns);

  // An uninitialized MonoDelta.
  MonoDelta();

  bool Initialized() const;
  bool LessThan(const MonoDelta& rhs) const;
  bool MoreThan(const MonoDelta& rhs) const;
  bool Equals(const MonoDelta& rhs) const;

  std::string ToString() const;

  double ToSeconds() const;
  int64_t ToNanoseconds() const;
  int64_t ToMicroseconds() const;
  int64_t ToMilliseconds() const;

  MonoDelta& operator+=(const MonoDelta& delta);
  MonoDelta& operator-=(const MonoDelta& delta);

 private:
  static const int64_t kUninitialized;

  friend class MonoTime;

  explicit MonoDelta(int64_t delta);
  int64_t nano_delta_;
};

// Represent a particular point in time, relative to some fixed but unspecified
// reference point.
//
// This time is monotonic, meaning that if the user changes his or her system
// clock, the monotime does not change.
class MonoTime {
 public:
  static const int64_t kNanosecondsPerSecond = 1000000000L;
  static const int64_t kNanosecondsPerMillisecond = 1000000L;
  static const int64_t kNanosecondsPerMicrosecond = 1000L;

  static const int64_t kMicrosecondsPerSecond = 1000000L;

  // Get current time in MonoTime representation.
  static MonoTime Now();

  // Get MonoTime instance representing maximum possible time.
  static MonoTime Max();

  // Get MonoTime instance representing minimum possible time.
  static MonoTime Min();

  // Select the earliest between the specified time points.
  static const MonoTime& Earliest(const MonoTime& a, const MonoTime& b);

  // An uninitialized MonoTime.
  MonoTime();

  bool Initialized() const;

  MonoDelta GetDeltaSince(const MonoTime& rhs) const;
  void AddDelta(const MonoDelta& delta);
  bool ComesBefore(const MonoTime& rhs) const;

  std::string ToString() const;

  MonoTime& operator+=(const MonoDelta& delta);
  MonoTime& operator-=(const MonoDelta& delta);

 private:
  friend class MonoDelta;

  explicit MonoTime(int64_t nanos);
  double ToSeconds() const;

  int64_t nanos_;
};

// Sleep for an interval specified by a MonoDelta instance.
void SleepFor(const MonoDelta& delta);

bool operator==(const MonoDelta& lhs, const MonoDelta& rhs);
bool operator!=(const MonoDelta& lhs, const MonoDelta& rhs);
bool operator<(const MonoDelta& lhs, const MonoDelta& rhs);
bool operator<=(const MonoDelta& lhs, const MonoDelta& rhs);
bool operator>(const MonoDelta& lhs, const MonoDelta& rhs);
bool operator>=(const MonoDelta& lhs, const MonoDelta& rhs);
MonoDelta operator+(const MonoDelta& lhs, const MonoDelta& rhs);
MonoDelta operator-(const MonoDelta& lhs, const MonoDelta& rhs);

bool operator==(const MonoTime& lhs, const MonoTime& rhs);
bool operator!=(const MonoTime& lhs, const MonoTime& rhs);
bool operator<(const MonoTime& lhs, const MonoTime& rhs);
bool operator<=(const MonoTime& lhs, const MonoTime& rhs);
bool operator>(const MonoTime& lhs, const MonoTime& rhs);
bool operator>=(const MonoTime& lhs, const MonoTime& rhs);
MonoTime operator+(const MonoTime& t, const MonoDelta& delta);
MonoTime operator-(const MonoTime& t, const MonoDelta& delta);
MonoDelta operator-(const MonoTime& t_end, const MonoTime& t_begin);

} // namespace kvscan

#endif // KVSCAN_UTIL_MONOTIME_H
