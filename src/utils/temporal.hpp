// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "utils/exceptions.hpp"

namespace fastpack::utils {

namespace temporal {
struct InvalidArgumentException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidArgumentException)
};

inline constexpr int64_t kMinYear = 1;
inline constexpr int64_t kMaxYear = 9999;
inline constexpr int64_t kMaxUtcOffsetSeconds = 24 * 60 * 60 - 1;
}  // namespace temporal

/// Signed span of time with microsecond resolution.
struct Duration {
  explicit Duration(int64_t microseconds) : microseconds(microseconds) {}

  auto operator<=>(const Duration &) const = default;

  int64_t Days() const;

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Duration &dur) { return os << dur.ToString(); }

  int64_t microseconds;
};

/// Calendar date in the proleptic Gregorian calendar, years 1 to 9999.
struct Date {
  Date(int64_t year, int64_t month, int64_t day);

  auto operator<=>(const Date &) const = default;

  int64_t DaysSinceEpoch() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Date &date) { return os << date.ToString(); }

  uint16_t year;
  uint8_t month;
  uint8_t day;
};

/// Time of day without a date or a time zone.
struct LocalTime {
  LocalTime(int64_t hour, int64_t minute, int64_t second, int64_t microsecond);

  auto operator<=>(const LocalTime &) const = default;

  int64_t MicrosecondsSinceMidnight() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const LocalTime &time) { return os << time.ToString(); }

  uint8_t hour;
  uint8_t minute;
  uint8_t second;
  uint32_t microsecond;
};

/// A point in time. With a UTC offset, `microseconds` counts from the Unix
/// epoch in UTC; without one (naive), it counts wall clock time as if it were
/// UTC. Aware instants are equal when they denote the same moment, whatever
/// their offsets; a naive and an aware instant are never equal.
struct DateTime {
  explicit DateTime(int64_t microseconds, std::optional<int32_t> utc_offset_seconds = std::nullopt);

  static DateTime FromLocal(const Date &date, const LocalTime &time,
                            std::optional<int32_t> utc_offset_seconds = std::nullopt);

  bool operator==(const DateTime &other) const {
    return utc_offset_seconds.has_value() == other.utc_offset_seconds.has_value() &&
           microseconds == other.microseconds;
  }

  /// Wall clock date and time at the stored offset.
  Date LocalDate() const;
  LocalTime LocalTimeOfDay() const;

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const DateTime &dt) { return os << dt.ToString(); }

  int64_t microseconds;
  std::optional<int32_t> utc_offset_seconds;
};

}  // namespace fastpack::utils
