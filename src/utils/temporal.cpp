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


#include "utils/temporal.hpp"

#include <cstdlib>

#include <fmt/format.h>

namespace fastpack::utils {

namespace {

namespace chrono = std::chrono;

constexpr int64_t kMicrosPerSecond = 1'000'000;
constexpr int64_t kMicrosPerDay = 86'400 * kMicrosPerSecond;
constexpr int64_t kMinLocalMicros =
    chrono::sys_days(chrono::year{1} / 1 / 1).time_since_epoch().count() * kMicrosPerDay;
constexpr int64_t kMaxLocalMicros =
    (chrono::sys_days(chrono::year{9999} / 12 / 31).time_since_epoch().count() + 1) * kMicrosPerDay - 1;

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

constexpr bool IsValidDay(const int64_t day, const int64_t month, const int64_t year) {
  return chrono::year_month_day(chrono::year{static_cast<int>(year)}, chrono::month{static_cast<unsigned>(month)},
                                chrono::day{static_cast<unsigned>(day)})
      .ok();
}

int64_t FloorDiv(int64_t value, int64_t divisor) {
  auto quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --quotient;
  return quotient;
}

std::string FormatOffset(int32_t offset_seconds) {
  const char sign = offset_seconds < 0 ? '-' : '+';
  const auto abs_offset = std::abs(offset_seconds);
  const auto hours = abs_offset / 3600;
  const auto minutes = (abs_offset % 3600) / 60;
  const auto seconds = abs_offset % 60;
  if (seconds != 0) return fmt::format("{}{:0>2}:{:0>2}:{:0>2}", sign, hours, minutes, seconds);
  return fmt::format("{}{:0>2}:{:0>2}", sign, hours, minutes);
}

}  // namespace

int64_t Duration::Days() const { return microseconds / kMicrosPerDay; }

std::string Duration::ToString() const {
  // Format P[n]DT[n]H[n]M[n].[us]S with the sign carried by every component.
  auto micros = chrono::microseconds(microseconds);
  const auto days = chrono::duration_cast<chrono::days>(micros);
  micros -= days;
  const auto hours = chrono::duration_cast<chrono::hours>(micros);
  micros -= hours;
  const auto minutes = chrono::duration_cast<chrono::minutes>(micros);
  micros -= minutes;
  const auto seconds = chrono::duration_cast<chrono::seconds>(micros);
  micros -= seconds;

  auto first_half = fmt::format("P{}DT{}H{}M", days.count(), hours.count(), minutes.count());
  auto second_half = fmt::format("{}.{:0>6}S", seconds.count(), std::abs(micros.count()));
  if (seconds.count() == 0 && micros.count() < 0) {
    return first_half + '-' + second_half;
  }
  return first_half + second_half;
}

Date::Date(const int64_t year, const int64_t month, const int64_t day) {
  if (!IsInBounds(temporal::kMinYear, temporal::kMaxYear, year)) {
    throw temporal::InvalidArgumentException("Invalid year {}. The value should be an integer between {} and {}.", year,
                                             temporal::kMinYear, temporal::kMaxYear);
  }

  if (!IsInBounds(1, 12, month)) {
    throw temporal::InvalidArgumentException(
        "Invalid month {}. The value should be an integer between 1 and 12.", month);
  }

  if (!IsInBounds(1, 31, day) || !IsValidDay(day, month, year)) {
    throw temporal::InvalidArgumentException("Invalid day {} for {:0>4}-{:0>2}.", day, year, month);
  }

  this->year = static_cast<uint16_t>(year);
  this->month = static_cast<uint8_t>(month);
  this->day = static_cast<uint8_t>(day);
}

int64_t Date::DaysSinceEpoch() const {
  const auto ymd = chrono::year_month_day(chrono::year{year}, chrono::month{month}, chrono::day{day});
  return chrono::sys_days(ymd).time_since_epoch().count();
}

std::string Date::ToString() const {
  return fmt::format("{:0>4}-{:0>2}-{:0>2}", year, static_cast<int>(month), static_cast<int>(day));
}

LocalTime::LocalTime(const int64_t hour, const int64_t minute, const int64_t second, const int64_t microsecond) {
  if (!IsInBounds(0, 23, hour)) {
    throw temporal::InvalidArgumentException("Invalid hour {}. The value should be an integer between 0 and 23.",
                                             hour);
  }
  if (!IsInBounds(0, 59, minute)) {
    throw temporal::InvalidArgumentException("Invalid minute {}. The value should be an integer between 0 and 59.",
                                             minute);
  }
  if (!IsInBounds(0, 59, second)) {
    throw temporal::InvalidArgumentException("Invalid second {}. The value should be an integer between 0 and 59.",
                                             second);
  }
  if (!IsInBounds(0, 999'999, microsecond)) {
    throw temporal::InvalidArgumentException(
        "Invalid microsecond {}. The value should be an integer between 0 and 999999.", microsecond);
  }

  this->hour = static_cast<uint8_t>(hour);
  this->minute = static_cast<uint8_t>(minute);
  this->second = static_cast<uint8_t>(second);
  this->microsecond = static_cast<uint32_t>(microsecond);
}

int64_t LocalTime::MicrosecondsSinceMidnight() const {
  return ((static_cast<int64_t>(hour) * 60 + minute) * 60 + second) * kMicrosPerSecond + microsecond;
}

std::string LocalTime::ToString() const {
  if (microsecond == 0) {
    return fmt::format("{:0>2}:{:0>2}:{:0>2}", static_cast<int>(hour), static_cast<int>(minute),
                       static_cast<int>(second));
  }
  return fmt::format("{:0>2}:{:0>2}:{:0>2}.{:0>6}", static_cast<int>(hour), static_cast<int>(minute),
                     static_cast<int>(second), microsecond);
}

DateTime::DateTime(const int64_t microseconds, const std::optional<int32_t> utc_offset_seconds)
    : microseconds(microseconds), utc_offset_seconds(utc_offset_seconds) {
  if (utc_offset_seconds && !IsInBounds(-temporal::kMaxUtcOffsetSeconds, temporal::kMaxUtcOffsetSeconds,
                                        static_cast<int64_t>(*utc_offset_seconds))) {
    throw temporal::InvalidArgumentException("Invalid UTC offset of {} seconds. The offset must be within a day.",
                                             *utc_offset_seconds);
  }
  const auto offset_micros = static_cast<int64_t>(utc_offset_seconds.value_or(0)) * kMicrosPerSecond;
  if (microseconds < kMinLocalMicros - offset_micros || microseconds > kMaxLocalMicros - offset_micros) {
    throw temporal::InvalidArgumentException("DateTime of {} microseconds since epoch is outside years {} to {}.",
                                             microseconds, temporal::kMinYear, temporal::kMaxYear);
  }
}

DateTime DateTime::FromLocal(const Date &date, const LocalTime &time, const std::optional<int32_t> utc_offset_seconds) {
  const auto local_micros = date.DaysSinceEpoch() * kMicrosPerDay + time.MicrosecondsSinceMidnight();
  return DateTime(local_micros - static_cast<int64_t>(utc_offset_seconds.value_or(0)) * kMicrosPerSecond,
                  utc_offset_seconds);
}

Date DateTime::LocalDate() const {
  const auto local_micros = microseconds + static_cast<int64_t>(utc_offset_seconds.value_or(0)) * kMicrosPerSecond;
  const auto ymd = chrono::year_month_day(chrono::sys_days(chrono::days(FloorDiv(local_micros, kMicrosPerDay))));
  return {static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day())};
}

LocalTime DateTime::LocalTimeOfDay() const {
  const auto local_micros = microseconds + static_cast<int64_t>(utc_offset_seconds.value_or(0)) * kMicrosPerSecond;
  auto of_day = local_micros - FloorDiv(local_micros, kMicrosPerDay) * kMicrosPerDay;
  const auto micro = of_day % kMicrosPerSecond;
  of_day /= kMicrosPerSecond;
  return {of_day / 3600, (of_day / 60) % 60, of_day % 60, micro};
}

std::string DateTime::ToString() const {
  auto result = LocalDate().ToString() + 'T' + LocalTimeOfDay().ToString();
  if (utc_offset_seconds) result += FormatOffset(*utc_offset_seconds);
  return result;
}

}  // namespace fastpack::utils
