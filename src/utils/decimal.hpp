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

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace fastpack::utils {

class InvalidDecimalException : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidDecimalException)
};

/// Arbitrary precision decimal number kept as sign, coefficient digits and
/// exponent, so that the textual form survives a round trip exactly
/// ("1.50" stays "1.50"). Comparison is numeric: 1.50 == 1.5, and NaN is
/// never equal to anything.
class Decimal {
 public:
  enum class Kind : uint8_t { FINITE, INFINITE, QUIET_NAN, SIGNALING_NAN };

  /// Parses the usual decimal literal syntax: an optional sign followed by
  /// digits with an optional point and exponent, or one of "Infinity",
  /// "Inf", "NaN" and "sNaN" (case insensitive, NaN may carry a payload).
  /// Surrounding whitespace is ignored.
  /// @throw InvalidDecimalException
  static Decimal Parse(std::string_view text);

  Kind kind() const { return kind_; }
  bool negative() const { return negative_; }
  /// Coefficient digits without leading zeros ("0" for zero). For NaN, the
  /// payload digits, possibly empty.
  const std::string &digits() const { return digits_; }
  int64_t exponent() const { return exponent_; }

  bool IsNaN() const { return kind_ == Kind::QUIET_NAN || kind_ == Kind::SIGNALING_NAN; }
  bool IsZero() const { return kind_ == Kind::FINITE && digits_ == "0"; }

  /// Canonical text, scientific notation when the exponent is positive or the
  /// number is very small.
  std::string ToString() const;

  friend bool operator==(const Decimal &lhs, const Decimal &rhs);

  friend std::ostream &operator<<(std::ostream &os, const Decimal &decimal) { return os << decimal.ToString(); }

 private:
  Decimal(Kind kind, bool negative, std::string digits, int64_t exponent)
      : kind_(kind), negative_(negative), digits_(std::move(digits)), exponent_(exponent) {}

  Kind kind_;
  bool negative_;
  std::string digits_;
  int64_t exponent_;
};

}  // namespace fastpack::utils
