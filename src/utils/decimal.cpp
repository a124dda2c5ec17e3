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


#include "utils/decimal.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

#include <fmt/format.h>

namespace fastpack::utils {

namespace {

constexpr int64_t kMaxExponent = std::numeric_limits<int32_t>::max();

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
         });
}

bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && EqualsIgnoreCase(text.substr(0, prefix.size()), prefix);
}

std::string_view Trim(std::string_view text) {
  const auto *ws = " \t\n\r\f\v";
  const auto begin = text.find_first_not_of(ws);
  if (begin == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

std::string StripLeadingZeros(std::string_view digits) {
  const auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) return digits.empty() ? std::string{} : std::string{"0"};
  return std::string{digits.substr(first)};
}

}  // namespace

Decimal Decimal::Parse(std::string_view text) {
  const auto original = text;
  text = Trim(text);
  bool negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  if (EqualsIgnoreCase(text, "inf") || EqualsIgnoreCase(text, "infinity")) {
    return {Kind::INFINITE, negative, "0", 0};
  }

  for (const auto &[prefix, kind] : {std::pair{std::string_view{"snan"}, Kind::SIGNALING_NAN},
                                     std::pair{std::string_view{"nan"}, Kind::QUIET_NAN}}) {
    if (!StartsWithIgnoreCase(text, prefix)) continue;
    const auto payload = text.substr(prefix.size());
    if (!std::all_of(payload.begin(), payload.end(), IsDigit)) {
      throw InvalidDecimalException("Invalid decimal literal '{}'.", original);
    }
    auto digits = StripLeadingZeros(payload);
    if (digits == "0") digits.clear();
    return {kind, negative, std::move(digits), 0};
  }

  std::string coefficient;
  size_t pos = 0;
  size_t integer_digits = 0;
  while (pos < text.size() && IsDigit(text[pos])) {
    coefficient.push_back(text[pos++]);
    ++integer_digits;
  }
  size_t fraction_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && IsDigit(text[pos])) {
      coefficient.push_back(text[pos++]);
      ++fraction_digits;
    }
  }
  if (integer_digits + fraction_digits == 0) {
    throw InvalidDecimalException("Invalid decimal literal '{}'.", original);
  }

  int64_t exponent = 0;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    auto exponent_text = text.substr(pos);
    // from_chars accepts a leading minus only.
    if (!exponent_text.empty() && exponent_text.front() == '+') exponent_text.remove_prefix(1);
    if (exponent_text.empty() || (!IsDigit(exponent_text.front()) && exponent_text.front() != '-')) {
      throw InvalidDecimalException("Invalid decimal literal '{}'.", original);
    }
    const auto *begin = exponent_text.data();
    const auto *end = begin + exponent_text.size();
    if (const auto [ptr, ec] = std::from_chars(begin, end, exponent);
        ec != std::errc() || ptr != end || exponent > kMaxExponent || exponent < -kMaxExponent) {
      throw InvalidDecimalException("Invalid decimal exponent in '{}'.", original);
    }
    pos = text.size();
  }
  if (pos != text.size()) {
    throw InvalidDecimalException("Invalid decimal literal '{}'.", original);
  }

  return {Kind::FINITE, negative, StripLeadingZeros(coefficient), exponent - static_cast<int64_t>(fraction_digits)};
}

std::string Decimal::ToString() const {
  std::string sign = negative_ ? "-" : "";
  switch (kind_) {
    case Kind::INFINITE:
      return sign + "Infinity";
    case Kind::QUIET_NAN:
      return sign + "NaN" + digits_;
    case Kind::SIGNALING_NAN:
      return sign + "sNaN" + digits_;
    case Kind::FINITE:
      break;
  }

  const auto length = static_cast<int64_t>(digits_.size());
  const auto leftdigits = exponent_ + length;
  // Plain notation for exponent <= 0 unless there would be more than five
  // leading zeros after the point; scientific with one integer digit otherwise.
  const int64_t dotplace = (exponent_ <= 0 && leftdigits > -6) ? leftdigits : 1;

  std::string intpart;
  std::string fracpart;
  if (dotplace <= 0) {
    intpart = "0";
    fracpart = "." + std::string(static_cast<size_t>(-dotplace), '0') + digits_;
  } else if (dotplace >= length) {
    intpart = digits_ + std::string(static_cast<size_t>(dotplace - length), '0');
  } else {
    intpart = digits_.substr(0, static_cast<size_t>(dotplace));
    fracpart = "." + digits_.substr(static_cast<size_t>(dotplace));
  }

  std::string exp;
  if (leftdigits != dotplace) {
    exp = fmt::format("E{:+}", leftdigits - dotplace);
  }
  return sign + intpart + fracpart + exp;
}

bool operator==(const Decimal &lhs, const Decimal &rhs) {
  if (lhs.IsNaN() || rhs.IsNaN()) return false;
  if (lhs.kind_ != rhs.kind_) return false;
  if (lhs.kind_ == Decimal::Kind::INFINITE) return lhs.negative_ == rhs.negative_;
  if (lhs.IsZero() || rhs.IsZero()) return lhs.IsZero() && rhs.IsZero();
  if (lhs.negative_ != rhs.negative_) return false;

  // Same value iff the significant digits match at the same magnitude.
  const auto strip = [](const Decimal &d) {
    const auto last = d.digits_.find_last_not_of('0');
    const auto trailing = static_cast<int64_t>(d.digits_.size() - last - 1);
    return std::pair{std::string_view{d.digits_}.substr(0, last + 1), d.exponent_ + trailing};
  };
  return strip(lhs) == strip(rhs);
}

}  // namespace fastpack::utils
