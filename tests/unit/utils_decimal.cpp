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


#include <string>

#include <gtest/gtest.h>

#include "utils/decimal.hpp"

using fastpack::utils::Decimal;

TEST(Decimal, ParseFinite) {
  const auto decimal = Decimal::Parse("-12.340");
  EXPECT_EQ(decimal.kind(), Decimal::Kind::FINITE);
  EXPECT_TRUE(decimal.negative());
  EXPECT_EQ(decimal.digits(), "12340");
  EXPECT_EQ(decimal.exponent(), -3);

  const auto scientific = Decimal::Parse("  6.02e+23 ");
  EXPECT_EQ(scientific.digits(), "602");
  EXPECT_EQ(scientific.exponent(), 21);

  const auto zero = Decimal::Parse("000.00");
  EXPECT_TRUE(zero.IsZero());
  EXPECT_EQ(zero.digits(), "0");
  EXPECT_EQ(zero.exponent(), -2);

  EXPECT_EQ(Decimal::Parse(".5").ToString(), "0.5");
  EXPECT_EQ(Decimal::Parse("5.").ToString(), "5");
  EXPECT_EQ(Decimal::Parse("+7").ToString(), "7");
}

TEST(Decimal, ParseSpecial) {
  EXPECT_EQ(Decimal::Parse("inf").kind(), Decimal::Kind::INFINITE);
  EXPECT_EQ(Decimal::Parse("-Infinity").kind(), Decimal::Kind::INFINITE);
  EXPECT_TRUE(Decimal::Parse("-INF").negative());
  EXPECT_EQ(Decimal::Parse("nan").kind(), Decimal::Kind::QUIET_NAN);
  EXPECT_EQ(Decimal::Parse("sNaN").kind(), Decimal::Kind::SIGNALING_NAN);

  const auto payload = Decimal::Parse("NaN0123");
  EXPECT_TRUE(payload.IsNaN());
  EXPECT_EQ(payload.digits(), "123");
  EXPECT_EQ(payload.ToString(), "NaN123");
}

TEST(Decimal, ParseInvalid) {
  for (const auto *text : {"", " ", "abc", "1.2.3", "1e", "1e+", "e5", ".", "-", "1 2", "nan1.5", "infinit", "0x10",
                           "1e99999999999"}) {
    EXPECT_THROW(Decimal::Parse(text), fastpack::utils::InvalidDecimalException) << '"' << text << '"';
  }
}

TEST(Decimal, ToString) {
  const std::pair<const char *, const char *> cases[] = {
      {"0", "0"},
      {"-0", "-0"},
      {"0.00", "0.00"},
      {"1.50", "1.50"},
      {"100", "100"},
      {"1E+2", "1E+2"},
      {"1.23E+5", "1.23E+5"},
      {"0.000001", "0.000001"},
      {"0.0000001", "1E-7"},
      {"12.5E-10", "1.25E-9"},
      {"-3.14159", "-3.14159"},
      {"Infinity", "Infinity"},
      {"-inf", "-Infinity"},
      {"nan", "NaN"},
      {"-snan", "-sNaN"},
  };
  for (const auto &[text, expected] : cases) {
    EXPECT_EQ(Decimal::Parse(text).ToString(), expected) << text;
  }
}

TEST(Decimal, Equality) {
  EXPECT_EQ(Decimal::Parse("1.5"), Decimal::Parse("1.50"));
  EXPECT_EQ(Decimal::Parse("100"), Decimal::Parse("1E+2"));
  EXPECT_EQ(Decimal::Parse("0"), Decimal::Parse("-0.000"));
  EXPECT_EQ(Decimal::Parse("Infinity"), Decimal::Parse("inf"));
  EXPECT_NE(Decimal::Parse("Infinity"), Decimal::Parse("-Infinity"));
  EXPECT_NE(Decimal::Parse("1.5"), Decimal::Parse("-1.5"));
  EXPECT_NE(Decimal::Parse("1.5"), Decimal::Parse("15"));
  EXPECT_NE(Decimal::Parse("NaN"), Decimal::Parse("NaN"));
}
