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

#include "fastpack/exceptions.hpp"
#include "utils/exceptions.hpp"

void i_will_throw() { throw fastpack::utils::BasicException("this is not ok"); }

void bar() { i_will_throw(); }

void foo() { bar(); }

void i_will_throw_formatted() { throw fastpack::EncodeException("this is not {}", "ok!"); }

TEST(ExceptionsTest, ThrowBasicAndFormattedExceptions) {
  ASSERT_THROW(foo(), fastpack::utils::BasicException);
  ASSERT_THROW(i_will_throw_formatted(), fastpack::FastpackException);
  try {
    i_will_throw_formatted();
  } catch (const fastpack::utils::BasicException &e) {
    EXPECT_STREQ(e.what(), "this is not ok!");
    EXPECT_EQ(e.name(), "EncodeException");
  }
}

TEST(ExceptionsTest, DecodeExceptionsCarryTheOffset) {
  const fastpack::TruncatedInputException truncated(12, 4, 1);
  EXPECT_EQ(truncated.offset(), 12U);
  EXPECT_EQ(truncated.name(), "TruncatedInputException");
  EXPECT_NE(std::string(truncated.what()).find("(at offset 12)"), std::string::npos) << truncated.what();

  const fastpack::UnknownExtensionException unknown(3, 64, "billing.Money");
  EXPECT_EQ(unknown.qualifier(), "billing.Money");
  EXPECT_NE(std::string(unknown.what()).find("billing.Money"), std::string::npos) << unknown.what();

  const fastpack::UnknownMarkerException marker(0, 0xC1);
  EXPECT_NE(std::string(marker.what()).find("0xC1"), std::string::npos) << marker.what();
}
