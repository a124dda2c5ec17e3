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


#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fastpack/fastpack.hpp"
#include "fastpack_common.hpp"

using fastpack::Array;
using fastpack::Map;
using fastpack::Value;

TEST(FastpackApi, RoundTripPrimitives) {
  const Value values[] = {
      Value(),
      Value(true),
      Value(false),
      Value(0),
      Value(-1),
      Value(std::numeric_limits<int64_t>::min()),
      Value(std::numeric_limits<int64_t>::max()),
      Value(std::numeric_limits<uint64_t>::max()),
      Value(3.25),
      Value(-0.0),
      Value(std::numeric_limits<double>::infinity()),
      Value(""),
      Value("\xC5\xA1\xC4\x8D\xE2\x82\xAC"),
      Value(std::string(70000, 'z')),
      Value(fastpack::Binary{}),
      Value(fastpack::Binary(300, 0x42)),
      Value(Array{}),
      Value(Map{}),
  };
  for (const auto &value : values) {
    EXPECT_EQ(fastpack::Unpack(fastpack::Pack(value)), value) << value;
  }
}

TEST(FastpackApi, NaNRoundTrip) {
  const auto decoded = fastpack::Unpack(fastpack::Pack(Value(std::numeric_limits<double>::quiet_NaN())));
  ASSERT_TRUE(decoded.IsDouble());
  EXPECT_TRUE(std::isnan(decoded.ValueDouble()));
}

TEST(FastpackApi, IntegerKinds) {
  const auto small = fastpack::Unpack(fastpack::Pack(Value(uint64_t{7})));
  EXPECT_TRUE(small.IsInt());
  EXPECT_EQ(small, Value(uint64_t{7}));

  const auto large = fastpack::Unpack(fastpack::Pack(Value(std::numeric_limits<uint64_t>::max())));
  EXPECT_TRUE(large.IsUInt());
}

TEST(FastpackApi, DeepStructure) {
  Value value(Array{Value(1)});
  for (int i = 0; i < 100; ++i) {
    value = Value(Map{{Value(fmt::format("level{}", i)), value}, {Value("index"), Value(i)}});
  }
  EXPECT_EQ(fastpack::Unpack(fastpack::Pack(value)), value);
}

TEST(FastpackApi, Compactness) {
  const Value record(Map{{Value("name"), Value("Ana")}, {Value("age"), Value(30)}, {Value("active"), Value(true)}});
  const auto data = fastpack::Pack(record);
  const std::string json = R"({"name":"Ana","age":30,"active":true})";
  EXPECT_EQ(data.size(), 23U);
  EXPECT_LE(data.size() * 10, json.size() * 7);
}

TEST(FastpackApi, LeftoverData) {
  auto data = fastpack::Pack(Value(1));
  data.push_back(0xC0);
  try {
    fastpack::Unpack(data);
    FAIL() << "Expected a LeftoverDataException";
  } catch (const fastpack::LeftoverDataException &e) {
    EXPECT_EQ(e.offset(), 1U);
  }
  EXPECT_EQ(fastpack::Unpack(data, {.allow_trailing_data = true}), Value(1));
}

TEST(FastpackApi, EmptyBuffer) {
  EXPECT_THROW(fastpack::Unpack(std::vector<uint8_t>{}), fastpack::TruncatedInputException);
}

TEST(FastpackApi, DecodeAtOffsets) {
  const auto data = fastpack::PackMany(std::vector<Value>{Value("a"), Value(1000), Value()});
  size_t offset = 0;
  std::vector<Value> decoded;
  while (offset < data.size()) {
    auto [value, consumed] = fastpack::Decode(data, offset);
    decoded.push_back(std::move(value));
    offset += consumed;
  }
  EXPECT_EQ(decoded, (std::vector<Value>{Value("a"), Value(1000), Value()}));
  EXPECT_THROW(fastpack::Decode(data, data.size()), fastpack::TruncatedInputException);
  EXPECT_THROW(fastpack::Decode(data, data.size() + 10), fastpack::TruncatedInputException);
}

TEST(FastpackApi, DecodeErrorOffsetsAreAbsolute) {
  std::vector<uint8_t> data{0x01, 0x91, 0xC1};
  try {
    fastpack::Decode(data, 1);
    FAIL() << "Expected an UnknownMarkerException";
  } catch (const fastpack::UnknownMarkerException &e) {
    EXPECT_EQ(e.offset(), 2U);
  }
}

TEST(FastpackApi, EncodeAppends) {
  std::vector<uint8_t> output{0xAA};
  fastpack::Encode(Value(1), &output);
  fastpack::Encode(Value("b"), &output);
  EXPECT_EQ(output, Bytes({0xAA, 0x01, 0xA1, 'b'}));
}

TEST(FastpackApi, EncodeFailureLeavesOutputUntouched) {
  std::vector<uint8_t> output{0xAA};
  const Value value(Array{Value(1), Value(2), Value("\xC0\x80")});
  EXPECT_THROW(fastpack::Encode(value, &output), fastpack::EncodeException);
  EXPECT_EQ(output, Bytes({0xAA}));
  EXPECT_THROW(fastpack::Pack(value), fastpack::EncodeException);
}

TEST(FastpackApi, Version) { EXPECT_FALSE(fastpack::kVersion.empty()); }
