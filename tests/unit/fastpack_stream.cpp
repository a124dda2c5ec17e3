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


#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fastpack/fastpack.hpp"
#include "fastpack_common.hpp"

using fastpack::Array;
using fastpack::Map;
using fastpack::Value;

namespace {

std::vector<Value> SampleValues() {
  return {
      Value(1),
      Value("two"),
      Value(Map{{Value("name"), Value("Ana")}, {Value("scores"), Value(Array{Value(9), Value(7.5)})}}),
      Value(),
      Value(fastpack::utils::Date(2024, 5, 1)),
      Value::MakeTuple({Value(true), Value(fastpack::Binary{0x00, 0xFF})}),
  };
}

std::string ToString(const std::vector<uint8_t> &bytes) { return {bytes.begin(), bytes.end()}; }

}  // namespace

TEST(FastpackStream, FramesAreSelfDelimiting) {
  const auto values = SampleValues();
  std::vector<uint8_t> expected;
  for (const auto &value : values) {
    const auto frame = fastpack::Pack(value);
    expected.insert(expected.end(), frame.begin(), frame.end());
  }
  EXPECT_EQ(fastpack::PackMany(values), expected);
  EXPECT_EQ(fastpack::UnpackMany(expected), values);
}

TEST(FastpackStream, PackStreamToSink) {
  const auto values = SampleValues();
  std::vector<std::vector<uint8_t>> frames;
  const auto count = fastpack::PackStream(values, [&frames](const uint8_t *data, size_t size) {
    frames.emplace_back(data, data + size);
  });
  EXPECT_EQ(count, values.size());
  ASSERT_EQ(frames.size(), values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    EXPECT_EQ(frames[i], fastpack::Pack(values[i])) << i;
  }
}

TEST(FastpackStream, StreamEquivalence) {
  const auto values = SampleValues();
  std::ostringstream output;
  EXPECT_EQ(fastpack::PackStream(values, output), values.size());
  EXPECT_EQ(output.str(), ToString(fastpack::PackMany(values)));

  std::istringstream input(output.str());
  std::vector<Value> decoded;
  for (const auto &value : fastpack::UnpackStream(input)) decoded.push_back(value);
  EXPECT_EQ(decoded, values);
}

TEST(FastpackStream, IterUnpackRange) {
  const auto values = SampleValues();
  const auto data = fastpack::PackMany(values);
  size_t index = 0;
  for (const auto &value : fastpack::IterUnpack(data)) {
    ASSERT_LT(index, values.size());
    EXPECT_EQ(value, values[index]) << index;
    ++index;
  }
  EXPECT_EQ(index, values.size());
}

TEST(FastpackStream, EmptyInput) {
  const std::vector<uint8_t> data;
  auto unpacker = fastpack::IterUnpack(data);
  EXPECT_FALSE(unpacker.Next());
  EXPECT_TRUE(unpacker.Finished());
  EXPECT_TRUE(fastpack::UnpackMany(data).empty());

  std::istringstream input;
  EXPECT_FALSE(fastpack::UnpackStream(input).Next());
}

TEST(FastpackStream, TruncatedTrailingFrame) {
  auto data = fastpack::PackMany(std::vector<Value>{Value(1), Value("abc")});
  data.push_back(0xA5);
  data.push_back('x');

  auto unpacker = fastpack::IterUnpack(data);
  EXPECT_EQ(unpacker.Next(), Value(1));
  EXPECT_EQ(unpacker.Next(), Value("abc"));
  try {
    unpacker.Next();
    FAIL() << "Expected a TruncatedInputException";
  } catch (const fastpack::TruncatedInputException &e) {
    EXPECT_EQ(e.offset(), 5U);
  }
  EXPECT_TRUE(unpacker.Finished());
  EXPECT_FALSE(unpacker.Next());
  EXPECT_EQ(unpacker.Count(), 2U);

  EXPECT_THROW(fastpack::UnpackMany(data), fastpack::TruncatedInputException);
}

TEST(FastpackStream, MalformedFrameFinishesTheSequence) {
  std::vector<uint8_t> data{0x01, 0xC1, 0x02};
  auto unpacker = fastpack::IterUnpack(data);
  EXPECT_EQ(unpacker.Next(), Value(1));
  EXPECT_THROW(unpacker.Next(), fastpack::UnknownMarkerException);
  EXPECT_FALSE(unpacker.Next());
}

TEST(FastpackStream, Reset) {
  const auto data = fastpack::PackMany(std::vector<Value>{Value(1), Value(2)});
  auto unpacker = fastpack::IterUnpack(data);
  EXPECT_EQ(unpacker.Next(), Value(1));
  EXPECT_EQ(unpacker.Next(), Value(2));
  EXPECT_FALSE(unpacker.Next());
  EXPECT_EQ(unpacker.Position(), data.size());

  unpacker.Reset();
  EXPECT_FALSE(unpacker.Finished());
  EXPECT_EQ(unpacker.Position(), 0U);
  EXPECT_EQ(unpacker.Next(), Value(1));
  EXPECT_EQ(unpacker.Count(), 1U);
}

TEST(FastpackStream, NoReadAhead) {
  const auto first = fastpack::Pack(Value(Map{{Value("k"), Value(Array{Value(1), Value("long enough string")})}}));
  auto data = first;
  const auto second = fastpack::Pack(Value(42));
  data.insert(data.end(), second.begin(), second.end());

  for (const size_t chunk_size : {1, 3, 1024}) {
    ChunkedSource source(data, chunk_size);
    auto unpacker = fastpack::UnpackStream(source.Function());
    ASSERT_TRUE(unpacker.Next());
    EXPECT_EQ(source.consumed(), first.size()) << chunk_size;
    EXPECT_EQ(unpacker.Next(), Value(42));
    EXPECT_EQ(source.consumed(), data.size()) << chunk_size;
    EXPECT_FALSE(unpacker.Next());
  }
}

TEST(FastpackStream, PackStreamStopsAtTheFailingValue) {
  const std::vector<Value> values{Value(1), Value("bad \xFF"), Value(3)};
  std::vector<uint8_t> written;
  EXPECT_THROW(fastpack::PackStream(values,
                                    [&written](const uint8_t *data, size_t size) {
                                      written.insert(written.end(), data, data + size);
                                    }),
               fastpack::EncodeException);
  EXPECT_EQ(written, fastpack::Pack(Value(1)));
}

TEST(FastpackStream, PackToAndUnpackFrom) {
  const auto values = SampleValues();
  std::stringstream stream;
  for (const auto &value : values) fastpack::PackTo(value, stream);
  for (const auto &value : values) EXPECT_EQ(fastpack::UnpackFrom(stream), value);
  EXPECT_THROW(fastpack::UnpackFrom(stream), fastpack::TruncatedInputException);
}

TEST(FastpackStream, UnpackFromReadsOneFrame) {
  auto data = fastpack::Pack(Value("first"));
  const auto frame_size = data.size();
  data.push_back(0x07);
  ChunkedSource source(data, 2);
  EXPECT_EQ(fastpack::UnpackFrom(source.Function()), Value("first"));
  EXPECT_EQ(source.consumed(), frame_size);
}

TEST(FastpackStream, SinkFailure) {
  std::ostringstream output;
  output.setstate(std::ios_base::badbit);
  EXPECT_THROW(fastpack::PackTo(Value(1), output), fastpack::StreamException);
}
