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


#include "fastpack/stream.hpp"

namespace fastpack {

void PackTo(const Value &value, const WriteFunction &sink, const ExtensionRegistry &registry) {
  std::vector<uint8_t> frame;
  VectorOutputBuffer buffer(&frame);
  Encoder<VectorOutputBuffer> encoder(buffer, registry);
  encoder.WriteValue(value);
  sink(frame.data(), frame.size());
}

void PackTo(const Value &value, std::ostream &stream, const ExtensionRegistry &registry) {
  PackTo(value, StreamWriter(stream), registry);
}

Value UnpackFrom(const ReadFunction &source, DecoderConfig config, const ExtensionRegistry &registry) {
  SourceInputBuffer buffer(source);
  Decoder<SourceInputBuffer> decoder(buffer, config, registry);
  Value value;
  if (!decoder.ReadValue(&value)) throw TruncatedInputException(0, 1, 0);
  return value;
}

Value UnpackFrom(std::istream &stream, DecoderConfig config, const ExtensionRegistry &registry) {
  return UnpackFrom(StreamReader(stream), config, registry);
}

Unpacker<SourceInputBuffer> UnpackStream(ReadFunction source, DecoderConfig config,
                                         const ExtensionRegistry &registry) {
  return Unpacker<SourceInputBuffer>(SourceInputBuffer(std::move(source)), config, registry);
}

Unpacker<SourceInputBuffer> UnpackStream(std::istream &stream, DecoderConfig config,
                                         const ExtensionRegistry &registry) {
  return UnpackStream(StreamReader(stream), config, registry);
}

Unpacker<MemoryInputBuffer> IterUnpack(std::span<const uint8_t> data, DecoderConfig config,
                                       const ExtensionRegistry &registry) {
  return Unpacker<MemoryInputBuffer>(MemoryInputBuffer(data), config, registry);
}

std::vector<Value> UnpackMany(std::span<const uint8_t> data, DecoderConfig config,
                              const ExtensionRegistry &registry) {
  std::vector<Value> values;
  auto unpacker = IterUnpack(data, config, registry);
  while (auto value = unpacker.Next()) values.push_back(std::move(*value));
  return values;
}

}  // namespace fastpack
