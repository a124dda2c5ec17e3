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


#include "fastpack/fastpack.hpp"

#include "utils/logging.hpp"
#include "utils/on_scope_exit.hpp"

namespace fastpack {

void Encode(const Value &value, std::vector<uint8_t> *output, const ExtensionRegistry &registry) {
  const auto size_before = output->size();
  utils::OnScopeExit rollback([&] { output->resize(size_before); });
  VectorOutputBuffer buffer(output);
  Encoder<VectorOutputBuffer> encoder(buffer, registry);
  encoder.WriteValue(value);
  rollback.Disable();
}

DecodeResult Decode(std::span<const uint8_t> data, size_t offset, DecoderConfig config,
                    const ExtensionRegistry &registry) {
  MemoryInputBuffer buffer(data);
  buffer.Seek(offset);
  Decoder<MemoryInputBuffer> decoder(buffer, config, registry);
  Value value;
  try {
    if (!decoder.ReadValue(&value)) throw TruncatedInputException(offset, 1, 0);
  } catch (const DecodeException &e) {
    spdlog::trace("Decoding the frame at offset {} failed: {} [{}]", offset, e.what(),
                  logging::HexPreview(offset < data.size() ? data.subspan(offset) : std::span<const uint8_t>{}));
    throw;
  }
  return {std::move(value), static_cast<size_t>(buffer.Position() - offset)};
}

std::vector<uint8_t> Pack(const Value &value, const ExtensionRegistry &registry) {
  std::vector<uint8_t> output;
  Encode(value, &output, registry);
  return output;
}

Value Unpack(std::span<const uint8_t> data, DecoderConfig config, const ExtensionRegistry &registry) {
  auto [value, consumed] = Decode(data, 0, config, registry);
  if (consumed != data.size() && !config.allow_trailing_data) {
    throw LeftoverDataException(consumed, data.size() - consumed);
  }
  return std::move(value);
}

void Register(std::string qualifier, ObjectEncoder encoder, ObjectDecoder decoder) {
  ExtensionRegistry::Global().Register(std::move(qualifier), std::move(encoder), std::move(decoder));
}

void ClearRegistry() { ExtensionRegistry::Global().Clear(); }

}  // namespace fastpack
