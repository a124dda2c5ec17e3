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

/// @file
/// Whole-buffer entry points of the codec. Including this header also brings
/// in the value model, the registry and the streaming layer.

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "fastpack/config.hpp"
#include "fastpack/exceptions.hpp"
#include "fastpack/extension.hpp"
#include "fastpack/stream.hpp"
#include "fastpack/value.hpp"
#include "fastpack/version.hpp"

namespace fastpack {

struct DecodeResult {
  Value value;
  /// Bytes taken by the frame, starting at the offset passed to `Decode`.
  size_t consumed;
};

/// Appends the frame of `value` to `output`. On failure `output` is left as
/// it was.
/// @throw EncodeException
void Encode(const Value &value, std::vector<uint8_t> *output,
            const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Decodes the single frame starting at `offset`.
/// @throw DecodeException, TruncatedInputException if no frame starts there
DecodeResult Decode(std::span<const uint8_t> data, size_t offset = 0, DecoderConfig config = {},
                    const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// @throw EncodeException
std::vector<uint8_t> Pack(const Value &value, const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Decodes a buffer holding exactly one object.
/// @throw DecodeException, LeftoverDataException if bytes follow the object
///        and `config.allow_trailing_data` is not set
Value Unpack(std::span<const uint8_t> data, DecoderConfig config = {},
             const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Registers a user type in the global registry.
void Register(std::string qualifier, ObjectEncoder encoder, ObjectDecoder decoder);

/// Removes every user type from the global registry.
void ClearRegistry();

}  // namespace fastpack
