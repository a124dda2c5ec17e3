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
#include <limits>
#include <string_view>
#include <vector>

#include "fastpack/buffer.hpp"
#include "fastpack/codes.hpp"
#include "fastpack/exceptions.hpp"
#include "fastpack/extension.hpp"
#include "fastpack/value.hpp"
#include "utils/endian.hpp"
#include "utils/utf8.hpp"

namespace fastpack {

/**
 * Appends frames to a buffer. Every integer uses the smallest form that
 * holds it: non-negative numbers take the unsigned family, negative numbers
 * the signed one.
 *
 * The buffer only needs `void Write(const uint8_t *data, size_t n)`. Nothing
 * is written for a value that fails to encode at its top level, but a failure
 * inside a container leaves the frames of the elements before it in the
 * buffer. Callers that need all or nothing encode into a scratch buffer.
 *
 * @tparam TBuffer the output buffer that should be used
 */
template <OutputBuffer TBuffer>
class Encoder {
 public:
  explicit Encoder(TBuffer &buffer, const ExtensionRegistry &registry = ExtensionRegistry::Global())
      : buffer_(buffer), registry_(registry) {}

  void WriteNull() { WriteMarker(Marker::Nil); }

  void WriteBool(bool value) { WriteMarker(value ? Marker::True : Marker::False); }

  void WriteInt(int64_t value) {
    if (value >= 0) {
      WriteUInt(static_cast<uint64_t>(value));
    } else if (value >= kNegativeFixIntMin) {
      WriteRAW(utils::MemcpyCast<uint8_t>(static_cast<int8_t>(value)));
    } else if (value >= std::numeric_limits<int8_t>::min()) {
      WriteMarker(Marker::Int8);
      WriteTypeRAW(static_cast<int8_t>(value));
    } else if (value >= std::numeric_limits<int16_t>::min()) {
      WriteMarker(Marker::Int16);
      WriteTypeRAW(static_cast<int16_t>(value));
    } else if (value >= std::numeric_limits<int32_t>::min()) {
      WriteMarker(Marker::Int32);
      WriteTypeRAW(static_cast<int32_t>(value));
    } else {
      WriteMarker(Marker::Int64);
      WriteTypeRAW(value);
    }
  }

  void WriteUInt(uint64_t value) {
    if (value <= ToByte(Marker::PositiveFixIntMax)) {
      WriteRAW(static_cast<uint8_t>(value));
    } else if (value <= std::numeric_limits<uint8_t>::max()) {
      WriteMarker(Marker::UInt8);
      WriteTypeRAW(static_cast<uint8_t>(value));
    } else if (value <= std::numeric_limits<uint16_t>::max()) {
      WriteMarker(Marker::UInt16);
      WriteTypeRAW(static_cast<uint16_t>(value));
    } else if (value <= std::numeric_limits<uint32_t>::max()) {
      WriteMarker(Marker::UInt32);
      WriteTypeRAW(static_cast<uint32_t>(value));
    } else {
      WriteMarker(Marker::UInt64);
      WriteTypeRAW(value);
    }
  }

  void WriteDouble(double value) {
    WriteMarker(Marker::Float64);
    WriteTypeRAW(utils::MemcpyCast<uint64_t>(value));
  }

  /// @throw EncodeException if `value` is not valid UTF-8.
  void WriteString(std::string_view value) {
    if (const auto invalid = utils::FindInvalidUtf8(value)) {
      throw EncodeException("String is not valid UTF-8 at byte {}.", *invalid);
    }
    const auto size = CheckedSize(value.size(), "string");
    if (size <= kFixStrMaxSize) {
      WriteRAW(static_cast<uint8_t>(ToByte(Marker::FixStr) | size));
    } else if (size <= std::numeric_limits<uint8_t>::max()) {
      WriteMarker(Marker::Str8);
      WriteTypeRAW(static_cast<uint8_t>(size));
    } else {
      WriteSizedMarker(size, Marker::Str16, Marker::Str32);
    }
    WriteRAW(reinterpret_cast<const uint8_t *>(value.data()), value.size());
  }

  void WriteBinary(std::span<const uint8_t> value) {
    const auto size = CheckedSize(value.size(), "binary");
    if (size <= std::numeric_limits<uint8_t>::max()) {
      WriteMarker(Marker::Bin8);
      WriteTypeRAW(static_cast<uint8_t>(size));
    } else {
      WriteSizedMarker(size, Marker::Bin16, Marker::Bin32);
    }
    WriteRAW(value.data(), value.size());
  }

  void WriteArrayHeader(size_t size) {
    const auto checked = CheckedSize(size, "array");
    if (checked <= kFixArrayMaxSize) {
      WriteRAW(static_cast<uint8_t>(ToByte(Marker::FixArray) | checked));
    } else {
      WriteSizedMarker(checked, Marker::Array16, Marker::Array32);
    }
  }

  void WriteMapHeader(size_t size) {
    const auto checked = CheckedSize(size, "map");
    if (checked <= kFixMapMaxSize) {
      WriteRAW(static_cast<uint8_t>(ToByte(Marker::FixMap) | checked));
    } else {
      WriteSizedMarker(checked, Marker::Map16, Marker::Map32);
    }
  }

  /// Extension frame around already encoded payload bytes.
  void WriteExtension(int8_t tag, std::span<const uint8_t> data) {
    const auto size = CheckedSize(data.size(), "extension payload");
    switch (size) {
      case 1:
        WriteMarker(Marker::FixExt1);
        break;
      case 2:
        WriteMarker(Marker::FixExt2);
        break;
      case 4:
        WriteMarker(Marker::FixExt4);
        break;
      case 8:
        WriteMarker(Marker::FixExt8);
        break;
      case 16:
        WriteMarker(Marker::FixExt16);
        break;
      default:
        if (size <= std::numeric_limits<uint8_t>::max()) {
          WriteMarker(Marker::Ext8);
          WriteTypeRAW(static_cast<uint8_t>(size));
        } else {
          WriteSizedMarker(size, Marker::Ext16, Marker::Ext32);
        }
    }
    WriteTypeRAW(tag);
    WriteRAW(data.data(), data.size());
  }

  /// Writes `value` recursively, extension kinds through the registry.
  /// @throw EncodeException
  void WriteValue(const Value &value) {
    switch (value.type()) {
      case Value::Type::Null:
        WriteNull();
        return;
      case Value::Type::Bool:
        WriteBool(value.ValueBool());
        return;
      case Value::Type::Int:
        WriteInt(value.ValueInt());
        return;
      case Value::Type::UInt:
        WriteUInt(value.ValueUInt());
        return;
      case Value::Type::Double:
        WriteDouble(value.ValueDouble());
        return;
      case Value::Type::String:
        WriteString(value.ValueString());
        return;
      case Value::Type::Binary:
        WriteBinary(value.ValueBinary());
        return;
      case Value::Type::Array:
        WriteArrayHeader(value.ValueArray().size());
        for (const auto &element : value.ValueArray()) WriteValue(element);
        return;
      case Value::Type::Map:
        WriteMapHeader(value.ValueMap().size());
        for (const auto &[key, element] : value.ValueMap()) {
          WriteValue(key);
          WriteValue(element);
        }
        return;
      default:
        WriteExtensionValue(value);
        return;
    }
  }

 private:
  void WriteExtensionValue(const Value &value) {
    const auto handler = registry_.ResolveEncoder(value);
    if (!handler) {
      if (value.IsObject()) throw EncodeException("Unregistered type '{}'.", value.ValueObject()->TypeName());
      throw EncodeException("No extension handles values of type {}.", TypeToString(value.type()));
    }
    const auto payload = handler->encode(value, registry_);
    std::vector<uint8_t> data;
    VectorOutputBuffer data_buffer(&data);
    Encoder<VectorOutputBuffer> payload_encoder(data_buffer, registry_);
    payload_encoder.WriteValue(payload);
    WriteExtension(utils::UnderlyingCast(handler->tag), data);
  }

  static uint32_t CheckedSize(size_t size, std::string_view what) {
    if (size > std::numeric_limits<uint32_t>::max()) {
      throw EncodeException("The {} of size {} is too large, the maximum is {}.", what, size,
                            std::numeric_limits<uint32_t>::max());
    }
    return static_cast<uint32_t>(size);
  }

  void WriteSizedMarker(uint32_t size, Marker marker16, Marker marker32) {
    if (size <= std::numeric_limits<uint16_t>::max()) {
      WriteMarker(marker16);
      WriteTypeRAW(static_cast<uint16_t>(size));
    } else {
      WriteMarker(marker32);
      WriteTypeRAW(size);
    }
  }

  void WriteMarker(Marker marker) { WriteRAW(ToByte(marker)); }

  void WriteRAW(const uint8_t *data, uint64_t len) { buffer_.Write(data, len); }

  void WriteRAW(const uint8_t data) { WriteRAW(&data, 1); }

  template <class T>
  void WriteTypeRAW(T value) {
    value = utils::HostToBigEndian(value);
    WriteRAW(reinterpret_cast<const uint8_t *>(&value), sizeof(value));
  }

  TBuffer &buffer_;
  const ExtensionRegistry &registry_;
};

}  // namespace fastpack
