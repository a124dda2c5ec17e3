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

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <vector>

#include "fastpack/buffer.hpp"
#include "fastpack/codes.hpp"
#include "fastpack/config.hpp"
#include "fastpack/exceptions.hpp"
#include "fastpack/extension.hpp"
#include "fastpack/value.hpp"
#include "utils/endian.hpp"
#include "utils/utf8.hpp"

namespace fastpack {

/**
 * Reads frames from a buffer, one per `ReadValue` call.
 *
 * Declared lengths are checked against the remaining input before anything is
 * allocated or read when the buffer knows its size (`SizedInputBuffer`);
 * otherwise payloads are pulled in bounded chunks so a bogus length can not
 * force a huge allocation. Extension payloads are decoded from exactly the
 * bytes their frame declares.
 *
 * @tparam TBuffer the input buffer that should be used
 */
template <InputBuffer TBuffer>
class Decoder {
 public:
  explicit Decoder(TBuffer &buffer, DecoderConfig config = {},
                   const ExtensionRegistry &registry = ExtensionRegistry::Global())
      : Decoder(buffer, config, registry, 0) {}

  /**
   * Reads one complete frame into `value`.
   *
   * @returns false if the input ended before the first byte of the frame,
   *          true after a frame was decoded
   * @throw DecodeException on malformed or truncated input
   */
  bool ReadValue(Value *value) {
    const auto offset = buffer_.Position();
    uint8_t marker = 0;
    if (buffer_.Read(&marker, 1) != 1) return false;
    *value = ReadFrame(marker, offset, depth_);
    return true;
  }

 private:
  template <InputBuffer>
  friend class Decoder;

  static constexpr size_t kChunkSize = 64 * 1024;

  Decoder(TBuffer &buffer, DecoderConfig config, const ExtensionRegistry &registry, uint32_t depth)
      : buffer_(buffer), config_(config), registry_(registry), depth_(depth) {}

  Value ReadNested(uint32_t depth) {
    const auto offset = buffer_.Position();
    uint8_t marker = 0;
    if (buffer_.Read(&marker, 1) != 1) throw TruncatedInputException(offset, 1, 0);
    return ReadFrame(marker, offset, depth);
  }

  Value ReadFrame(uint8_t marker, uint64_t offset, uint32_t depth) {
    if (marker <= ToByte(Marker::PositiveFixIntMax)) {
      return Value(static_cast<int64_t>(marker));
    }
    if (marker >= ToByte(Marker::NegativeFixInt)) {
      return Value(static_cast<int64_t>(utils::MemcpyCast<int8_t>(marker)));
    }
    if ((marker & 0xF0) == ToByte(Marker::FixMap)) {
      return ReadMap(marker & 0x0F, offset, depth);
    }
    if ((marker & 0xF0) == ToByte(Marker::FixArray)) {
      return ReadArray(marker & 0x0F, offset, depth);
    }
    if ((marker & 0xE0) == ToByte(Marker::FixStr)) {
      return ReadString(marker & 0x1F, offset);
    }

    switch (static_cast<Marker>(marker)) {
      case Marker::Nil:
        return {};
      case Marker::False:
        return Value(false);
      case Marker::True:
        return Value(true);

      case Marker::Bin8:
        return Value(ReadBytes<Binary>(ReadTypeRAW<uint8_t>(offset), offset));
      case Marker::Bin16:
        return Value(ReadBytes<Binary>(ReadTypeRAW<uint16_t>(offset), offset));
      case Marker::Bin32:
        return Value(ReadBytes<Binary>(ReadTypeRAW<uint32_t>(offset), offset));

      case Marker::Ext8:
        return ReadExtension(ReadTypeRAW<uint8_t>(offset), offset, depth);
      case Marker::Ext16:
        return ReadExtension(ReadTypeRAW<uint16_t>(offset), offset, depth);
      case Marker::Ext32:
        return ReadExtension(ReadTypeRAW<uint32_t>(offset), offset, depth);

      case Marker::Float32:
        return Value(static_cast<double>(utils::MemcpyCast<float>(ReadTypeRAW<uint32_t>(offset))));
      case Marker::Float64:
        return Value(utils::MemcpyCast<double>(ReadTypeRAW<uint64_t>(offset)));

      case Marker::UInt8:
        return Value(static_cast<int64_t>(ReadTypeRAW<uint8_t>(offset)));
      case Marker::UInt16:
        return Value(static_cast<int64_t>(ReadTypeRAW<uint16_t>(offset)));
      case Marker::UInt32:
        return Value(static_cast<int64_t>(ReadTypeRAW<uint32_t>(offset)));
      case Marker::UInt64: {
        const auto value = ReadTypeRAW<uint64_t>(offset);
        // Only numbers beyond the signed range stay unsigned.
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return Value(value);
        return Value(static_cast<int64_t>(value));
      }

      case Marker::Int8:
        return Value(static_cast<int64_t>(ReadTypeRAW<int8_t>(offset)));
      case Marker::Int16:
        return Value(static_cast<int64_t>(ReadTypeRAW<int16_t>(offset)));
      case Marker::Int32:
        return Value(static_cast<int64_t>(ReadTypeRAW<int32_t>(offset)));
      case Marker::Int64:
        return Value(ReadTypeRAW<int64_t>(offset));

      case Marker::FixExt1:
        return ReadExtension(1, offset, depth);
      case Marker::FixExt2:
        return ReadExtension(2, offset, depth);
      case Marker::FixExt4:
        return ReadExtension(4, offset, depth);
      case Marker::FixExt8:
        return ReadExtension(8, offset, depth);
      case Marker::FixExt16:
        return ReadExtension(16, offset, depth);

      case Marker::Str8:
        return ReadString(ReadTypeRAW<uint8_t>(offset), offset);
      case Marker::Str16:
        return ReadString(ReadTypeRAW<uint16_t>(offset), offset);
      case Marker::Str32:
        return ReadString(ReadTypeRAW<uint32_t>(offset), offset);

      case Marker::Array16:
        return ReadArray(ReadTypeRAW<uint16_t>(offset), offset, depth);
      case Marker::Array32:
        return ReadArray(ReadTypeRAW<uint32_t>(offset), offset, depth);

      case Marker::Map16:
        return ReadMap(ReadTypeRAW<uint16_t>(offset), offset, depth);
      case Marker::Map32:
        return ReadMap(ReadTypeRAW<uint32_t>(offset), offset, depth);

      default:
        throw UnknownMarkerException(offset, marker);
    }
  }

  Value ReadString(uint32_t size, uint64_t offset) {
    auto text = ReadBytes<std::string>(size, offset);
    if (const auto invalid = utils::FindInvalidUtf8(text)) {
      throw MalformedUtf8Exception(offset, *invalid);
    }
    return Value(std::move(text));
  }

  Value ReadArray(uint32_t size, uint64_t offset, uint32_t depth) {
    CheckDepth(depth, offset);
    // Every element takes at least one byte.
    CheckAvailable(size, offset);
    Array array;
    array.reserve(ReserveHint(size));
    for (uint32_t i = 0; i < size; ++i) {
      array.push_back(ReadNested(depth + 1));
    }
    return Value(std::move(array));
  }

  Value ReadMap(uint32_t size, uint64_t offset, uint32_t depth) {
    CheckDepth(depth, offset);
    // Every pair takes at least two bytes.
    CheckAvailable(static_cast<uint64_t>(size) * 2, offset);
    Map map;
    map.reserve(ReserveHint(size));
    for (uint32_t i = 0; i < size; ++i) {
      auto key = ReadNested(depth + 1);
      auto value = ReadNested(depth + 1);
      map.emplace_back(std::move(key), std::move(value));
    }
    return Value(std::move(map));
  }

  Value ReadExtension(uint32_t size, uint64_t offset, uint32_t depth) {
    const auto tag = ReadTypeRAW<int8_t>(offset);
    const auto handler = registry_.ResolveDecoder(tag);
    if (!handler) throw UnknownExtensionException(offset, tag);
    CheckDepth(depth, offset);

    const auto data_offset = buffer_.Position();
    const auto data = ReadBytes<std::vector<uint8_t>>(size, offset);
    MemoryInputBuffer payload_buffer(data, data_offset);
    Decoder<MemoryInputBuffer> payload_decoder(payload_buffer, config_, registry_, depth + 1);
    Value payload;
    if (!payload_decoder.ReadValue(&payload)) {
      throw MalformedExtensionException(offset, tag, "the payload is empty");
    }
    if (payload_buffer.Remaining() != 0) {
      throw MalformedExtensionException(
          offset, tag, fmt::format("{} bytes of the declared payload are left unused", payload_buffer.Remaining()));
    }

    try {
      return handler->decode(std::move(payload), registry_);
    } catch (const DecodeException &) {
      throw;
    } catch (const UnregisteredTypeException &e) {
      throw UnknownExtensionException(offset, tag, e.qualifier());
    } catch (const utils::BasicException &e) {
      // Payload shape errors and the validation errors of temporal, decimal
      // and UUID values.
      throw MalformedExtensionException(offset, tag, e.what());
    } catch (const std::exception &e) {
      // Anything else a registered object decoder lets escape.
      throw MalformedExtensionException(offset, tag, e.what());
    }
  }

  void CheckDepth(uint32_t depth, uint64_t offset) const {
    if (depth >= config_.max_depth) throw DepthLimitExceededException(offset, config_.max_depth);
  }

  void CheckAvailable(uint64_t size, uint64_t offset) const {
    if constexpr (SizedInputBuffer<TBuffer>) {
      if (size > buffer_.Remaining()) throw TruncatedInputException(offset, size, buffer_.Remaining());
    }
  }

  size_t ReserveHint(uint32_t size) const { return std::min<size_t>(size, kChunkSize); }

  void ReadExact(uint8_t *data, size_t size, uint64_t offset) {
    if (const auto count = buffer_.Read(data, size); count != size) {
      throw TruncatedInputException(offset, size, count);
    }
  }

  template <typename TBytes>
  TBytes ReadBytes(uint64_t size, uint64_t offset) {
    CheckAvailable(size, offset);
    TBytes bytes;
    while (bytes.size() < size) {
      const auto done = bytes.size();
      const auto chunk = std::min<uint64_t>(size - done, kChunkSize);
      bytes.resize(done + chunk);
      const auto count = buffer_.Read(reinterpret_cast<uint8_t *>(bytes.data()) + done, chunk);
      if (count != chunk) throw TruncatedInputException(offset, size - done, count);
    }
    return bytes;
  }

  template <typename T>
  T ReadTypeRAW(uint64_t offset) {
    uint8_t data[sizeof(T)];
    ReadExact(data, sizeof(T), offset);
    return utils::ReadBigEndian<T>(data);
  }

  TBuffer &buffer_;
  DecoderConfig config_;
  const ExtensionRegistry &registry_;
  uint32_t depth_;
};

}  // namespace fastpack
