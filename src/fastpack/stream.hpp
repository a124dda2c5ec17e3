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
#include <iostream>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <vector>

#include "fastpack/buffer.hpp"
#include "fastpack/config.hpp"
#include "fastpack/decoder.hpp"
#include "fastpack/encoder.hpp"
#include "fastpack/extension.hpp"
#include "fastpack/value.hpp"
#include "utils/logging.hpp"

namespace fastpack {

/**
 * Lazy sequence of the values stored back to back in an input. Every pull
 * decodes exactly one frame and reads nothing beyond it.
 *
 * A pull that hits a malformed or truncated frame throws, after which the
 * sequence is finished and further pulls return std::nullopt. Over an input
 * that can seek (`MemoryInputBuffer`), `Reset` starts the sequence again.
 */
template <InputBuffer TBuffer>
class Unpacker {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = const Value *;
    using reference = const Value &;

    Iterator() = default;
    explicit Iterator(Unpacker *unpacker) : unpacker_(unpacker) { Advance(); }

    const Value &operator*() const { return *current_; }
    const Value *operator->() const { return &*current_; }

    Iterator &operator++() {
      Advance();
      return *this;
    }
    void operator++(int) { Advance(); }

    friend bool operator==(const Iterator &it, std::default_sentinel_t) { return !it.current_; }

   private:
    void Advance() { current_ = unpacker_->Next(); }

    Unpacker *unpacker_{nullptr};
    std::optional<Value> current_;
  };

  explicit Unpacker(TBuffer buffer, DecoderConfig config = {},
                    const ExtensionRegistry &registry = ExtensionRegistry::Global())
      : buffer_(std::move(buffer)), config_(config), registry_(&registry) {}

  /// The next value, std::nullopt at the end of the input.
  /// @throw DecodeException if the next frame is malformed or truncated
  std::optional<Value> Next() {
    if (finished_) return std::nullopt;
    const auto offset = buffer_.Position();
    try {
      Decoder<TBuffer> decoder(buffer_, config_, *registry_);
      Value value;
      if (!decoder.ReadValue(&value)) {
        finished_ = true;
        spdlog::trace("End of input after {} frames at offset {}", count_, offset);
        return std::nullopt;
      }
      ++count_;
      spdlog::trace("Unpacked frame {} at offset {} ({} bytes)", count_, offset, buffer_.Position() - offset);
      return value;
    } catch (const FastpackException &e) {
      finished_ = true;
      spdlog::trace("Unpacking the frame at offset {} failed: {}", offset, e.what());
      throw;
    }
  }

  void Reset()
  requires requires(TBuffer &buffer) { buffer.Seek(size_t{0}); }
  {
    buffer_.Seek(0);
    finished_ = false;
    count_ = 0;
  }

  bool Finished() const { return finished_; }
  /// Bytes consumed so far.
  uint64_t Position() const { return buffer_.Position(); }
  /// Frames decoded so far.
  uint64_t Count() const { return count_; }

  Iterator begin() { return Iterator(this); }
  std::default_sentinel_t end() { return {}; }

 private:
  TBuffer buffer_;
  DecoderConfig config_;
  const ExtensionRegistry *registry_;
  bool finished_{false};
  uint64_t count_{0};
};

template <typename TRange>
concept ValueRange =
    std::ranges::input_range<TRange> && std::convertible_to<std::ranges::range_reference_t<TRange>, const Value &>;

/**
 * Encodes every value of `values` and hands each complete frame to `sink`,
 * with nothing between frames. A value that fails to encode reaches the sink
 * not at all, the frames before it are already written.
 *
 * @return number of frames written
 * @throw EncodeException
 */
template <ValueRange TRange>
size_t PackStream(TRange &&values, const WriteFunction &sink,
                  const ExtensionRegistry &registry = ExtensionRegistry::Global()) {
  std::vector<uint8_t> frame;
  size_t count = 0;
  for (const Value &value : values) {
    frame.clear();
    VectorOutputBuffer buffer(&frame);
    Encoder<VectorOutputBuffer> encoder(buffer, registry);
    encoder.WriteValue(value);
    sink(frame.data(), frame.size());
    ++count;
    spdlog::trace("Packed frame {} ({} bytes)", count, frame.size());
  }
  return count;
}

template <ValueRange TRange>
size_t PackStream(TRange &&values, std::ostream &stream,
                  const ExtensionRegistry &registry = ExtensionRegistry::Global()) {
  return PackStream(std::forward<TRange>(values), StreamWriter(stream), registry);
}

/// All values of `values` as one multi-object buffer.
/// @throw EncodeException
template <ValueRange TRange>
std::vector<uint8_t> PackMany(TRange &&values, const ExtensionRegistry &registry = ExtensionRegistry::Global()) {
  std::vector<uint8_t> output;
  VectorOutputBuffer buffer(&output);
  Encoder<VectorOutputBuffer> encoder(buffer, registry);
  for (const Value &value : values) encoder.WriteValue(value);
  return output;
}

/// Writes the single frame of `value` to `sink` in one call.
/// @throw EncodeException
void PackTo(const Value &value, const WriteFunction &sink,
            const ExtensionRegistry &registry = ExtensionRegistry::Global());
void PackTo(const Value &value, std::ostream &stream, const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Reads exactly one frame from `source`.
/// @throw DecodeException, TruncatedInputException if the source is empty
Value UnpackFrom(const ReadFunction &source, DecoderConfig config = {},
                 const ExtensionRegistry &registry = ExtensionRegistry::Global());
Value UnpackFrom(std::istream &stream, DecoderConfig config = {},
                 const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Lazy sequence pulling frames from `source` one at a time.
Unpacker<SourceInputBuffer> UnpackStream(ReadFunction source, DecoderConfig config = {},
                                         const ExtensionRegistry &registry = ExtensionRegistry::Global());
/// `stream` must outlive the returned sequence.
Unpacker<SourceInputBuffer> UnpackStream(std::istream &stream, DecoderConfig config = {},
                                         const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Lazy, restartable sequence over a buffer; `data` must outlive it.
Unpacker<MemoryInputBuffer> IterUnpack(std::span<const uint8_t> data, DecoderConfig config = {},
                                       const ExtensionRegistry &registry = ExtensionRegistry::Global());

/// Every value of a multi-object buffer.
/// @throw DecodeException
std::vector<Value> UnpackMany(std::span<const uint8_t> data, DecoderConfig config = {},
                              const ExtensionRegistry &registry = ExtensionRegistry::Global());

}  // namespace fastpack
