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
#include <concepts>
#include <cstdint>
#include <cstring>
#include <functional>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

#include "fastpack/exceptions.hpp"

namespace fastpack {

/// Byte sink, receives complete frames.
using WriteFunction = std::function<void(const uint8_t *data, size_t size)>;
/// Byte source, fills up to `size` bytes and returns how many it wrote. A
/// return of 0 means the source is exhausted.
using ReadFunction = std::function<size_t(uint8_t *data, size_t size)>;

template <typename T>
concept OutputBuffer = requires(T buffer, const uint8_t *data, size_t size) { buffer.Write(data, size); };

/// `Read` returns fewer bytes than requested only at the end of the input.
/// `Position` is the count of bytes consumed from the start of the input.
template <typename T>
concept InputBuffer = requires(T buffer, uint8_t *data, size_t size) {
  { buffer.Read(data, size) } -> std::same_as<size_t>;
  { buffer.Position() } -> std::convertible_to<uint64_t>;
};

/// Input whose remaining length is known, so declared lengths are checked
/// before any payload byte is read.
template <typename T>
concept SizedInputBuffer = InputBuffer<T> && requires(const T buffer) {
  { buffer.Remaining() } -> std::convertible_to<uint64_t>;
};

/// Appends everything written to a vector it does not own.
class VectorOutputBuffer {
 public:
  explicit VectorOutputBuffer(std::vector<uint8_t> *output) : output_(output) {}

  void Write(const uint8_t *data, size_t size) { output_->insert(output_->end(), data, data + size); }

 private:
  std::vector<uint8_t> *output_;
};

/// Cursor over bytes held in memory. Never reads past the end of the span.
class MemoryInputBuffer {
 public:
  /// `base_position` is added to reported positions, used for payloads nested
  /// inside a larger input.
  explicit MemoryInputBuffer(std::span<const uint8_t> data, uint64_t base_position = 0)
      : data_(data), base_position_(base_position) {}

  size_t Read(uint8_t *data, size_t size) {
    const auto count = std::min(size, data_.size() - pos_);
    if (count > 0) std::memcpy(data, data_.data() + pos_, count);
    pos_ += count;
    return count;
  }

  uint64_t Position() const { return base_position_ + pos_; }
  uint64_t Remaining() const { return data_.size() - pos_; }

  /// Moves the cursor to `offset` bytes from the start of the span.
  void Seek(size_t offset) { pos_ = std::min(offset, data_.size()); }

 private:
  std::span<const uint8_t> data_;
  uint64_t base_position_;
  size_t pos_{0};
};

/// Pulls bytes on demand from a `ReadFunction`, asking for exactly what the
/// decoder needs and nothing more.
class SourceInputBuffer {
 public:
  explicit SourceInputBuffer(ReadFunction read) : read_(std::move(read)) {}

  size_t Read(uint8_t *data, size_t size) {
    size_t total = 0;
    while (total < size) {
      const auto count = read_(data + total, size - total);
      if (count == 0) break;
      total += count;
    }
    position_ += total;
    return total;
  }

  uint64_t Position() const { return position_; }

 private:
  ReadFunction read_;
  uint64_t position_{0};
};

/// Sink writing to `stream`, throws StreamException once the stream fails.
inline WriteFunction StreamWriter(std::ostream &stream) {
  return [&stream](const uint8_t *data, size_t size) {
    stream.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
    if (!stream) throw StreamException("Failed writing {} bytes to the output stream.", size);
  };
}

/// Source reading from `stream` until its end.
inline ReadFunction StreamReader(std::istream &stream) {
  return [&stream](uint8_t *data, size_t size) -> size_t {
    stream.read(reinterpret_cast<char *>(data), static_cast<std::streamsize>(size));
    if (stream.bad()) throw StreamException("Failed reading from the input stream.");
    return static_cast<size_t>(stream.gcount());
  };
}

}  // namespace fastpack
