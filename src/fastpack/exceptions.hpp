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
#include <string>

#include "utils/exceptions.hpp"

namespace fastpack {

/// Root of every error raised by the codec.
class FastpackException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(FastpackException)
};

/// The value can not be encoded: unknown kind, unregistered user type,
/// string that is not valid UTF-8 or a length beyond what the format carries.
class EncodeException : public FastpackException {
 public:
  using FastpackException::FastpackException;
  SPECIALIZE_GET_EXCEPTION_NAME(EncodeException)
};

/// Malformed input. `offset()` is the position of the first byte of the frame
/// that could not be decoded, counted from the start of the input.
class DecodeException : public FastpackException {
 public:
  template <class... Args>
  DecodeException(uint64_t offset, fmt::format_string<Args...> fmt, Args &&...args)
      : FastpackException("{} (at offset {})", fmt::format(fmt, std::forward<Args>(args)...), offset),
        offset_(offset) {}

  SPECIALIZE_GET_EXCEPTION_NAME(DecodeException)

  uint64_t offset() const { return offset_; }

 private:
  uint64_t offset_;
};

class TruncatedInputException : public DecodeException {
 public:
  TruncatedInputException(uint64_t offset, uint64_t needed, uint64_t available)
      : DecodeException(offset, "Truncated input, the frame needs {} more bytes but only {} are available", needed,
                        available) {}
  explicit TruncatedInputException(uint64_t offset) : DecodeException(offset, "Truncated input") {}

  SPECIALIZE_GET_EXCEPTION_NAME(TruncatedInputException)
};

class UnknownMarkerException : public DecodeException {
 public:
  UnknownMarkerException(uint64_t offset, uint8_t marker)
      : DecodeException(offset, "Unknown marker 0x{:02X}", marker), marker_(marker) {}

  SPECIALIZE_GET_EXCEPTION_NAME(UnknownMarkerException)

  uint8_t marker() const { return marker_; }

 private:
  uint8_t marker_;
};

class MalformedUtf8Exception : public DecodeException {
 public:
  MalformedUtf8Exception(uint64_t offset, uint64_t byte_index)
      : DecodeException(offset, "Malformed UTF-8 in string payload at byte {}", byte_index) {}

  SPECIALIZE_GET_EXCEPTION_NAME(MalformedUtf8Exception)
};

/// Bytes remain after the single object a whole-buffer unpack expects.
class LeftoverDataException : public DecodeException {
 public:
  LeftoverDataException(uint64_t offset, uint64_t leftover)
      : DecodeException(offset, "{} bytes of trailing data after the object", leftover) {}

  SPECIALIZE_GET_EXCEPTION_NAME(LeftoverDataException)
};

class DepthLimitExceededException : public DecodeException {
 public:
  DepthLimitExceededException(uint64_t offset, uint32_t max_depth)
      : DecodeException(offset, "Nesting exceeds the maximum depth of {}", max_depth) {}

  SPECIALIZE_GET_EXCEPTION_NAME(DepthLimitExceededException)
};

/// The payload of a known extension tag does not have the expected shape.
class MalformedExtensionException : public DecodeException {
 public:
  MalformedExtensionException(uint64_t offset, int8_t tag, const std::string &reason)
      : DecodeException(offset, "Malformed payload for extension tag {}: {}", tag, reason), tag_(tag) {}

  SPECIALIZE_GET_EXCEPTION_NAME(MalformedExtensionException)

  int8_t tag() const { return tag_; }

 private:
  int8_t tag_;
};

/// No decoder is registered for the tag, or for the qualifier of a user type.
class UnknownExtensionException : public DecodeException {
 public:
  UnknownExtensionException(uint64_t offset, int8_t tag)
      : DecodeException(offset, "Unknown extension tag {}", tag), tag_(tag) {}
  UnknownExtensionException(uint64_t offset, int8_t tag, std::string qualifier)
      : DecodeException(offset, "Unknown extension type '{}' (tag {})", qualifier, tag),
        tag_(tag),
        qualifier_(std::move(qualifier)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(UnknownExtensionException)

  int8_t tag() const { return tag_; }
  /// Empty unless the tag is the user type tag.
  const std::string &qualifier() const { return qualifier_; }

 private:
  int8_t tag_;
  std::string qualifier_;
};

/// A `Value` was accessed as a kind it does not hold.
class ValueException : public FastpackException {
 public:
  using FastpackException::FastpackException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

/// Invalid arguments to `ExtensionRegistry::Register`.
class RegistrationException : public FastpackException {
 public:
  using FastpackException::FastpackException;
  SPECIALIZE_GET_EXCEPTION_NAME(RegistrationException)
};

/// The byte sink or source of a stream failed.
class StreamException : public FastpackException {
 public:
  using FastpackException::FastpackException;
  SPECIALIZE_GET_EXCEPTION_NAME(StreamException)
};

}  // namespace fastpack
