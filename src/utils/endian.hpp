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

#include <endian.h>

#include <concepts>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace fastpack::utils {

template <typename T>
requires std::is_enum_v<T>
constexpr std::underlying_type_t<T> UnderlyingCast(T e) {
  return static_cast<std::underlying_type_t<T>>(e);
}

/// Reinterprets the bytes of `src` as a `TDest` of the same size. Used for the
/// signed views of wire integers and for the bit patterns of floats.
template <typename TDest, typename TSrc>
requires(sizeof(TDest) == sizeof(TSrc) && std::is_arithmetic_v<TDest> && std::is_arithmetic_v<TSrc>)
TDest MemcpyCast(TSrc src) {
  TDest dest;
  std::memcpy(&dest, &src, sizeof(src));
  return dest;
}

namespace detail {

template <std::unsigned_integral T>
T SwapBigEndian(T value) {
  if constexpr (sizeof(T) == 1) {
    return value;
  } else if constexpr (sizeof(T) == 2) {
    return htobe16(value);
  } else if constexpr (sizeof(T) == 4) {
    return htobe32(value);
  } else {
    static_assert(sizeof(T) == 8, "Wire integers are at most 8 bytes wide");
    return htobe64(value);
  }
}

}  // namespace detail

// Every multi-byte number on the wire is big-endian. The swap is its own
// inverse, so both directions share one implementation.
template <std::integral T>
T HostToBigEndian(T value) {
  return MemcpyCast<T>(detail::SwapBigEndian(MemcpyCast<std::make_unsigned_t<T>>(value)));
}

template <std::integral T>
T BigEndianToHost(T value) {
  return HostToBigEndian(value);
}

/// Reads a big-endian number of type T from `data`, which must hold at least sizeof(T) bytes.
template <std::integral T>
T ReadBigEndian(const uint8_t *data) {
  T value;
  std::memcpy(&value, data, sizeof(T));
  return BigEndianToHost(value);
}

}  // namespace fastpack::utils
