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

#include "utils/endian.hpp"

namespace fastpack {

/// First byte of every frame.
enum class Marker : uint8_t {
  PositiveFixIntMax = 0x7F,
  FixMap = 0x80,
  FixArray = 0x90,
  FixStr = 0xA0,

  Nil = 0xC0,
  NeverUsed = 0xC1,
  False = 0xC2,
  True = 0xC3,

  Bin8 = 0xC4,
  Bin16 = 0xC5,
  Bin32 = 0xC6,

  Ext8 = 0xC7,
  Ext16 = 0xC8,
  Ext32 = 0xC9,

  Float32 = 0xCA,
  Float64 = 0xCB,

  UInt8 = 0xCC,
  UInt16 = 0xCD,
  UInt32 = 0xCE,
  UInt64 = 0xCF,

  Int8 = 0xD0,
  Int16 = 0xD1,
  Int32 = 0xD2,
  Int64 = 0xD3,

  FixExt1 = 0xD4,
  FixExt2 = 0xD5,
  FixExt4 = 0xD6,
  FixExt8 = 0xD7,
  FixExt16 = 0xD8,

  Str8 = 0xD9,
  Str16 = 0xDA,
  Str32 = 0xDB,

  Array16 = 0xDC,
  Array32 = 0xDD,

  Map16 = 0xDE,
  Map32 = 0xDF,

  NegativeFixInt = 0xE0,
};

/// Upper bounds of the "fix" forms, the element count or length lives in the
/// low bits of the marker.
inline constexpr uint8_t kFixMapMaxSize = 0x0F;
inline constexpr uint8_t kFixArrayMaxSize = 0x0F;
inline constexpr uint8_t kFixStrMaxSize = 0x1F;
inline constexpr int64_t kNegativeFixIntMin = -32;

/// Extension type tags. 0..63 are reserved for the built-in kinds, user
/// registered types all share `Object` and carry their qualifier in the payload.
enum class ExtensionTag : int8_t {
  DateTime = 1,
  Date = 2,
  LocalTime = 3,
  Duration = 4,
  Decimal = 5,
  Uuid = 6,
  Enum = 7,
  Record = 8,
  NamedTuple = 9,
  Set = 10,
  FrozenSet = 11,
  Tuple = 12,
  Object = 64,
};

inline constexpr int8_t kMaxBuiltinTag = 63;

inline constexpr uint8_t ToByte(Marker marker) { return utils::UnderlyingCast(marker); }

}  // namespace fastpack
