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


#include "utils/utf8.hpp"

#include <cstdint>

namespace fastpack::utils {

namespace {
constexpr bool IsContinuation(uint8_t byte) { return (byte & 0xC0) == 0x80; }
}  // namespace

std::optional<size_t> FindInvalidUtf8(std::string_view text) {
  const auto *data = reinterpret_cast<const uint8_t *>(text.data());
  const size_t size = text.size();
  size_t pos = 0;
  while (pos < size) {
    const uint8_t lead = data[pos];
    if (lead < 0x80) {
      ++pos;
      continue;
    }
    if (lead < 0xC2 || lead > 0xF4) return pos;
    const size_t trailing = lead < 0xE0 ? 1 : (lead < 0xF0 ? 2 : 3);
    if (pos + trailing >= size) return pos;
    for (size_t i = 1; i <= trailing; ++i) {
      if (!IsContinuation(data[pos + i])) return pos;
    }
    const uint8_t second = data[pos + 1];
    if (lead == 0xE0 && second < 0xA0) return pos;   // overlong
    if (lead == 0xED && second >= 0xA0) return pos;  // surrogate
    if (lead == 0xF0 && second < 0x90) return pos;   // overlong
    if (lead == 0xF4 && second >= 0x90) return pos;  // above U+10FFFF
    pos += trailing + 1;
  }
  return std::nullopt;
}

}  // namespace fastpack::utils
