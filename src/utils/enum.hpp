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
#include <expected>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fastpack::utils {
enum class ValidationError : uint8_t { EmptyValue, InvalidValue };

// `mappings` is any range of (name, enum) pairs, usually a constexpr std::array.
auto FindEnumMapping(const auto &value, const auto &mappings) {
  return std::ranges::find_if(mappings, [&](const auto &mapping) { return mapping.first == value; });
}

// Names accepted for the mapped enum, comma separated, for help and error text.
auto GetAllowedEnumValuesString(const auto &mappings) -> std::string {
  return fmt::format("{}", fmt::join(mappings | std::views::keys, ", "));
}

auto IsValidEnumValueString(const auto &value, const auto &mappings) -> std::expected<void, ValidationError> {
  if (value.empty()) return std::unexpected{ValidationError::EmptyValue};
  if (FindEnumMapping(value, mappings) == std::ranges::end(mappings)) {
    return std::unexpected{ValidationError::InvalidValue};
  }
  return {};
}

template <typename Enum>
auto StringToEnum(const auto &value, const auto &mappings) -> std::optional<Enum> {
  const auto it = FindEnumMapping(value, mappings);
  if (it == std::ranges::end(mappings)) return std::nullopt;
  return it->second;
}

}  // namespace fastpack::utils
