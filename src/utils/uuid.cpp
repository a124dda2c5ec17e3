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


#include "utils/uuid.hpp"

#include <algorithm>

namespace fastpack::utils {

namespace {
constexpr size_t kUuidStringLength = 36;  // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
}  // namespace

Uuid Uuid::Generate() {
  Uuid uuid;
  uuid_generate(uuid.uuid_.data());
  return uuid;
}

Uuid Uuid::Parse(std::string_view text) {
  if (text.length() != kUuidStringLength) {
    throw InvalidUuidException("Invalid UUID argument length. Length is {} and expected to be {}.", text.length(),
                               kUuidStringLength);
  }
  // uuid_parse needs a null terminated string.
  const std::string terminated{text};
  Uuid uuid;
  if (uuid_parse(terminated.c_str(), uuid.uuid_.data()) != 0) {
    throw InvalidUuidException("Invalid UUID format '{}'.", text);
  }
  return uuid;
}

Uuid Uuid::FromBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != std::tuple_size_v<arr_t>) {
    throw InvalidUuidException("A UUID is 16 bytes long, got {} bytes.", bytes.size());
  }
  arr_t arr;
  std::copy(bytes.begin(), bytes.end(), arr.begin());
  return Uuid(arr);
}

std::string Uuid::ToString() const {
  std::array<char, kUuidStringLength + 1> decoded{};  // +1 for null terminator written by uuid_unparse
  uuid_unparse(uuid_.data(), decoded.data());
  return {decoded.data(), kUuidStringLength};
}

}  // namespace fastpack::utils
