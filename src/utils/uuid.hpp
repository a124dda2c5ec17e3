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

#include <uuid/uuid.h>

#include <array>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace fastpack::utils {

class InvalidUuidException : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidUuidException)
};

/// 128-bit universally unique identifier backed by libuuid.
class Uuid {
 public:
  using arr_t = std::array<uint8_t, 16>;

  /// The nil UUID (all zero bytes).
  Uuid() : uuid_{} {}
  explicit Uuid(const arr_t &bytes) : uuid_(bytes) {}

  /// Random (version 4 when a good entropy source exists) UUID.
  static Uuid Generate();

  /// @throw InvalidUuidException if `text` is not in the 8-4-4-4-12 hex form.
  static Uuid Parse(std::string_view text);

  /// @throw InvalidUuidException if `bytes` is not exactly 16 bytes long.
  static Uuid FromBytes(std::span<const uint8_t> bytes);

  const arr_t &bytes() const { return uuid_; }

  std::string ToString() const;

  friend bool operator==(const Uuid &, const Uuid &) = default;

  friend std::ostream &operator<<(std::ostream &os, const Uuid &uuid) { return os << uuid.ToString(); }

 private:
  arr_t uuid_;
};

}  // namespace fastpack::utils
