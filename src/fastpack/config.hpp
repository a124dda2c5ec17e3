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

namespace fastpack {

/// Limits applied while decoding untrusted input.
struct DecoderConfig {
  /// Containers and extension payloads nested deeper than this are rejected.
  uint32_t max_depth{512};
  /// Whole-buffer `Unpack` fails on bytes after the first object unless set.
  bool allow_trailing_data{false};
};

}  // namespace fastpack
