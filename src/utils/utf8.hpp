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

#include <cstddef>
#include <optional>
#include <string_view>

namespace fastpack::utils {

/// Returns the byte offset of the first sequence in `text` that is not well
/// formed UTF-8, or std::nullopt when the whole text is valid. Overlong
/// forms, surrogate code points (U+D800..U+DFFF) and code points above
/// U+10FFFF are rejected.
std::optional<size_t> FindInvalidUtf8(std::string_view text);

inline bool IsValidUtf8(std::string_view text) { return !FindInvalidUtf8(text); }

}  // namespace fastpack::utils
