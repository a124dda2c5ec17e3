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


#include "utils/logging.hpp"

#include <algorithm>
#include <iterator>

void fastpack::logging::AssertFailed(std::source_location const loc, char const *expr, std::string const &message) {
  spdlog::critical(
      "\nAssertion failed in file {} at line {}."
      "\n\tExpression: '{}'"
      "{}",
      loc.file_name(), loc.line(), expr, !message.empty() ? fmt::format("\n\tMessage: '{}'", message) : "");
  std::terminate();
}

std::string fastpack::logging::HexPreview(std::span<const uint8_t> bytes, size_t limit) {
  std::string preview;
  const auto shown = bytes.first(std::min(bytes.size(), limit));
  for (const auto byte : shown) {
    if (!preview.empty()) preview += ' ';
    fmt::format_to(std::back_inserter(preview), "{:02X}", byte);
  }
  if (shown.size() < bytes.size()) preview += preview.empty() ? "..." : " ...";
  return preview;
}
