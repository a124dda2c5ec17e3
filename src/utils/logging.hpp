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

#undef SPDLOG_ACTIVE_LEVEL
#ifndef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif
#include <cstddef>
#include <cstdint>
#include <source_location>
#include <span>
#include <string>

#include <fmt/format.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <boost/preprocessor/comparison/equal.hpp>
#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/variadic/size.hpp>

namespace fastpack::logging {

[[noreturn]] void AssertFailed(std::source_location loc, const char *expr, const std::string &message);

/// Upper-case hex of the first `limit` bytes separated by spaces, followed by
/// "..." when `bytes` is longer. Used to show the bytes of a rejected frame.
std::string HexPreview(std::span<const uint8_t> bytes, size_t limit = 16);

#define GET_MESSAGE(...) std::string(__VA_OPT__(fmt::format(__VA_ARGS__)))

#define FP_ASSERT(expr, ...)                                                                                 \
  do {                                                                                                       \
    if (!(expr)) [[unlikely]] {                                                                              \
      [&]() __attribute__((noinline, cold, noreturn)) {                                                      \
        ::fastpack::logging::AssertFailed(std::source_location::current(), #expr, GET_MESSAGE(__VA_ARGS__)); \
      }                                                                                                      \
      ();                                                                                                    \
    }                                                                                                        \
  } while (false)

#ifndef NDEBUG
#define DFP_ASSERT(expr, ...) FP_ASSERT(expr, __VA_ARGS__)
#else
#define DFP_ASSERT(...) \
  do {                  \
  } while (false)
#endif

}  // namespace fastpack::logging
