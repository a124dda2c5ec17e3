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


#include "flags/log_level.hpp"

#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

namespace {

constexpr std::array kLogLevels{std::pair{"TRACE"sv, spdlog::level::trace},   std::pair{"DEBUG"sv, spdlog::level::debug},
                                std::pair{"INFO"sv, spdlog::level::info},     std::pair{"WARNING"sv, spdlog::level::warn},
                                std::pair{"ERROR"sv, spdlog::level::err},     std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string kLogLevelHelp =
    fmt::format("Minimum level of messages written to the log. Allowed values: {}",
                fastpack::utils::GetAllowedEnumValuesString(kLogLevels));

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Also append the log to this file.");

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", kLogLevelHelp.c_str(), { return fastpack::flags::ValidLogLevel(value); });

bool fastpack::flags::ValidLogLevel(std::string_view value) {
  const auto result = utils::IsValidEnumValueString(value, kLogLevels);
  if (result) return true;

  if (result.error() == utils::ValidationError::EmptyValue) {
    std::cout << "Log level cannot be empty." << std::endl;
  } else {
    std::cout << "Invalid log level '" << value << "'. Allowed values: " << utils::GetAllowedEnumValuesString(kLogLevels)
              << std::endl;
  }
  return false;
}

std::optional<spdlog::level::level_enum> fastpack::flags::LogLevelToEnum(std::string_view value) {
  return utils::StringToEnum<spdlog::level::level_enum>(value, kLogLevels);
}

void fastpack::flags::InitializeLogger() {
  const auto level = LogLevelToEnum(FLAGS_log_level);
  FP_ASSERT(level, "--log_level '{}' passed validation but has no mapping", FLAGS_log_level);

  // Standard output carries the decoded objects, so the log goes to stderr.
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!FLAGS_log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_log_file));
  }

  auto logger = std::make_shared<spdlog::logger>("fastpack_log", sinks.begin(), sinks.end());
  logger->set_level(*level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
}
