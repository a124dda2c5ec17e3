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


#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <gflags/gflags.h>

#include "fastpack/fastpack.hpp"
#include "flags/log_level.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

DEFINE_string(input, "", "Stream file to inspect, standard input when empty.");
DEFINE_VALIDATED_uint32(max_depth, fastpack::DecoderConfig{}.max_depth,
                        "Maximum nesting depth of containers and extension payloads.", FLAG_IN_RANGE(1, 100000));
DEFINE_bool(count_only, false, "Only print the number of objects in the stream.");

namespace {

int Dump(std::istream &input) {
  auto unpacker = fastpack::UnpackStream(input, fastpack::DecoderConfig{.max_depth = FLAGS_max_depth});
  try {
    while (true) {
      const auto offset = unpacker.Position();
      auto value = unpacker.Next();
      if (!value) break;
      if (!FLAGS_count_only) {
        std::cout << fmt::format("#{} @{}: ", unpacker.Count() - 1, offset) << *value << '\n';
      }
    }
  } catch (const fastpack::DecodeException &e) {
    spdlog::error("{} after {} objects: {}", e.name(), unpacker.Count(), e.what());
    return EXIT_FAILURE;
  } catch (const fastpack::StreamException &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
  if (FLAGS_count_only) std::cout << unpacker.Count() << '\n';
  spdlog::info("Read {} objects, {} bytes", unpacker.Count(), unpacker.Position());
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage("Print the objects stored back to back in a fastpack stream.");
  gflags::SetVersionString(std::string{fastpack::kVersion});
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  fastpack::flags::InitializeLogger();

  if (FLAGS_input.empty()) {
    return Dump(std::cin);
  }

  std::ifstream file(FLAGS_input, std::ios::binary);
  if (!file) {
    spdlog::error("Unable to open '{}'", FLAGS_input);
    return EXIT_FAILURE;
  }
  return Dump(file);
}
