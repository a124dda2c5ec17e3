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


#include <cstdint>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "utils/on_scope_exit.hpp"

TEST(OnScopeExit, BasicUsage) {
  int variable = 1;
  {
    ASSERT_EQ(variable, 1);
    fastpack::utils::OnScopeExit on_exit([&variable] { variable = 2; });
    EXPECT_EQ(variable, 1);
  }
  EXPECT_EQ(variable, 2);
}

TEST(OnScopeExit, Disable) {
  int variable = 1;
  {
    fastpack::utils::OnScopeExit on_exit([&variable] { variable = 2; });
    on_exit.Disable();
  }
  EXPECT_EQ(variable, 1);
}

TEST(OnScopeExit, RollbackOnException) {
  std::vector<uint8_t> output{1, 2};
  const auto append = [&output](bool fail) {
    const auto size = output.size();
    fastpack::utils::OnScopeExit rollback([&] { output.resize(size); });
    output.push_back(3);
    output.push_back(4);
    if (fail) throw std::runtime_error("failed");
    rollback.Disable();
  };
  EXPECT_THROW(append(true), std::runtime_error);
  EXPECT_EQ(output, (std::vector<uint8_t>{1, 2}));
  append(false);
  EXPECT_EQ(output, (std::vector<uint8_t>{1, 2, 3, 4}));
}
