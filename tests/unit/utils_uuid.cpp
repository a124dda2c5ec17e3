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


#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "utils/uuid.hpp"

using fastpack::utils::Uuid;

TEST(Uuid, DefaultIsNil) {
  const Uuid uuid;
  EXPECT_EQ(uuid.ToString(), "00000000-0000-0000-0000-000000000000");
  for (const auto byte : uuid.bytes()) EXPECT_EQ(byte, 0);
}

TEST(Uuid, Generate) {
  const auto first = Uuid::Generate();
  const auto second = Uuid::Generate();
  EXPECT_NE(first, second);
  EXPECT_NE(first, Uuid());
}

TEST(Uuid, ParseAndFormat) {
  const auto uuid = Uuid::Parse("123E4567-E89B-12D3-A456-426614174000");
  EXPECT_EQ(uuid.ToString(), "123e4567-e89b-12d3-a456-426614174000");
  EXPECT_EQ(uuid.bytes()[0], 0x12);
  EXPECT_EQ(uuid.bytes()[15], 0x00);
  EXPECT_EQ(Uuid::Parse(uuid.ToString()), uuid);

  std::ostringstream stream;
  stream << uuid;
  EXPECT_EQ(stream.str(), uuid.ToString());
}

TEST(Uuid, ParseInvalid) {
  EXPECT_THROW(Uuid::Parse(""), fastpack::utils::InvalidUuidException);
  EXPECT_THROW(Uuid::Parse("123e4567-e89b-12d3-a456-42661417400"), fastpack::utils::InvalidUuidException);
  EXPECT_THROW(Uuid::Parse("123e4567-e89b-12d3-a456-4266141740000"), fastpack::utils::InvalidUuidException);
  EXPECT_THROW(Uuid::Parse("123e4567Xe89b-12d3-a456-426614174000"), fastpack::utils::InvalidUuidException);
  EXPECT_THROW(Uuid::Parse("g23e4567-e89b-12d3-a456-426614174000"), fastpack::utils::InvalidUuidException);
}

TEST(Uuid, FromBytes) {
  std::vector<uint8_t> bytes(16);
  for (size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<uint8_t>(i);
  const auto uuid = Uuid::FromBytes(bytes);
  EXPECT_EQ(uuid.ToString(), "00010203-0405-0607-0809-0a0b0c0d0e0f");

  EXPECT_THROW(Uuid::FromBytes(std::vector<uint8_t>(15)), fastpack::utils::InvalidUuidException);
  EXPECT_THROW(Uuid::FromBytes(std::vector<uint8_t>(17)), fastpack::utils::InvalidUuidException);
}
