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


#include <atomic>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fastpack/fastpack.hpp"
#include "fastpack_common.hpp"

using fastpack::Value;

class FastpackRegistry : public ::testing::Test {
 protected:
  void SetUp() override { RegisterMoney(registry); }

  fastpack::ExtensionRegistry registry;
};

TEST_F(FastpackRegistry, RoundTrip) {
  const auto money = MakeMoney(1999, "EUR");
  const auto data = fastpack::Pack(money, registry);
  const auto decoded = fastpack::Unpack(data, {}, registry);
  ASSERT_TRUE(decoded.IsObject());
  EXPECT_EQ(decoded, money);
  const auto &object = dynamic_cast<const Money &>(*decoded.ValueObject());
  EXPECT_EQ(object.cents(), 1999);
  EXPECT_EQ(object.currency(), "EUR");
}

TEST_F(FastpackRegistry, PayloadIsQualifierAndFields) {
  const auto data = fastpack::Pack(MakeMoney(5, "EUR"), registry);
  ASSERT_GE(data.size(), 3U);
  ASSERT_EQ(data[0], 0xC7);
  EXPECT_EQ(data[1], data.size() - 3);
  EXPECT_EQ(data[2], 64);

  const auto payload = fastpack::Unpack(std::span(data).subspan(3));
  ASSERT_TRUE(payload.IsArray());
  ASSERT_EQ(payload.ValueArray().size(), 2U);
  EXPECT_EQ(payload.ValueArray()[0], Value("billing.Money"));
  EXPECT_EQ(payload.ValueArray()[1],
            Value(fastpack::Map{{Value("cents"), Value(5)}, {Value("currency"), Value("EUR")}}));
}

TEST_F(FastpackRegistry, ObjectsInsideContainers) {
  const Value invoice(fastpack::Map{
      {Value("total"), MakeMoney(4500, "USD")},
      {Value("lines"), Value(fastpack::Array{MakeMoney(1500, "USD"), MakeMoney(3000, "USD")})},
  });
  EXPECT_EQ(fastpack::Unpack(fastpack::Pack(invoice, registry), {}, registry), invoice);
}

TEST_F(FastpackRegistry, UnregisteredOnEncode) {
  fastpack::ExtensionRegistry empty;
  EXPECT_THROW(fastpack::Pack(MakeMoney(1, "EUR"), empty), fastpack::EncodeException);
}

TEST_F(FastpackRegistry, UnregisteredOnDecode) {
  const auto data = fastpack::Pack(Value(fastpack::Array{Value(1), MakeMoney(1, "EUR")}), registry);
  fastpack::ExtensionRegistry empty;
  try {
    fastpack::Unpack(data, {}, empty);
    FAIL() << "Expected an UnknownExtensionException";
  } catch (const fastpack::UnknownExtensionException &e) {
    EXPECT_EQ(e.tag(), 64);
    EXPECT_EQ(e.qualifier(), "billing.Money");
    EXPECT_EQ(e.offset(), 2U);
  }
}

TEST_F(FastpackRegistry, Clear) {
  const auto data = fastpack::Pack(MakeMoney(1, "EUR"), registry);
  EXPECT_TRUE(registry.IsRegistered(Money::kQualifier));
  registry.Clear();
  EXPECT_FALSE(registry.IsRegistered(Money::kQualifier));
  EXPECT_EQ(registry.Size(), 0U);
  EXPECT_THROW(fastpack::Pack(MakeMoney(1, "EUR"), registry), fastpack::EncodeException);
  EXPECT_THROW(fastpack::Unpack(data, {}, registry), fastpack::UnknownExtensionException);

  // Built-in kinds are unaffected.
  const auto date = Value(fastpack::utils::Date(2000, 1, 1));
  EXPECT_EQ(fastpack::Unpack(fastpack::Pack(date, registry), {}, registry), date);
}

TEST_F(FastpackRegistry, ReplaceHandler) {
  registry.Register(std::string(Money::kQualifier), [](const fastpack::Object &object) {
    auto fields = EncodeMoney(object);
    fields.emplace_back("note", Value("replaced"));
    return fields;
  }, DecodeMoney);
  EXPECT_EQ(registry.Size(), 1U);

  const auto data = fastpack::Pack(MakeMoney(7, "GBP"), registry);
  const auto payload = fastpack::Unpack(std::span(data).subspan(3));
  EXPECT_EQ(payload.ValueArray()[1].ValueMap().size(), 3U);
  EXPECT_EQ(fastpack::Unpack(data, {}, registry), MakeMoney(7, "GBP"));
}

TEST_F(FastpackRegistry, InvalidRegistration) {
  EXPECT_THROW(registry.Register("", EncodeMoney, DecodeMoney), fastpack::RegistrationException);
  EXPECT_THROW(registry.Register("Other", nullptr, DecodeMoney), fastpack::RegistrationException);
  EXPECT_THROW(registry.Register("Other", EncodeMoney, nullptr), fastpack::RegistrationException);
  EXPECT_EQ(registry.Size(), 1U);
}

TEST_F(FastpackRegistry, DecoderRejectingFields) {
  fastpack::ExtensionRegistry partial;
  partial.Register(std::string(Money::kQualifier),
                   [](const fastpack::Object &object) {
                     return fastpack::Fields{{"cents", Value(static_cast<const Money &>(object).cents())}};
                   },
                   DecodeMoney);
  const auto data = fastpack::Pack(MakeMoney(3, "EUR"), partial);
  try {
    fastpack::Unpack(data, {}, partial);
    FAIL() << "Expected a MalformedExtensionException";
  } catch (const fastpack::MalformedExtensionException &e) {
    EXPECT_EQ(e.tag(), 64);
  }
}

TEST_F(FastpackRegistry, DecoderThrowingStandardException) {
  registry.Register(std::string(Money::kQualifier), EncodeMoney,
                    [](const fastpack::Fields &fields) -> std::shared_ptr<const fastpack::Object> {
                      return std::make_shared<Money>(fields.at(5).second.ValueInt(), "EUR");
                    });
  const auto data = fastpack::Pack(Value(fastpack::Array{Value(1), MakeMoney(3, "EUR")}), registry);
  try {
    fastpack::Unpack(data, {}, registry);
    FAIL() << "Expected a MalformedExtensionException";
  } catch (const fastpack::MalformedExtensionException &e) {
    EXPECT_EQ(e.tag(), 64);
    EXPECT_EQ(e.offset(), 2U);
  }
}

TEST_F(FastpackRegistry, DecoderReturningNothing) {
  registry.Register(std::string(Money::kQualifier), EncodeMoney,
                    [](const fastpack::Fields &) -> std::shared_ptr<const fastpack::Object> { return nullptr; });
  const auto data = fastpack::Pack(MakeMoney(3, "EUR"), registry);
  EXPECT_THROW(fastpack::Unpack(data, {}, registry), fastpack::MalformedExtensionException);
}

TEST_F(FastpackRegistry, MalformedObjectPayload) {
  // Tag 64 with the qualifier missing: [1, {}]
  EXPECT_THROW(fastpack::Unpack(Bytes({0xC7, 0x03, 0x40, 0x92, 0x01, 0x80}), {}, registry),
               fastpack::MalformedExtensionException);
}

TEST_F(FastpackRegistry, ConcurrentUse) {
  constexpr int kThreads = 4;
  constexpr int kIterations = 200;
  std::atomic<int> failures{0};
  std::vector<std::jthread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      for (int j = 0; j < kIterations; ++j) {
        if (i % 2 == 0) {
          registry.Register(fmt::format("type.{}.{}", i, j), EncodeMoney, DecodeMoney);
        } else {
          const auto value = MakeMoney(j, "EUR");
          if (fastpack::Unpack(fastpack::Pack(value, registry), {}, registry) != value) ++failures;
        }
      }
    });
  }
  threads.clear();
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(registry.Size(), 1U + (kThreads / 2) * kIterations);
}

TEST(FastpackGlobalRegistry, RegisterAndClear) {
  fastpack::Register(std::string(Money::kQualifier), EncodeMoney, DecodeMoney);
  const auto money = MakeMoney(250, "CHF");
  EXPECT_EQ(fastpack::Unpack(fastpack::Pack(money)), money);

  fastpack::ClearRegistry();
  EXPECT_EQ(fastpack::ExtensionRegistry::Global().Size(), 0U);
  EXPECT_THROW(fastpack::Pack(money), fastpack::EncodeException);
}
