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


#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "gtest/gtest.h"

#include "utils/synchronized.hpp"

static_assert(fastpack::utils::SharedMutex<std::shared_mutex>);
static_assert(!fastpack::utils::SharedMutex<std::mutex>);

namespace {

// Records which mode the mutex is held in so tests can observe the locking.
struct RecordingMutex {
  static inline int exclusive = 0;
  static inline int shared = 0;

  void lock() { ++exclusive; }
  void unlock() { --exclusive; }
  void lock_shared() { ++shared; }
  void unlock_shared() { --shared; }
};

struct StringHash {
  using is_transparent = void;
  size_t operator()(std::string_view text) const { return std::hash<std::string_view>{}(text); }
};

using TagTable = std::unordered_map<std::string, int, StringHash, std::equal_to<>>;

}  // namespace

TEST(Synchronized, ForwardsConstructorArguments) {
  fastpack::utils::Synchronized<std::vector<int>> filled(3, 7);
  EXPECT_EQ(filled->size(), 3U);
  EXPECT_EQ(filled.Lock()->front(), 7);

  std::vector<int> source{1, 2};
  fastpack::utils::Synchronized<std::vector<int>> moved(std::move(source));
  EXPECT_EQ(moved->size(), 2U);
}

TEST(Synchronized, LockHoldsTheMutexExclusively) {
  fastpack::utils::Synchronized<std::vector<int>, RecordingMutex> values;
  {
    auto locked = values.Lock();
    EXPECT_EQ(RecordingMutex::exclusive, 1);
    locked->push_back(1);
  }
  EXPECT_EQ(RecordingMutex::exclusive, 0);
  values.WithLock([](auto &vector) {
    EXPECT_EQ(RecordingMutex::exclusive, 1);
    vector.push_back(2);
  });
  EXPECT_EQ(RecordingMutex::exclusive, 0);
  EXPECT_EQ(values.WithLock([](auto &vector) { return vector.size(); }), 2U);
}

TEST(Synchronized, ReadLockIsShared) {
  fastpack::utils::Synchronized<TagTable, RecordingMutex> table;
  table->emplace("Date", 2);

  const auto &readonly = table;
  {
    auto first = readonly.ReadLock();
    auto second = readonly.ReadLock();
    EXPECT_EQ(RecordingMutex::shared, 2);
    EXPECT_EQ(RecordingMutex::exclusive, 0);
    EXPECT_EQ(first->at("Date"), 2);
    EXPECT_EQ((*second).size(), 1U);
  }
  EXPECT_EQ(RecordingMutex::shared, 0);
  EXPECT_EQ(readonly.WithReadLock([](const auto &map) { return map.size(); }), 1U);
}

TEST(Synchronized, HeterogeneousLookup) {
  fastpack::utils::Synchronized<TagTable, std::shared_mutex> handlers;
  handlers->emplace("Date", 2);
  handlers.Lock()->emplace("Tuple", 12);

  const auto find = [&handlers](std::string_view name) {
    return handlers.WithReadLock([name](const auto &map) {
      const auto it = map.find(name);
      return it == map.end() ? -1 : it->second;
    });
  };
  EXPECT_EQ(find("Date"), 2);
  EXPECT_EQ(find("Tuple"), 12);
  EXPECT_EQ(find("Set"), -1);
}

TEST(Synchronized, ConcurrentWriters) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;
  fastpack::utils::Synchronized<std::vector<int>> values;
  {
    std::vector<std::jthread> writers;
    for (int t = 0; t < kThreads; ++t) {
      writers.emplace_back([&values, t] {
        for (int i = 0; i < kPerThread; ++i) values->push_back(t * kPerThread + i);
      });
    }
  }
  EXPECT_EQ(values->size(), static_cast<size_t>(kThreads * kPerThread));
}
