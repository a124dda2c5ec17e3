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

#include <concepts>
#include <type_traits>
#include <utility>

namespace fastpack::utils {

/// Runs `function` when the scope is left unless `Disable` was called first.
/// `Encode` uses it to shrink the caller's buffer back to its previous size
/// when encoding throws halfway through a value.
template <std::invocable Callable>
class [[nodiscard]] OnScopeExit {
 public:
  template <typename U>
  requires std::constructible_from<Callable, U>
  explicit OnScopeExit(U &&function) : function_(std::forward<U>(function)) {}

  OnScopeExit(const OnScopeExit &) = delete;
  OnScopeExit(OnScopeExit &&) = delete;
  OnScopeExit &operator=(const OnScopeExit &) = delete;
  OnScopeExit &operator=(OnScopeExit &&) = delete;

  ~OnScopeExit() {
    if (enabled_) function_();
  }

  void Disable() { enabled_ = false; }

 private:
  Callable function_;
  bool enabled_{true};
};

template <typename Callable>
OnScopeExit(Callable &&) -> OnScopeExit<std::decay_t<Callable>>;

}  // namespace fastpack::utils
