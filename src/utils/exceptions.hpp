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

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace fastpack::utils {

/// Overrides `name()` with the class name, used when reporting a failure
/// without knowing its concrete type.
#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/// Root of every exception thrown by fastpack and its utilities. Holds the
/// message returned from `what()`; the message can be built from a format
/// string and its arguments.
class BasicException : public std::exception {
 public:
  explicit BasicException(std::string_view message) noexcept : msg_(message) {}
  explicit BasicException(const char *message) noexcept : msg_(message) {}
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

}  // namespace fastpack::utils
