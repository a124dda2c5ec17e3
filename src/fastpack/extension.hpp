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

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fastpack/codes.hpp"
#include "fastpack/exceptions.hpp"
#include "fastpack/value.hpp"
#include "utils/synchronized.hpp"

namespace fastpack {

class ExtensionRegistry;

/// Reduces a value of an extension kind to the payload written inside the
/// extension frame.
using PayloadEncoder = std::function<Value(const Value &value, const ExtensionRegistry &registry)>;
/// Rebuilds the value from a decoded payload. Signals a payload of the wrong
/// shape with InvalidPayloadException and an unregistered user type with
/// UnregisteredTypeException.
using PayloadDecoder = std::function<Value(Value payload, const ExtensionRegistry &registry)>;

/// Converts an instance of a user type to its named fields.
using ObjectEncoder = std::function<Fields(const Object &object)>;
/// Builds an instance of a user type from its named fields.
using ObjectDecoder = std::function<std::shared_ptr<const Object>(const Fields &fields)>;

struct ExtensionHandler {
  ExtensionTag tag;
  PayloadEncoder encode;
  PayloadDecoder decode;
};

struct ObjectHandler {
  ObjectEncoder encode;
  ObjectDecoder decode;
};

/// Raised by payload decoders, the decoder reports it as
/// MalformedExtensionException with the frame offset.
class InvalidPayloadException : public FastpackException {
 public:
  using FastpackException::FastpackException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidPayloadException)
};

/// Raised by the user type payload decoder, the decoder reports it as
/// UnknownExtensionException with the frame offset.
class UnregisteredTypeException : public FastpackException {
 public:
  explicit UnregisteredTypeException(std::string qualifier)
      : FastpackException("Unregistered type '{}'", qualifier), qualifier_(std::move(qualifier)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnregisteredTypeException)

  const std::string &qualifier() const { return qualifier_; }

 private:
  std::string qualifier_;
};

/**
 * Maps extension tags to built-in handlers and user type qualifiers to
 * user handlers.
 *
 * Built-in handlers cover the reserved tags and can neither be removed nor
 * shadowed. User handlers are process state: they persist across pack and
 * unpack calls until replaced by another `Register` with the same qualifier or
 * removed by `Clear`. All operations are thread safe.
 */
class ExtensionRegistry {
 public:
  ExtensionRegistry() = default;
  ExtensionRegistry(const ExtensionRegistry &) = delete;
  ExtensionRegistry &operator=(const ExtensionRegistry &) = delete;
  ExtensionRegistry(ExtensionRegistry &&) = delete;
  ExtensionRegistry &operator=(ExtensionRegistry &&) = delete;
  ~ExtensionRegistry() = default;

  /// The process-wide registry used by default everywhere.
  static ExtensionRegistry &Global();

  /// Inserts or replaces the handler for `qualifier`.
  /// @throw RegistrationException on an empty qualifier or missing function.
  void Register(std::string qualifier, ObjectEncoder encoder, ObjectDecoder decoder);

  /// Removes every user handler, built-ins stay.
  void Clear();

  bool IsRegistered(std::string_view qualifier) const;
  size_t Size() const;

  /// Handler that turns `value` into an extension frame. std::nullopt when the
  /// value is a core primitive or an Object whose type is not registered.
  std::optional<ExtensionHandler> ResolveEncoder(const Value &value) const;

  /// Built-in handler for `tag`, std::nullopt for tags nobody handles.
  std::optional<ExtensionHandler> ResolveDecoder(int8_t tag) const;

  /// User handler for `qualifier`, std::nullopt if it is not registered.
  std::optional<ObjectHandler> ResolveObject(std::string_view qualifier) const;

 private:
  struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view text) const { return std::hash<std::string_view>{}(text); }
  };

  utils::Synchronized<std::unordered_map<std::string, ObjectHandler, StringHash, std::equal_to<>>, std::shared_mutex>
      objects_;
};

}  // namespace fastpack
