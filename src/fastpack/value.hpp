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
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fastpack/exceptions.hpp"
#include "utils/decimal.hpp"
#include "utils/temporal.hpp"
#include "utils/uuid.hpp"

namespace fastpack {

class Value;

using Binary = std::vector<uint8_t>;
using Array = std::vector<Value>;
/// Key/value pairs in wire order. Keys may be of any kind and duplicates are
/// kept; equality ignores the order.
using Map = std::vector<std::pair<Value, Value>>;
/// Named fields in declaration order.
using Fields = std::vector<std::pair<std::string, Value>>;

/// Member of an enumeration: the enumeration's type name, the member name and
/// the member's underlying value.
struct EnumMember {
  std::string type_name;
  std::string name;
  std::unique_ptr<Value> value;

  EnumMember(std::string type_name, std::string name, Value value);
  EnumMember(const EnumMember &other);
  EnumMember(EnumMember &&other) noexcept = default;
  EnumMember &operator=(const EnumMember &other);
  EnumMember &operator=(EnumMember &&other) noexcept = default;
  ~EnumMember();
};

/// Structured record: type qualifier plus its fields in declaration order.
struct Record {
  std::string type_name;
  Fields fields;
};

/// Instance of a user type. The registry matches `TypeName()` exactly against
/// registered qualifiers to find the handler that converts it to fields.
class Object {
 public:
  virtual ~Object() = default;

  virtual std::string_view TypeName() const = 0;
  /// Structural equality, `other` always has the same `TypeName()`.
  virtual bool Equals(const Object &other) const = 0;
};

/**
 * Every value the format carries. Each `Type` corresponds to exactly one C++
 * type, the extension kinds included. Containers own their elements.
 */
class Value {
 public:
  enum class Type : uint8_t {
    Null,
    Bool,
    Int,
    UInt,
    Double,
    String,
    Binary,
    Array,
    Map,
    DateTime,
    Date,
    LocalTime,
    Duration,
    Decimal,
    Uuid,
    Enum,
    Record,
    NamedTuple,
    Set,
    FrozenSet,
    Tuple,
    Object,
  };

  Value() : type_(Type::Null) {}

  explicit Value(bool value) : bool_v(value), type_(Type::Bool) {}

  /// Signed integers make an `Int`, unsigned ones an `UInt`.
  template <std::integral T>
  requires(!std::same_as<T, bool>) explicit Value(T value) {
    if constexpr (std::is_signed_v<T>) {
      type_ = Type::Int;
      int_v = static_cast<int64_t>(value);
    } else {
      type_ = Type::UInt;
      uint_v = static_cast<uint64_t>(value);
    }
  }

  explicit Value(double value) : double_v(value), type_(Type::Double) {}

  explicit Value(std::string value) : type_(Type::String) { new (&string_v) std::string(std::move(value)); }
  explicit Value(std::string_view value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit Value(const char *value) : type_(Type::String) { new (&string_v) std::string(value); }

  explicit Value(Binary value) : type_(Type::Binary) { new (&binary_v) Binary(std::move(value)); }
  explicit Value(Array value) : type_(Type::Array) { new (&array_v) Array(std::move(value)); }
  explicit Value(Map value) : type_(Type::Map) { new (&map_v) Map(std::move(value)); }

  explicit Value(const utils::DateTime &value) : type_(Type::DateTime) { new (&datetime_v) utils::DateTime(value); }
  explicit Value(const utils::Date &value) : type_(Type::Date) { new (&date_v) utils::Date(value); }
  explicit Value(const utils::LocalTime &value) : type_(Type::LocalTime) {
    new (&local_time_v) utils::LocalTime(value);
  }
  explicit Value(const utils::Duration &value) : type_(Type::Duration) { new (&duration_v) utils::Duration(value); }
  explicit Value(utils::Decimal value) : type_(Type::Decimal) { new (&decimal_v) utils::Decimal(std::move(value)); }
  explicit Value(const utils::Uuid &value) : type_(Type::Uuid) { new (&uuid_v) utils::Uuid(value); }

  explicit Value(EnumMember value) : type_(Type::Enum) {
    new (&enum_v) std::unique_ptr<EnumMember>(std::make_unique<EnumMember>(std::move(value)));
  }
  explicit Value(Record value) : type_(Type::Record) { new (&record_v) Record(std::move(value)); }
  explicit Value(std::shared_ptr<const Object> value);

  static Value MakeNamedTuple(Record value);
  static Value MakeSet(Array elements);
  static Value MakeFrozenSet(Array elements);
  static Value MakeTuple(Array elements);

  Value(const Value &other);
  Value(Value &&other) noexcept;
  Value &operator=(const Value &other);
  Value &operator=(Value &&other) noexcept;
  ~Value() { DestroyValue(); }

  Type type() const { return type_; }

  bool IsNull() const { return type_ == Type::Null; }
  bool IsBool() const { return type_ == Type::Bool; }
  bool IsInt() const { return type_ == Type::Int; }
  bool IsUInt() const { return type_ == Type::UInt; }
  /// Either integer kind.
  bool IsInteger() const { return IsInt() || IsUInt(); }
  bool IsDouble() const { return type_ == Type::Double; }
  bool IsString() const { return type_ == Type::String; }
  bool IsBinary() const { return type_ == Type::Binary; }
  bool IsArray() const { return type_ == Type::Array; }
  bool IsMap() const { return type_ == Type::Map; }
  bool IsDateTime() const { return type_ == Type::DateTime; }
  bool IsDate() const { return type_ == Type::Date; }
  bool IsLocalTime() const { return type_ == Type::LocalTime; }
  bool IsDuration() const { return type_ == Type::Duration; }
  bool IsDecimal() const { return type_ == Type::Decimal; }
  bool IsUuid() const { return type_ == Type::Uuid; }
  bool IsEnum() const { return type_ == Type::Enum; }
  bool IsRecord() const { return type_ == Type::Record; }
  bool IsNamedTuple() const { return type_ == Type::NamedTuple; }
  bool IsSet() const { return type_ == Type::Set; }
  bool IsFrozenSet() const { return type_ == Type::FrozenSet; }
  bool IsTuple() const { return type_ == Type::Tuple; }
  bool IsObject() const { return type_ == Type::Object; }

  // Accessors throw ValueException when the value holds another kind.
  bool ValueBool() const;
  int64_t ValueInt() const;
  uint64_t ValueUInt() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const Binary &ValueBinary() const;
  const Array &ValueArray() const;
  Array &ValueArray();
  const Map &ValueMap() const;
  Map &ValueMap();
  const utils::DateTime &ValueDateTime() const;
  const utils::Date &ValueDate() const;
  const utils::LocalTime &ValueLocalTime() const;
  const utils::Duration &ValueDuration() const;
  const utils::Decimal &ValueDecimal() const;
  const utils::Uuid &ValueUuid() const;
  const EnumMember &ValueEnum() const;
  /// Valid for both `Record` and `NamedTuple`.
  const Record &ValueRecord() const;
  /// Valid for both `Set` and `FrozenSet`.
  const Array &ValueSet() const;
  const Array &ValueTuple() const;
  const std::shared_ptr<const Object> &ValueObject() const;

  /// The elements of any sequence kind: Array, Set, FrozenSet or Tuple.
  const Array &Elements() const;

 private:
  Value(Type type, Array elements);
  void DestroyValue() noexcept;
  [[noreturn]] void ThrowMismatch(Type expected) const;

  union {
    bool bool_v;
    int64_t int_v;
    uint64_t uint_v;
    double double_v;
    std::string string_v;
    Binary binary_v;
    // Array, Set, FrozenSet and Tuple
    Array array_v;
    Map map_v;
    utils::DateTime datetime_v;
    utils::Date date_v;
    utils::LocalTime local_time_v;
    utils::Duration duration_v;
    utils::Decimal decimal_v;
    utils::Uuid uuid_v;
    std::unique_ptr<EnumMember> enum_v;
    // Record and NamedTuple
    Record record_v;
    std::shared_ptr<const Object> object_v;
  };

  Type type_;
};

bool operator==(const Value &lhs, const Value &rhs);
bool operator==(const EnumMember &lhs, const EnumMember &rhs);
bool operator==(const Record &lhs, const Record &rhs);

std::string_view TypeToString(Value::Type type);

std::ostream &operator<<(std::ostream &os, Value::Type type);
std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace fastpack
