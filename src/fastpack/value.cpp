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


#include "fastpack/value.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "utils/logging.hpp"

namespace fastpack {

EnumMember::EnumMember(std::string type_name, std::string name, Value value)
    : type_name(std::move(type_name)), name(std::move(name)), value(std::make_unique<Value>(std::move(value))) {}

EnumMember::EnumMember(const EnumMember &other)
    : type_name(other.type_name), name(other.name), value(std::make_unique<Value>(*other.value)) {}

EnumMember &EnumMember::operator=(const EnumMember &other) {
  if (this == &other) return *this;
  type_name = other.type_name;
  name = other.name;
  value = std::make_unique<Value>(*other.value);
  return *this;
}

EnumMember::~EnumMember() = default;

Value::Value(std::shared_ptr<const Object> value) : type_(Type::Object) {
  if (!value) throw ValueException("An Object value can't hold a null pointer.");
  new (&object_v) std::shared_ptr<const Object>(std::move(value));
}

Value::Value(Type type, Array elements) : type_(type) {
  DFP_ASSERT(type == Type::Array || type == Type::Set || type == Type::FrozenSet || type == Type::Tuple,
             "Not a sequence kind");
  new (&array_v) Array(std::move(elements));
}

Value Value::MakeNamedTuple(Record value) {
  Value result(std::move(value));
  result.type_ = Type::NamedTuple;
  return result;
}

namespace {

// Keeps the first of every group of equal elements, in their original order.
Array UniqueElements(Array elements) {
  Array unique;
  unique.reserve(elements.size());
  for (auto &element : elements) {
    if (std::find(unique.begin(), unique.end(), element) == unique.end()) unique.push_back(std::move(element));
  }
  return unique;
}

}  // namespace

Value Value::MakeSet(Array elements) { return {Type::Set, UniqueElements(std::move(elements))}; }
Value Value::MakeFrozenSet(Array elements) { return {Type::FrozenSet, UniqueElements(std::move(elements))}; }
Value Value::MakeTuple(Array elements) { return {Type::Tuple, std::move(elements)}; }

Value::Value(const Value &other) : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      return;
    case Type::Bool:
      bool_v = other.bool_v;
      return;
    case Type::Int:
      int_v = other.int_v;
      return;
    case Type::UInt:
      uint_v = other.uint_v;
      return;
    case Type::Double:
      double_v = other.double_v;
      return;
    case Type::String:
      new (&string_v) std::string(other.string_v);
      return;
    case Type::Binary:
      new (&binary_v) Binary(other.binary_v);
      return;
    case Type::Array:
    case Type::Set:
    case Type::FrozenSet:
    case Type::Tuple:
      new (&array_v) Array(other.array_v);
      return;
    case Type::Map:
      new (&map_v) Map(other.map_v);
      return;
    case Type::DateTime:
      new (&datetime_v) utils::DateTime(other.datetime_v);
      return;
    case Type::Date:
      new (&date_v) utils::Date(other.date_v);
      return;
    case Type::LocalTime:
      new (&local_time_v) utils::LocalTime(other.local_time_v);
      return;
    case Type::Duration:
      new (&duration_v) utils::Duration(other.duration_v);
      return;
    case Type::Decimal:
      new (&decimal_v) utils::Decimal(other.decimal_v);
      return;
    case Type::Uuid:
      new (&uuid_v) utils::Uuid(other.uuid_v);
      return;
    case Type::Enum:
      new (&enum_v) std::unique_ptr<EnumMember>(std::make_unique<EnumMember>(*other.enum_v));
      return;
    case Type::Record:
    case Type::NamedTuple:
      new (&record_v) Record(other.record_v);
      return;
    case Type::Object:
      new (&object_v) std::shared_ptr<const Object>(other.object_v);
      return;
  }
}

Value::Value(Value &&other) noexcept : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      break;
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::Int:
      int_v = other.int_v;
      break;
    case Type::UInt:
      uint_v = other.uint_v;
      break;
    case Type::Double:
      double_v = other.double_v;
      break;
    case Type::String:
      new (&string_v) std::string(std::move(other.string_v));
      break;
    case Type::Binary:
      new (&binary_v) Binary(std::move(other.binary_v));
      break;
    case Type::Array:
    case Type::Set:
    case Type::FrozenSet:
    case Type::Tuple:
      new (&array_v) Array(std::move(other.array_v));
      break;
    case Type::Map:
      new (&map_v) Map(std::move(other.map_v));
      break;
    case Type::DateTime:
      new (&datetime_v) utils::DateTime(other.datetime_v);
      break;
    case Type::Date:
      new (&date_v) utils::Date(other.date_v);
      break;
    case Type::LocalTime:
      new (&local_time_v) utils::LocalTime(other.local_time_v);
      break;
    case Type::Duration:
      new (&duration_v) utils::Duration(other.duration_v);
      break;
    case Type::Decimal:
      new (&decimal_v) utils::Decimal(std::move(other.decimal_v));
      break;
    case Type::Uuid:
      new (&uuid_v) utils::Uuid(other.uuid_v);
      break;
    case Type::Enum:
      new (&enum_v) std::unique_ptr<EnumMember>(std::move(other.enum_v));
      break;
    case Type::Record:
    case Type::NamedTuple:
      new (&record_v) Record(std::move(other.record_v));
      break;
    case Type::Object:
      new (&object_v) std::shared_ptr<const Object>(std::move(other.object_v));
      break;
  }

  // reset the type of other
  other.DestroyValue();
  other.type_ = Type::Null;
}

Value &Value::operator=(const Value &other) {
  if (this == &other) return *this;
  Value copy(other);
  *this = std::move(copy);
  return *this;
}

Value &Value::operator=(Value &&other) noexcept {
  if (this == &other) return *this;
  DestroyValue();
  new (this) Value(std::move(other));
  return *this;
}

void Value::DestroyValue() noexcept {
  switch (type_) {
    case Type::Null:
    case Type::Bool:
    case Type::Int:
    case Type::UInt:
    case Type::Double:
      return;
    case Type::String:
      std::destroy_at(&string_v);
      return;
    case Type::Binary:
      std::destroy_at(&binary_v);
      return;
    case Type::Array:
    case Type::Set:
    case Type::FrozenSet:
    case Type::Tuple:
      std::destroy_at(&array_v);
      return;
    case Type::Map:
      std::destroy_at(&map_v);
      return;
    case Type::DateTime:
      std::destroy_at(&datetime_v);
      return;
    case Type::Date:
      std::destroy_at(&date_v);
      return;
    case Type::LocalTime:
      std::destroy_at(&local_time_v);
      return;
    case Type::Duration:
      std::destroy_at(&duration_v);
      return;
    case Type::Decimal:
      std::destroy_at(&decimal_v);
      return;
    case Type::Uuid:
      std::destroy_at(&uuid_v);
      return;
    case Type::Enum:
      std::destroy_at(&enum_v);
      return;
    case Type::Record:
    case Type::NamedTuple:
      std::destroy_at(&record_v);
      return;
    case Type::Object:
      std::destroy_at(&object_v);
      return;
  }
}

void Value::ThrowMismatch(Type expected) const {
  throw ValueException("Expected a value of type {}, but the value is of type {}.", TypeToString(expected),
                       TypeToString(type_));
}

#define DEFINE_VALUE_ACCESSOR(type_enum, type_param, field)  \
  type_param Value::Value##type_enum() const {              \
    if (type_ != Type::type_enum) ThrowMismatch(Type::type_enum); \
    return field;                                             \
  }

DEFINE_VALUE_ACCESSOR(Bool, bool, bool_v)
DEFINE_VALUE_ACCESSOR(Int, int64_t, int_v)
DEFINE_VALUE_ACCESSOR(UInt, uint64_t, uint_v)
DEFINE_VALUE_ACCESSOR(Double, double, double_v)
DEFINE_VALUE_ACCESSOR(String, const std::string &, string_v)
DEFINE_VALUE_ACCESSOR(Binary, const Binary &, binary_v)
DEFINE_VALUE_ACCESSOR(Array, const Array &, array_v)
DEFINE_VALUE_ACCESSOR(Map, const Map &, map_v)
DEFINE_VALUE_ACCESSOR(DateTime, const utils::DateTime &, datetime_v)
DEFINE_VALUE_ACCESSOR(Date, const utils::Date &, date_v)
DEFINE_VALUE_ACCESSOR(LocalTime, const utils::LocalTime &, local_time_v)
DEFINE_VALUE_ACCESSOR(Duration, const utils::Duration &, duration_v)
DEFINE_VALUE_ACCESSOR(Decimal, const utils::Decimal &, decimal_v)
DEFINE_VALUE_ACCESSOR(Uuid, const utils::Uuid &, uuid_v)
DEFINE_VALUE_ACCESSOR(Enum, const EnumMember &, *enum_v)
DEFINE_VALUE_ACCESSOR(Tuple, const Array &, array_v)
DEFINE_VALUE_ACCESSOR(Object, const std::shared_ptr<const Object> &, object_v)

#undef DEFINE_VALUE_ACCESSOR

Array &Value::ValueArray() {
  if (type_ != Type::Array) ThrowMismatch(Type::Array);
  return array_v;
}

Map &Value::ValueMap() {
  if (type_ != Type::Map) ThrowMismatch(Type::Map);
  return map_v;
}

const Record &Value::ValueRecord() const {
  if (type_ != Type::Record && type_ != Type::NamedTuple) ThrowMismatch(Type::Record);
  return record_v;
}

const Array &Value::ValueSet() const {
  if (type_ != Type::Set && type_ != Type::FrozenSet) ThrowMismatch(Type::Set);
  return array_v;
}

const Array &Value::Elements() const {
  switch (type_) {
    case Type::Array:
    case Type::Set:
    case Type::FrozenSet:
    case Type::Tuple:
      return array_v;
    default:
      ThrowMismatch(Type::Array);
  }
}

namespace {

/// Every element of `lhs` is paired with a distinct equal element of `rhs`.
template <typename TElement>
bool UnorderedEqual(const std::vector<TElement> &lhs, const std::vector<TElement> &rhs) {
  if (lhs.size() != rhs.size()) return false;
  std::vector<bool> used(rhs.size(), false);
  for (const auto &element : lhs) {
    bool found = false;
    for (size_t i = 0; i < rhs.size(); ++i) {
      if (!used[i] && rhs[i] == element) {
        used[i] = true;
        found = true;
        break;
      }
    }
    if (!found) return false;
  }
  return true;
}

}  // namespace

bool operator==(const EnumMember &lhs, const EnumMember &rhs) {
  return lhs.type_name == rhs.type_name && lhs.name == rhs.name && *lhs.value == *rhs.value;
}

bool operator==(const Record &lhs, const Record &rhs) {
  return lhs.type_name == rhs.type_name && lhs.fields == rhs.fields;
}

bool operator==(const Value &lhs, const Value &rhs) {
  // Int and UInt holding the same number are equal.
  if (lhs.IsInteger() && rhs.IsInteger()) {
    if (lhs.type() == rhs.type()) {
      return lhs.IsInt() ? lhs.ValueInt() == rhs.ValueInt() : lhs.ValueUInt() == rhs.ValueUInt();
    }
    const auto &signed_value = lhs.IsInt() ? lhs : rhs;
    const auto &unsigned_value = lhs.IsInt() ? rhs : lhs;
    return signed_value.ValueInt() >= 0 &&
           static_cast<uint64_t>(signed_value.ValueInt()) == unsigned_value.ValueUInt();
  }
  if (lhs.type() != rhs.type()) return false;

  switch (lhs.type()) {
    case Value::Type::Null:
      return true;
    case Value::Type::Bool:
      return lhs.ValueBool() == rhs.ValueBool();
    case Value::Type::Int:
    case Value::Type::UInt:
      return false;  // handled above
    case Value::Type::Double:
      return lhs.ValueDouble() == rhs.ValueDouble();
    case Value::Type::String:
      return lhs.ValueString() == rhs.ValueString();
    case Value::Type::Binary:
      return lhs.ValueBinary() == rhs.ValueBinary();
    case Value::Type::Array:
    case Value::Type::Tuple:
      return lhs.Elements() == rhs.Elements();
    case Value::Type::Set:
    case Value::Type::FrozenSet:
      return UnorderedEqual(lhs.ValueSet(), rhs.ValueSet());
    case Value::Type::Map:
      return UnorderedEqual(lhs.ValueMap(), rhs.ValueMap());
    case Value::Type::DateTime:
      return lhs.ValueDateTime() == rhs.ValueDateTime();
    case Value::Type::Date:
      return lhs.ValueDate() == rhs.ValueDate();
    case Value::Type::LocalTime:
      return lhs.ValueLocalTime() == rhs.ValueLocalTime();
    case Value::Type::Duration:
      return lhs.ValueDuration() == rhs.ValueDuration();
    case Value::Type::Decimal:
      return lhs.ValueDecimal() == rhs.ValueDecimal();
    case Value::Type::Uuid:
      return lhs.ValueUuid() == rhs.ValueUuid();
    case Value::Type::Enum:
      return lhs.ValueEnum() == rhs.ValueEnum();
    case Value::Type::Record:
    case Value::Type::NamedTuple:
      return lhs.ValueRecord() == rhs.ValueRecord();
    case Value::Type::Object: {
      const auto &lhs_object = *lhs.ValueObject();
      const auto &rhs_object = *rhs.ValueObject();
      return lhs_object.TypeName() == rhs_object.TypeName() && lhs_object.Equals(rhs_object);
    }
  }
  return false;
}

std::string_view TypeToString(Value::Type type) {
  switch (type) {
    case Value::Type::Null:
      return "null";
    case Value::Type::Bool:
      return "bool";
    case Value::Type::Int:
      return "int";
    case Value::Type::UInt:
      return "uint";
    case Value::Type::Double:
      return "double";
    case Value::Type::String:
      return "string";
    case Value::Type::Binary:
      return "binary";
    case Value::Type::Array:
      return "array";
    case Value::Type::Map:
      return "map";
    case Value::Type::DateTime:
      return "datetime";
    case Value::Type::Date:
      return "date";
    case Value::Type::LocalTime:
      return "local_time";
    case Value::Type::Duration:
      return "duration";
    case Value::Type::Decimal:
      return "decimal";
    case Value::Type::Uuid:
      return "uuid";
    case Value::Type::Enum:
      return "enum";
    case Value::Type::Record:
      return "record";
    case Value::Type::NamedTuple:
      return "named_tuple";
    case Value::Type::Set:
      return "set";
    case Value::Type::FrozenSet:
      return "frozenset";
    case Value::Type::Tuple:
      return "tuple";
    case Value::Type::Object:
      return "object";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, const Value::Type type) { return os << TypeToString(type); }

namespace {

void PrintString(std::ostream &os, std::string_view text) {
  os << '"';
  for (const char c : text) {
    switch (c) {
      case '"':
        os << "\\\"";
        break;
      case '\\':
        os << "\\\\";
        break;
      case '\n':
        os << "\\n";
        break;
      default:
        os << c;
    }
  }
  os << '"';
}

template <typename TIterable, typename TPrint>
void PrintJoined(std::ostream &os, const TIterable &iterable, TPrint print) {
  bool first = true;
  for (const auto &item : iterable) {
    if (!first) os << ", ";
    first = false;
    print(item);
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Value &value) {
  const auto print_value = [&os](const Value &v) { os << v; };
  const auto print_fields = [&os](const Fields &fields, std::string_view separator) {
    PrintJoined(os, fields, [&](const auto &field) { os << field.first << separator << field.second; });
  };

  switch (value.type()) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::Int:
      return os << value.ValueInt();
    case Value::Type::UInt:
      return os << value.ValueUInt() << 'u';
    case Value::Type::Double:
      return os << fmt::format("{}", value.ValueDouble());
    case Value::Type::String:
      PrintString(os, value.ValueString());
      return os;
    case Value::Type::Binary: {
      os << "b'";
      for (const auto byte : value.ValueBinary()) os << fmt::format("\\x{:02x}", byte);
      return os << '\'';
    }
    case Value::Type::Array:
      os << '[';
      PrintJoined(os, value.ValueArray(), print_value);
      return os << ']';
    case Value::Type::Map:
      os << '{';
      PrintJoined(os, value.ValueMap(), [&os](const auto &pair) { os << pair.first << ": " << pair.second; });
      return os << '}';
    case Value::Type::DateTime:
      return os << "datetime(" << value.ValueDateTime() << ')';
    case Value::Type::Date:
      return os << "date(" << value.ValueDate() << ')';
    case Value::Type::LocalTime:
      return os << "time(" << value.ValueLocalTime() << ')';
    case Value::Type::Duration:
      return os << "duration(" << value.ValueDuration() << ')';
    case Value::Type::Decimal:
      return os << "decimal(" << value.ValueDecimal() << ')';
    case Value::Type::Uuid:
      return os << "uuid(" << value.ValueUuid() << ')';
    case Value::Type::Enum: {
      const auto &member = value.ValueEnum();
      return os << member.type_name << '.' << member.name << '(' << *member.value << ')';
    }
    case Value::Type::Record: {
      const auto &record = value.ValueRecord();
      os << record.type_name << '{';
      print_fields(record.fields, ": ");
      return os << '}';
    }
    case Value::Type::NamedTuple: {
      const auto &record = value.ValueRecord();
      os << record.type_name << '(';
      print_fields(record.fields, "=");
      return os << ')';
    }
    case Value::Type::Set:
    case Value::Type::FrozenSet:
      os << (value.IsSet() ? "set{" : "frozenset{");
      PrintJoined(os, value.ValueSet(), print_value);
      return os << '}';
    case Value::Type::Tuple:
      os << '(';
      PrintJoined(os, value.ValueTuple(), print_value);
      if (value.ValueTuple().size() == 1) os << ',';
      return os << ')';
    case Value::Type::Object:
      return os << '<' << value.ValueObject()->TypeName() << " object>";
  }
  return os;
}

}  // namespace fastpack
