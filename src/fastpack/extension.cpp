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


#include "fastpack/extension.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include "utils/logging.hpp"

namespace fastpack {

namespace {

const Array &ExpectArray(const Value &payload, size_t size) {
  if (!payload.IsArray() || payload.ValueArray().size() != size) {
    throw InvalidPayloadException("expected an array of {} elements, got a {}", size, TypeToString(payload.type()));
  }
  return payload.ValueArray();
}

int64_t ExpectInt(const Value &value, std::string_view what) {
  if (!value.IsInt()) {
    throw InvalidPayloadException("expected an integer {}, got a {}", what, TypeToString(value.type()));
  }
  return value.ValueInt();
}

const std::string &ExpectString(const Value &value, std::string_view what) {
  if (!value.IsString()) {
    throw InvalidPayloadException("expected a string {}, got a {}", what, TypeToString(value.type()));
  }
  return value.ValueString();
}

Value FieldsToMap(const Fields &fields) {
  Map map;
  map.reserve(fields.size());
  for (const auto &[name, value] : fields) map.emplace_back(Value(name), value);
  return Value(std::move(map));
}

Fields MapToFields(const Value &value) {
  if (!value.IsMap()) {
    throw InvalidPayloadException("expected a map of fields, got a {}", TypeToString(value.type()));
  }
  Fields fields;
  fields.reserve(value.ValueMap().size());
  for (const auto &[key, field] : value.ValueMap()) {
    fields.emplace_back(ExpectString(key, "field name"), field);
  }
  return fields;
}

Value EncodeRecord(const Value &value, const ExtensionRegistry & /*registry*/) {
  const auto &record = value.ValueRecord();
  return Value(Array{Value(record.type_name), FieldsToMap(record.fields)});
}

Record DecodeRecord(const Value &payload) {
  const auto &array = ExpectArray(payload, 2);
  return {ExpectString(array[0], "type name"), MapToFields(array[1])};
}

Value EncodeElements(const Value &value, const ExtensionRegistry & /*registry*/) { return Value(value.Elements()); }

const Array &DecodeElements(const Value &payload) {
  if (!payload.IsArray()) {
    throw InvalidPayloadException("expected an array of elements, got a {}", TypeToString(payload.type()));
  }
  return payload.ValueArray();
}

const std::array<ExtensionHandler, 13> &BuiltinHandlers() {
  static const std::array<ExtensionHandler, 13> handlers{{
      {ExtensionTag::DateTime,
       [](const Value &value, const ExtensionRegistry &) {
         const auto &datetime = value.ValueDateTime();
         return Value(Array{Value(datetime.microseconds),
                            datetime.utc_offset_seconds ? Value(*datetime.utc_offset_seconds) : Value()});
       },
       [](Value payload, const ExtensionRegistry &) {
         const auto &array = ExpectArray(payload, 2);
         const auto microseconds = ExpectInt(array[0], "timestamp");
         std::optional<int32_t> offset;
         if (!array[1].IsNull()) {
           const auto offset_seconds = ExpectInt(array[1], "UTC offset");
           if (offset_seconds < std::numeric_limits<int32_t>::min() ||
               offset_seconds > std::numeric_limits<int32_t>::max()) {
             throw InvalidPayloadException("UTC offset of {} seconds is out of range", offset_seconds);
           }
           offset = static_cast<int32_t>(offset_seconds);
         }
         return Value(utils::DateTime(microseconds, offset));
       }},
      {ExtensionTag::Date,
       [](const Value &value, const ExtensionRegistry &) {
         const auto &date = value.ValueDate();
         return Value(Array{Value(static_cast<int64_t>(date.year)), Value(static_cast<int64_t>(date.month)),
                            Value(static_cast<int64_t>(date.day))});
       },
       [](Value payload, const ExtensionRegistry &) {
         const auto &array = ExpectArray(payload, 3);
         return Value(utils::Date(ExpectInt(array[0], "year"), ExpectInt(array[1], "month"),
                                  ExpectInt(array[2], "day")));
       }},
      {ExtensionTag::LocalTime,
       [](const Value &value, const ExtensionRegistry &) {
         const auto &time = value.ValueLocalTime();
         return Value(Array{Value(static_cast<int64_t>(time.hour)), Value(static_cast<int64_t>(time.minute)),
                            Value(static_cast<int64_t>(time.second)), Value(static_cast<int64_t>(time.microsecond))});
       },
       [](Value payload, const ExtensionRegistry &) {
         const auto &array = ExpectArray(payload, 4);
         return Value(utils::LocalTime(ExpectInt(array[0], "hour"), ExpectInt(array[1], "minute"),
                                       ExpectInt(array[2], "second"), ExpectInt(array[3], "microsecond")));
       }},
      {ExtensionTag::Duration,
       [](const Value &value, const ExtensionRegistry &) { return Value(value.ValueDuration().microseconds); },
       [](Value payload, const ExtensionRegistry &) {
         return Value(utils::Duration(ExpectInt(payload, "duration")));
       }},
      {ExtensionTag::Decimal,
       [](const Value &value, const ExtensionRegistry &) { return Value(value.ValueDecimal().ToString()); },
       [](Value payload, const ExtensionRegistry &) {
         return Value(utils::Decimal::Parse(ExpectString(payload, "decimal")));
       }},
      {ExtensionTag::Uuid,
       [](const Value &value, const ExtensionRegistry &) {
         const auto &bytes = value.ValueUuid().bytes();
         return Value(Binary(bytes.begin(), bytes.end()));
       },
       [](Value payload, const ExtensionRegistry &) {
         if (!payload.IsBinary()) {
           throw InvalidPayloadException("expected 16 bytes of binary, got a {}", TypeToString(payload.type()));
         }
         return Value(utils::Uuid::FromBytes(payload.ValueBinary()));
       }},
      {ExtensionTag::Enum,
       [](const Value &value, const ExtensionRegistry &) {
         const auto &member = value.ValueEnum();
         return Value(Array{Value(member.type_name), Value(member.name), *member.value});
       },
       [](Value payload, const ExtensionRegistry &) {
         const auto &array = ExpectArray(payload, 3);
         return Value(EnumMember(ExpectString(array[0], "enum type"), ExpectString(array[1], "member name"), array[2]));
       }},
      {ExtensionTag::Record, EncodeRecord,
       [](Value payload, const ExtensionRegistry &) { return Value(DecodeRecord(payload)); }},
      {ExtensionTag::NamedTuple, EncodeRecord,
       [](Value payload, const ExtensionRegistry &) { return Value::MakeNamedTuple(DecodeRecord(payload)); }},
      {ExtensionTag::Set, EncodeElements,
       [](Value payload, const ExtensionRegistry &) { return Value::MakeSet(DecodeElements(payload)); }},
      {ExtensionTag::FrozenSet, EncodeElements,
       [](Value payload, const ExtensionRegistry &) { return Value::MakeFrozenSet(DecodeElements(payload)); }},
      {ExtensionTag::Tuple, EncodeElements,
       [](Value payload, const ExtensionRegistry &) { return Value::MakeTuple(DecodeElements(payload)); }},
      {ExtensionTag::Object,
       [](const Value &value, const ExtensionRegistry &registry) {
         const auto &object = *value.ValueObject();
         auto handler = registry.ResolveObject(object.TypeName());
         if (!handler) throw EncodeException("Unregistered type '{}'.", object.TypeName());
         return Value(Array{Value(object.TypeName()), FieldsToMap(handler->encode(object))});
       },
       [](Value payload, const ExtensionRegistry &registry) {
         const auto &array = ExpectArray(payload, 2);
         const auto &qualifier = ExpectString(array[0], "type qualifier");
         auto handler = registry.ResolveObject(qualifier);
         if (!handler) throw UnregisteredTypeException(qualifier);
         auto object = handler->decode(MapToFields(array[1]));
         if (!object) throw InvalidPayloadException("decoder for type '{}' returned no object", qualifier);
         return Value(std::move(object));
       }},
  }};
  return handlers;
}

std::optional<ExtensionHandler> FindBuiltin(int8_t tag) {
  const auto &handlers = BuiltinHandlers();
  const auto it = std::find_if(handlers.begin(), handlers.end(),
                               [tag](const auto &handler) { return utils::UnderlyingCast(handler.tag) == tag; });
  if (it == handlers.end()) return std::nullopt;
  return *it;
}

std::optional<ExtensionTag> TagForType(Value::Type type) {
  switch (type) {
    case Value::Type::DateTime:
      return ExtensionTag::DateTime;
    case Value::Type::Date:
      return ExtensionTag::Date;
    case Value::Type::LocalTime:
      return ExtensionTag::LocalTime;
    case Value::Type::Duration:
      return ExtensionTag::Duration;
    case Value::Type::Decimal:
      return ExtensionTag::Decimal;
    case Value::Type::Uuid:
      return ExtensionTag::Uuid;
    case Value::Type::Enum:
      return ExtensionTag::Enum;
    case Value::Type::Record:
      return ExtensionTag::Record;
    case Value::Type::NamedTuple:
      return ExtensionTag::NamedTuple;
    case Value::Type::Set:
      return ExtensionTag::Set;
    case Value::Type::FrozenSet:
      return ExtensionTag::FrozenSet;
    case Value::Type::Tuple:
      return ExtensionTag::Tuple;
    case Value::Type::Object:
      return ExtensionTag::Object;
    default:
      return std::nullopt;
  }
}

}  // namespace

ExtensionRegistry &ExtensionRegistry::Global() {
  static ExtensionRegistry registry;
  return registry;
}

void ExtensionRegistry::Register(std::string qualifier, ObjectEncoder encoder, ObjectDecoder decoder) {
  if (qualifier.empty()) throw RegistrationException("A registered type needs a non-empty qualifier.");
  if (!encoder || !decoder) {
    throw RegistrationException("Type '{}' needs both an encode and a decode function.", qualifier);
  }
  auto objects = objects_.Lock();
  const auto [it, inserted] =
      objects->insert_or_assign(std::move(qualifier), ObjectHandler{std::move(encoder), std::move(decoder)});
  spdlog::debug("{} extension type '{}'", inserted ? "Registered" : "Replaced", it->first);
}

void ExtensionRegistry::Clear() {
  auto objects = objects_.Lock();
  spdlog::debug("Clearing {} registered extension types", objects->size());
  objects->clear();
}

bool ExtensionRegistry::IsRegistered(std::string_view qualifier) const {
  return objects_.WithReadLock([&](const auto &objects) { return objects.find(qualifier) != objects.end(); });
}

size_t ExtensionRegistry::Size() const {
  return objects_.WithReadLock([](const auto &objects) { return objects.size(); });
}

std::optional<ExtensionHandler> ExtensionRegistry::ResolveEncoder(const Value &value) const {
  const auto tag = TagForType(value.type());
  if (!tag) return std::nullopt;
  if (*tag == ExtensionTag::Object && !IsRegistered(value.ValueObject()->TypeName())) return std::nullopt;
  return FindBuiltin(utils::UnderlyingCast(*tag));
}

std::optional<ExtensionHandler> ExtensionRegistry::ResolveDecoder(int8_t tag) const { return FindBuiltin(tag); }

std::optional<ObjectHandler> ExtensionRegistry::ResolveObject(std::string_view qualifier) const {
  return objects_.WithReadLock([&](const auto &objects) -> std::optional<ObjectHandler> {
    const auto it = objects.find(qualifier);
    if (it == objects.end()) return std::nullopt;
    return it->second;
  });
}

}  // namespace fastpack
