#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

#include <google/protobuf/message.h>

namespace regstore {

/** Wall-clock instant with nanosecond resolution. */
using Timestamp =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

inline Timestamp TimestampNow() {
  return std::chrono::time_point_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now());
}

/** String-to-string map field, persisted as a nested bucket. */
using StringMap = std::map<std::string, std::string>;

/** Decoded protobuf message. The concrete type comes from the schema. */
using MessagePtr = std::shared_ptr<const google::protobuf::Message>;

/**
 * The closed set of field kinds a record may carry.
 *
 * The order matches the alternatives of Value (shifted by one for the
 * leading "no value" alternative).
 */
enum class FieldKind : uint8_t {
  kString,
  kBool,
  kInt8,
  kInt16,
  kInt32,
  kInt64,
  kUint8,
  kUint16,
  kUint32,
  kUint64,
  kTimestamp,
  kMessage,
  kStringMap
};

/**
 * A single field value.
 *
 * std::monostate means "no value": the field was absent, carried an
 * unrecognized tag, or (in a property map) has no supported runtime type.
 */
using Value = std::variant<std::monostate,
                           std::string,
                           bool,
                           int8_t,
                           int16_t,
                           int32_t,
                           int64_t,
                           uint8_t,
                           uint16_t,
                           uint32_t,
                           uint64_t,
                           Timestamp,
                           MessagePtr,
                           StringMap>;

inline bool HasValue(const Value& v) {
  return !std::holds_alternative<std::monostate>(v);
}

/** Kind of a non-empty value. Undefined for std::monostate. */
inline FieldKind KindOf(const Value& v) {
  return static_cast<FieldKind>(v.index() - 1);
}

inline const char* FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kString:    return "string";
    case FieldKind::kBool:      return "bool";
    case FieldKind::kInt8:      return "int8";
    case FieldKind::kInt16:     return "int16";
    case FieldKind::kInt32:     return "int32";
    case FieldKind::kInt64:     return "int64";
    case FieldKind::kUint8:     return "uint8";
    case FieldKind::kUint16:    return "uint16";
    case FieldKind::kUint32:    return "uint32";
    case FieldKind::kUint64:    return "uint64";
    case FieldKind::kTimestamp: return "timestamp";
    case FieldKind::kMessage:   return "message";
    case FieldKind::kStringMap: return "map<string,string>";
  }
  return "unknown";
}

}  // namespace regstore
