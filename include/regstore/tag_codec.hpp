#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>
#include <rocksdb/status.h>

#include <regstore/value.hpp>

namespace regstore {

/**
 * Discriminant byte at the head of every tagged buffer.
 *
 * These values are part of the persisted format and must never be reused.
 */
enum class TypeTag : uint8_t {
  kString    = 0x01,
  kBool      = 0x02,
  kTimestamp = 0x03,
  kProtobuf  = 0x04,
  kInt8      = 0x05,
  kInt16     = 0x06,
  kInt32     = 0x07,
  kInt64     = 0x08,
  kUint8     = 0x09,
  kUint16    = 0x0a,
  kUint32    = 0x0b,
  kUint64    = 0x0c,
};

/** True if byte is one of the TypeTag values. */
bool IsKnownTag(uint8_t byte);

/** Printable name of a tag byte ("unknown" for anything unrecognized). */
const char* TypeTagName(uint8_t byte);

/**
 * Encode a scalar or message value into a tagged buffer.
 *
 * String maps have no tagged form (they are stored as nested buckets) and
 * std::monostate has nothing to encode; both return InvalidArgument.
 */
rocksdb::Status EncodeTagged(const Value& value, std::string* out);

/**
 * Decode a tagged buffer, dispatching on its first byte only.
 *
 * message_prototype is consulted only when the tag is kProtobuf; a null
 * prototype in that case is InvalidArgument. An unrecognized tag yields OK
 * with *out set to std::monostate. A payload whose size does not fit its tag
 * is Corruption.
 */
rocksdb::Status DecodeTagged(std::string_view buffer,
                             const google::protobuf::Message* message_prototype,
                             Value* out);

}  // namespace regstore
