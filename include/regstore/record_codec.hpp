#pragma once

#include <map>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

#include <regstore/bucket.hpp>
#include <regstore/schema.hpp>
#include <regstore/value.hpp>

namespace regstore {

/** Field name -> value, as handed to filter predicates and partial updates. */
using FieldValues = std::map<std::string, Value>;

/**
 * Serialize one record into bucket.
 *
 * Scalar and message fields are tag-encoded into *buffers (bucket key ->
 * tagged buffer); the caller writes them. String-map fields are written here,
 * directly, as nested buckets of raw entries. An empty map produces no nested
 * bucket.
 */
rocksdb::Status SerializeRecord(const SchemaBase& schema,
                                const RecordValues& values,
                                Bucket* bucket,
                                std::map<std::string, std::string>* buffers);

/**
 * Deserialize the record held in bucket. Fields absent from the bucket come
 * back as std::monostate.
 */
rocksdb::Status DeserializeRecord(const Bucket& bucket,
                                  const SchemaBase& schema,
                                  RecordValues* values);

/**
 * Read one field without materializing the record.
 *
 * InvalidArgument if the schema has no such field, or if the stored value is
 * a message but the field is not message-typed.
 */
rocksdb::Status ReadField(const Bucket& bucket,
                          const SchemaBase& schema,
                          std::string_view field_name,
                          Value* out);

/**
 * Overwrite a single field, dispatching on the value's own kind. A value with
 * no supported kind (std::monostate) is not written.
 */
rocksdb::Status WriteField(Bucket* bucket, std::string_view field_name, const Value& value);

}  // namespace regstore
