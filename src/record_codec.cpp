#include <regstore/record_codec.hpp>

#include <spdlog/spdlog.h>

#include <regstore/field_mapper.hpp>
#include <regstore/tag_codec.hpp>

namespace regstore {

namespace {

rocksdb::Status WriteRawMap(Bucket* bucket, const std::string& bucket_key, const StringMap& entries) {
  Bucket sub;
  rocksdb::Status s = bucket->CreateBucket(bucket_key, &sub);
  if (!s.ok()) return s;
  for (const auto& [k, v] : entries) {
    s = sub.Put(k, v);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

rocksdb::Status ReadRawMap(const Bucket& bucket, const std::string& bucket_key, Value* out) {
  Bucket sub;
  rocksdb::Status s = bucket.GetBucket(bucket_key, &sub);
  if (s.IsNotFound()) {
    *out = std::monostate{};
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;

  StringMap entries;
  s = sub.ForEach([&](std::string_view k, std::string_view v) {
    entries.emplace(std::string(k), std::string(v));
    return rocksdb::Status::OK();
  });
  if (!s.ok()) return s;
  *out = std::move(entries);
  return rocksdb::Status::OK();
}

// Flat entry first, nested bucket second. Shared by full and single-field reads.
rocksdb::Status ResolveField(const Bucket& bucket,
                             const SchemaBase& schema,
                             const FieldDescriptor& field,
                             Value* out) {
  const std::string bucket_key = ToBucketKey(field.name);

  std::string buffer;
  rocksdb::Status s = bucket.Get(bucket_key, &buffer);
  if (!s.ok() && !s.IsNotFound()) return s;
  if (s.IsNotFound() || buffer.empty()) return ReadRawMap(bucket, bucket_key, out);

  const uint8_t tag = static_cast<uint8_t>(buffer[0]);
  if (tag == static_cast<uint8_t>(TypeTag::kProtobuf) && field.kind != FieldKind::kMessage) {
    return rocksdb::Status::InvalidArgument(
        "field " + field.name + " type not match in object " + schema.name() +
        ", want message, get " + FieldKindName(field.kind));
  }

  s = DecodeTagged(buffer, field.message_prototype.get(), out);
  if (!s.ok()) {
    return rocksdb::Status::Corruption("field " + field.name + " of " + schema.name() + ": " +
                                       s.ToString());
  }
  if (!HasValue(*out)) {
    spdlog::warn("[regstore] unrecognized field {} of {}, type is {}",
                 field.name, schema.name(), static_cast<int>(tag));
  }
  return rocksdb::Status::OK();
}

}  // namespace

rocksdb::Status SerializeRecord(const SchemaBase& schema,
                                const RecordValues& values,
                                Bucket* bucket,
                                std::map<std::string, std::string>* buffers) {
  if (!bucket) return rocksdb::Status::InvalidArgument("bucket is null");
  if (!buffers) return rocksdb::Status::InvalidArgument("buffers is null");

  const auto& fields = schema.fields();
  if (values.size() != fields.size()) {
    return rocksdb::Status::InvalidArgument(
        "record has " + std::to_string(values.size()) + " values, schema " + schema.name() +
        " has " + std::to_string(fields.size()) + " fields");
  }

  for (size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& field = fields[i];
    const Value& value = values[i];
    if (!HasValue(value)) continue;

    if (KindOf(value) != field.kind) {
      return rocksdb::Status::InvalidArgument(
          "field " + field.name + " of " + schema.name() + " holds " +
          FieldKindName(KindOf(value)) + ", want " + FieldKindName(field.kind));
    }

    const std::string bucket_key = ToBucketKey(field.name);
    if (field.kind == FieldKind::kStringMap) {
      const auto& entries = std::get<StringMap>(value);
      if (entries.empty()) continue;
      rocksdb::Status s = WriteRawMap(bucket, bucket_key, entries);
      if (!s.ok()) return s;
      continue;
    }

    std::string buffer;
    rocksdb::Status s = EncodeTagged(value, &buffer);
    if (!s.ok()) return s;
    (*buffers)[bucket_key] = std::move(buffer);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status DeserializeRecord(const Bucket& bucket,
                                  const SchemaBase& schema,
                                  RecordValues* values) {
  if (!values) return rocksdb::Status::InvalidArgument("values is null");

  const auto& fields = schema.fields();
  RecordValues out(fields.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    rocksdb::Status s = ResolveField(bucket, schema, fields[i], &out[i]);
    if (!s.ok()) return s;
  }
  *values = std::move(out);
  return rocksdb::Status::OK();
}

rocksdb::Status ReadField(const Bucket& bucket,
                          const SchemaBase& schema,
                          std::string_view field_name,
                          Value* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  const FieldDescriptor* field = schema.FindField(field_name);
  if (!field) {
    return rocksdb::Status::InvalidArgument(
        "field " + std::string(field_name) + " not found in object " + schema.name());
  }
  return ResolveField(bucket, schema, *field, out);
}

rocksdb::Status WriteField(Bucket* bucket, std::string_view field_name, const Value& value) {
  if (!bucket) return rocksdb::Status::InvalidArgument("bucket is null");
  if (!HasValue(value)) return rocksdb::Status::OK();

  const std::string bucket_key = ToBucketKey(field_name);
  if (const StringMap* entries = std::get_if<StringMap>(&value)) {
    bool exists = false;
    rocksdb::Status s = bucket->HasBucket(bucket_key, &exists);
    if (!s.ok()) return s;
    if (exists) {
      s = bucket->DeleteBucket(bucket_key);
      if (!s.ok()) return s;
    }
    if (entries->empty()) return rocksdb::Status::OK();
    return WriteRawMap(bucket, bucket_key, *entries);
  }

  std::string buffer;
  rocksdb::Status s = EncodeTagged(value, &buffer);
  if (!s.ok()) return s;
  return bucket->Put(bucket_key, buffer);
}

}  // namespace regstore
