#include <regstore/tag_codec.hpp>

#include <memory>

#include <regstore/internal.hpp>

namespace regstore {

namespace {

template <typename T>
void EncodeInteger(TypeTag tag, T v, std::string* out) {
  out->push_back(static_cast<char>(tag));
  internal::AppendFixedLE(out, v);
}

template <typename T>
rocksdb::Status DecodeInteger(std::string_view payload, Value* out) {
  T v = 0;
  if (!internal::DecodeFixedLE(payload, &v)) {
    return rocksdb::Status::Corruption("integer payload has wrong width");
  }
  *out = v;
  return rocksdb::Status::OK();
}

}  // namespace

bool IsKnownTag(uint8_t byte) {
  return byte >= static_cast<uint8_t>(TypeTag::kString) &&
         byte <= static_cast<uint8_t>(TypeTag::kUint64);
}

const char* TypeTagName(uint8_t byte) {
  if (!IsKnownTag(byte)) return "unknown";
  switch (static_cast<TypeTag>(byte)) {
    case TypeTag::kString:    return "string";
    case TypeTag::kBool:      return "bool";
    case TypeTag::kTimestamp: return "timestamp";
    case TypeTag::kProtobuf:  return "protobuf";
    case TypeTag::kInt8:      return "int8";
    case TypeTag::kInt16:     return "int16";
    case TypeTag::kInt32:     return "int32";
    case TypeTag::kInt64:     return "int64";
    case TypeTag::kUint8:     return "uint8";
    case TypeTag::kUint16:    return "uint16";
    case TypeTag::kUint32:    return "uint32";
    case TypeTag::kUint64:    return "uint64";
  }
  return "unknown";
}

rocksdb::Status EncodeTagged(const Value& value, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  switch (value.index()) {
    case 0:
      return rocksdb::Status::InvalidArgument("no value to encode");
    case 1: {
      const auto& s = std::get<std::string>(value);
      out->reserve(1 + s.size());
      out->push_back(static_cast<char>(TypeTag::kString));
      out->append(s);
      return rocksdb::Status::OK();
    }
    case 2:
      out->push_back(static_cast<char>(TypeTag::kBool));
      out->push_back(std::get<bool>(value) ? '\x01' : '\x00');
      return rocksdb::Status::OK();
    case 3: EncodeInteger(TypeTag::kInt8, std::get<int8_t>(value), out); break;
    case 4: EncodeInteger(TypeTag::kInt16, std::get<int16_t>(value), out); break;
    case 5: EncodeInteger(TypeTag::kInt32, std::get<int32_t>(value), out); break;
    case 6: EncodeInteger(TypeTag::kInt64, std::get<int64_t>(value), out); break;
    case 7: EncodeInteger(TypeTag::kUint8, std::get<uint8_t>(value), out); break;
    case 8: EncodeInteger(TypeTag::kUint16, std::get<uint16_t>(value), out); break;
    case 9: EncodeInteger(TypeTag::kUint32, std::get<uint32_t>(value), out); break;
    case 10: EncodeInteger(TypeTag::kUint64, std::get<uint64_t>(value), out); break;
    case 11: {
      const int64_t nanos = std::get<Timestamp>(value).time_since_epoch().count();
      EncodeInteger(TypeTag::kTimestamp, nanos, out);
      break;
    }
    case 12: {
      const auto& msg = std::get<MessagePtr>(value);
      if (!msg) return rocksdb::Status::InvalidArgument("message value is null");
      std::string payload;
      if (!msg->SerializeToString(&payload)) {
        return rocksdb::Status::InvalidArgument(
            "failed to serialize message " + msg->GetTypeName());
      }
      out->reserve(1 + payload.size());
      out->push_back(static_cast<char>(TypeTag::kProtobuf));
      out->append(payload);
      break;
    }
    default:
      return rocksdb::Status::InvalidArgument(
          "map fields are stored as nested buckets, not tagged buffers");
  }
  return rocksdb::Status::OK();
}

rocksdb::Status DecodeTagged(std::string_view buffer,
                             const google::protobuf::Message* message_prototype,
                             Value* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (buffer.empty()) {
    return rocksdb::Status::InvalidArgument("tagged buffer is empty");
  }

  const uint8_t tag = static_cast<uint8_t>(buffer[0]);
  const std::string_view payload = buffer.substr(1);

  if (!IsKnownTag(tag)) {
    *out = std::monostate{};
    return rocksdb::Status::OK();
  }

  switch (static_cast<TypeTag>(tag)) {
    case TypeTag::kString:
      *out = std::string(payload);
      return rocksdb::Status::OK();
    case TypeTag::kBool:
      if (payload.size() != 1) {
        return rocksdb::Status::Corruption("bool payload has wrong width");
      }
      *out = payload[0] != '\0';
      return rocksdb::Status::OK();
    case TypeTag::kTimestamp: {
      int64_t nanos = 0;
      if (!internal::DecodeFixedLE(payload, &nanos)) {
        return rocksdb::Status::Corruption("timestamp payload has wrong width");
      }
      *out = Timestamp(std::chrono::nanoseconds(nanos));
      return rocksdb::Status::OK();
    }
    case TypeTag::kProtobuf: {
      if (!message_prototype) {
        return rocksdb::Status::InvalidArgument(
            "message tag found but no message type to decode into");
      }
      std::shared_ptr<google::protobuf::Message> msg(message_prototype->New());
      if (!msg->ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        return rocksdb::Status::Corruption(
            "failed to parse message " + message_prototype->GetTypeName());
      }
      *out = MessagePtr(std::move(msg));
      return rocksdb::Status::OK();
    }
    case TypeTag::kInt8:   return DecodeInteger<int8_t>(payload, out);
    case TypeTag::kInt16:  return DecodeInteger<int16_t>(payload, out);
    case TypeTag::kInt32:  return DecodeInteger<int32_t>(payload, out);
    case TypeTag::kInt64:  return DecodeInteger<int64_t>(payload, out);
    case TypeTag::kUint8:  return DecodeInteger<uint8_t>(payload, out);
    case TypeTag::kUint16: return DecodeInteger<uint16_t>(payload, out);
    case TypeTag::kUint32: return DecodeInteger<uint32_t>(payload, out);
    case TypeTag::kUint64: return DecodeInteger<uint64_t>(payload, out);
  }

  *out = std::monostate{};
  return rocksdb::Status::OK();
}

}  // namespace regstore
