#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <google/protobuf/message.h>
#include <spdlog/spdlog.h>

#include <regstore/value.hpp>

namespace regstore {

/** One field of a record shape. */
struct FieldDescriptor {
  std::string name;
  FieldKind kind = FieldKind::kString;

  // Default instance of the field's message type (kMessage only). Decoding
  // allocates a fresh message of this type via New().
  std::shared_ptr<const google::protobuf::Message> message_prototype;
};

/** One Value per schema field, in schema order. */
using RecordValues = std::vector<Value>;

/**
 * Type-erased description of a record shape.
 *
 * This is what the codec and the store work on. Typed code builds a
 * Schema<Record>, which is-a SchemaBase.
 */
class SchemaBase {
 public:
  explicit SchemaBase(std::string name) : name_(std::move(name)) {}
  virtual ~SchemaBase() = default;

  const std::string& name() const { return name_; }
  const std::vector<FieldDescriptor>& fields() const { return fields_; }

  /** Index of field_name, or -1 if the shape has no such field. */
  int FieldIndex(std::string_view field_name) const {
    auto it = index_.find(std::string(field_name));
    return it == index_.end() ? -1 : it->second;
  }

  const FieldDescriptor* FindField(std::string_view field_name) const {
    int idx = FieldIndex(field_name);
    return idx < 0 ? nullptr : &fields_[static_cast<size_t>(idx)];
  }

 protected:
  bool AddDescriptor(FieldDescriptor d) {
    if (index_.count(d.name) != 0) {
      spdlog::error("[regstore] duplicate field {} in schema {}", d.name, name_);
      return false;
    }
    index_.emplace(d.name, static_cast<int>(fields_.size()));
    fields_.push_back(std::move(d));
    return true;
  }

 private:
  std::string name_;
  std::vector<FieldDescriptor> fields_;
  std::unordered_map<std::string, int> index_;
};

// ---------------------------------------------------------------------------
// Member type -> FieldKind
// ---------------------------------------------------------------------------

template <typename T, typename = void>
struct FieldTraits;  // unsupported member type

template <typename T, FieldKind K>
struct ScalarFieldTraits {
  static constexpr FieldKind kKind = K;
  static Value ToValue(const T& member) { return Value(std::in_place_type<T>, member); }
  static bool FromValue(const Value& v, T* member) {
    const T* p = std::get_if<T>(&v);
    if (!p) return false;
    *member = *p;
    return true;
  }
};

template <> struct FieldTraits<std::string> : ScalarFieldTraits<std::string, FieldKind::kString> {};
template <> struct FieldTraits<bool> : ScalarFieldTraits<bool, FieldKind::kBool> {};
template <> struct FieldTraits<int8_t> : ScalarFieldTraits<int8_t, FieldKind::kInt8> {};
template <> struct FieldTraits<int16_t> : ScalarFieldTraits<int16_t, FieldKind::kInt16> {};
template <> struct FieldTraits<int32_t> : ScalarFieldTraits<int32_t, FieldKind::kInt32> {};
template <> struct FieldTraits<int64_t> : ScalarFieldTraits<int64_t, FieldKind::kInt64> {};
template <> struct FieldTraits<uint8_t> : ScalarFieldTraits<uint8_t, FieldKind::kUint8> {};
template <> struct FieldTraits<uint16_t> : ScalarFieldTraits<uint16_t, FieldKind::kUint16> {};
template <> struct FieldTraits<uint32_t> : ScalarFieldTraits<uint32_t, FieldKind::kUint32> {};
template <> struct FieldTraits<uint64_t> : ScalarFieldTraits<uint64_t, FieldKind::kUint64> {};
template <> struct FieldTraits<Timestamp> : ScalarFieldTraits<Timestamp, FieldKind::kTimestamp> {};
template <> struct FieldTraits<StringMap> : ScalarFieldTraits<StringMap, FieldKind::kStringMap> {};

template <typename T>
struct FieldTraits<T, std::enable_if_t<std::is_base_of_v<google::protobuf::Message, T>>> {
  static constexpr FieldKind kKind = FieldKind::kMessage;
  static Value ToValue(const T& member) { return MessagePtr(std::make_shared<T>(member)); }
  static bool FromValue(const Value& v, T* member) {
    const MessagePtr* p = std::get_if<MessagePtr>(&v);
    if (!p || !*p) return false;
    if ((*p)->GetDescriptor() != member->GetDescriptor()) return false;
    member->CopyFrom(**p);
    return true;
  }
};

/**
 * Schema of a concrete record type, built once by registering members:
 *
 *   Schema<Namespace> schema("Namespace");
 *   schema.Field("Name", &Namespace::name)
 *         .Field("CreateTime", &Namespace::create_time);
 *
 * The member type picks the field kind at compile time.
 */
template <typename Record>
class Schema : public SchemaBase {
 public:
  explicit Schema(std::string name) : SchemaBase(std::move(name)) {}

  template <typename T>
  Schema& Field(std::string field_name, T Record::*member) {
    using Traits = FieldTraits<T>;
    FieldDescriptor d;
    d.name = std::move(field_name);
    d.kind = Traits::kKind;
    if constexpr (Traits::kKind == FieldKind::kMessage) {
      d.message_prototype = std::make_shared<T>();
    }
    if (!AddDescriptor(std::move(d))) return *this;
    getters_.push_back([member](const Record& r) { return Traits::ToValue(r.*member); });
    setters_.push_back([member](const Value& v, Record* r) {
      return Traits::FromValue(v, &(r->*member));
    });
    return *this;
  }

  RecordValues ToValues(const Record& record) const {
    RecordValues values;
    values.reserve(getters_.size());
    for (const auto& get : getters_) values.push_back(get(record));
    return values;
  }

  /**
   * Build a record from decoded values. Absent values leave the member at its
   * default; a value of the wrong kind is skipped with a warning.
   */
  Record FromValues(const RecordValues& values) const {
    Record record{};
    const size_t n = std::min(values.size(), setters_.size());
    for (size_t i = 0; i < n; ++i) {
      if (!HasValue(values[i])) continue;
      if (!setters_[i](values[i], &record)) {
        const FieldDescriptor& d = fields()[i];
        spdlog::warn("[regstore] field {} of {} holds {}, want {}; skipped",
                     d.name, name(), FieldKindName(KindOf(values[i])),
                     FieldKindName(d.kind));
      }
    }
    return record;
  }

 private:
  std::vector<std::function<Value(const Record&)>> getters_;
  std::vector<std::function<bool(const Value&, Record*)>> setters_;
};

}  // namespace regstore
