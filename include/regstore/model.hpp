#pragma once

#include <cstdint>
#include <string>

#include <regstore/location.pb.h>
#include <regstore/schema.hpp>
#include <regstore/value.hpp>

namespace regstore::model {

// Type buckets used by the control plane.
constexpr const char* kNamespaceType = "namespace";
constexpr const char* kServiceType = "service";
constexpr const char* kLocationType = "location";

struct Namespace {
  std::string name;
  std::string comment;
  std::string token;
  std::string owner;
  bool valid = false;
  Timestamp create_time;
  Timestamp modify_time;
};

struct Service {
  std::string id;
  std::string name;
  std::string namespace_name;
  std::string comment;
  std::string token;
  std::string owner;
  StringMap meta;
  std::string revision;
  bool valid = false;
  Timestamp create_time;
  Timestamp modify_time;
};

struct Location {
  api::Location proto;
  uint32_t region_id = 0;
  uint32_t zone_id = 0;
  uint32_t campus_id = 0;
  bool valid = false;
};

// Shared, lazily built schemas. Field names are the persisted bucket keys.
const Schema<Namespace>& NamespaceSchema();
const Schema<Service>& ServiceSchema();
const Schema<Location>& LocationSchema();

}  // namespace regstore::model
