#pragma once

#include <string>
#include <string_view>

namespace regstore {

// Field names are already unique within one record shape, so the mapping to
// bucket keys is the identity. Every read and write path goes through these
// two functions so that the mapping can only change in one place.

inline std::string ToBucketKey(std::string_view field_name) {
  return std::string(field_name);
}

inline std::string FromBucketKey(std::string_view bucket_key) {
  return std::string(bucket_key);
}

}  // namespace regstore
