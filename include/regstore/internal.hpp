#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <rocksdb/status.h>

namespace regstore::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Fixed-width little-endian integer encoding for tagged value payloads.
template <typename T>
inline void AppendFixedLE(std::string* out, T value) {
  static_assert(std::is_integral_v<T>, "integral type required");
  using U = std::make_unsigned_t<T>;
  U v = static_cast<U>(value);
  for (size_t i = 0; i < sizeof(T); ++i) {
    out->push_back(static_cast<char>(v & 0xffu));
    v = static_cast<U>(v >> 8);
  }
}

template <typename T>
inline bool DecodeFixedLE(std::string_view s, T* out) {
  static_assert(std::is_integral_v<T>, "integral type required");
  if (s.size() != sizeof(T)) return false;
  using U = std::make_unsigned_t<T>;
  U v = 0;
  // little endian decode
  for (int i = static_cast<int>(sizeof(T)) - 1; i >= 0; --i) {
    v = static_cast<U>(v << 8);
    v = static_cast<U>(v | static_cast<uint8_t>(s[static_cast<size_t>(i)]));
  }
  *out = static_cast<T>(v);
  return true;
}

inline bool IsFileLockStatus(const rocksdb::Status& s) {
  if (!s.IsIOError() && !s.IsBusy() && !s.IsTimedOut()) return false;
  return s.ToString().find("lock") != std::string::npos;
}

// ---------------------------------------------------------------------------
// Bucket key layout
// ---------------------------------------------------------------------------
//
// A bucket is addressed by its path from the root. Its direct children live
// in one contiguous key range:
//
//   [kind:1][depth:1]{escaped component, 0x00 0x01}*depth [escaped child name]
//
// kind is kBucketMarkerKind for child buckets and kValueEntryKind for flat
// values. Escaping maps 0x00 to 0x00 0xff, so the component terminator never
// appears inside a name and key order equals byte order of the names.

constexpr char kBucketMarkerKind = 'b';
constexpr char kValueEntryKind = 'v';
constexpr size_t kMaxBucketDepth = 255;

inline void AppendEscaped(std::string* out, std::string_view name) {
  for (char c : name) {
    out->push_back(c);
    if (c == '\0') out->push_back('\xff');
  }
}

inline bool Unescape(std::string_view escaped, std::string* out) {
  out->clear();
  out->reserve(escaped.size());
  for (size_t i = 0; i < escaped.size(); ++i) {
    out->push_back(escaped[i]);
    if (escaped[i] == '\0') {
      if (i + 1 >= escaped.size() || escaped[i + 1] != '\xff') return false;
      ++i;
    }
  }
  return true;
}

// Prefix shared by every child (bucket or value) of the bucket at path.
inline std::string MakeChildPrefix(char kind, const std::vector<std::string>& path) {
  std::string key;
  key.push_back(kind);
  key.push_back(static_cast<char>(static_cast<uint8_t>(path.size())));
  for (const auto& component : path) {
    AppendEscaped(&key, component);
    key.push_back('\0');
    key.push_back('\x01');
  }
  return key;
}

inline std::string MakeChildKey(char kind,
                                const std::vector<std::string>& path,
                                std::string_view name) {
  std::string key = MakeChildPrefix(kind, path);
  AppendEscaped(&key, name);
  return key;
}

}  // namespace regstore::internal
