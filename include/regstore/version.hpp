#pragma once

#define REGSTORE_VERSION_MAJOR 0
#define REGSTORE_VERSION_MINOR 1
#define REGSTORE_VERSION_PATCH 0

#define REGSTORE_VERSION_STRING "0.1.0"

// For compile-time version checks
#define REGSTORE_VERSION \
  (REGSTORE_VERSION_MAJOR * 10000 + REGSTORE_VERSION_MINOR * 100 + REGSTORE_VERSION_PATCH)

namespace regstore {

inline const char* Version() { return REGSTORE_VERSION_STRING; }

}  // namespace regstore
