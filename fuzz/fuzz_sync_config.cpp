// Fuzz target for the sync configuration loader
// Tests LoadSyncConfigFromString
//
// The config file is operator-supplied but may be hand-edited or generated.
// The loader must either return a config that passes ValidateSyncConfig or
// throw std::runtime_error. Anything else (crash, other exception type,
// accepted invalid config) is a bug.
//
// Target code:
// - src/sync/sync_config.cpp

#include "sync/sync_config.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace chainsync::sync;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  const std::string text(reinterpret_cast<const char*>(data), size);

  try {
    const SyncConfig config = LoadSyncConfigFromString(text);
    // Anything returned must be valid
    ValidateSyncConfig(config);
  } catch (const std::runtime_error&) {
    // Expected for malformed input
  }

  return 0;
}
