#pragma once

#include <cstdint>

enum class TrackerError : uint8_t {
  None = 0,
  SourceUnavailable,   // advertisement source could not be opened
  PermissionDenied,    // radio access refused by the platform
  NotListening,        // operation needs a started tracker
  UnknownDevice,       // address not in the registry
  NoPairingAgent,
  PairingFailed,
  Busy,                // start() from a tracker callback while another thread stops it
};

// Result of an optional device-info lookup made before a sighting is applied.
enum class LookupStatus : uint8_t {
  Resolved = 0,   // DeviceInfo filled in; use it
  NoData,         // nothing extra known; keep the raw sighting fields
  DeviceGone,     // device vanished mid-lookup; drop the sighting
};
