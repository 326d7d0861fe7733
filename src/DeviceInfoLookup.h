#pragma once

#include <cstdint>
#include <string>

#include "DeviceRecord.h"
#include "TrackerError.h"

struct DeviceInfo {
  std::string name;                       // resolved name, may be empty
  DeviceFlags flags = DeviceFlags::None;  // connected / can pair / paired
  std::string platform_id;
};

// Optional enrichment step. May block on I/O; the tracker calls it without
// holding any lock.
class DeviceInfoLookup {
public:
  virtual ~DeviceInfoLookup() = default;
  virtual LookupStatus lookup(uint64_t address, DeviceInfo& out) = 0;
};
