#pragma once

#include "DeviceRecord.h"

// Connection/pairing workflow for a single device. Returns true once paired.
class PairingAgent {
public:
  virtual ~PairingAgent() = default;
  virtual bool pair(const DeviceRecord& device) = 0;
};
