#pragma once

#include "PairingAgent.h"

// Connects with NimBLE and asks the stack to secure (pair/bond) the link.
class NimBlePairingAgent : public PairingAgent {
public:
  bool pair(const DeviceRecord& device) override;
};
