#include "NimBlePairingAgent.h"

#include <Arduino.h>
#include <NimBLEDevice.h>

bool NimBlePairingAgent::pair(const DeviceRecord& device) {
  // Accept whatever the peripheral offers; no I/O capabilities on this node.
  NimBLEDevice::setSecurityAuth(true, false, true);
  NimBLEDevice::setSecurityIOCap(BLE_HS_IO_NO_INPUT_OUTPUT);

  NimBLEClient* client = NimBLEDevice::createClient();
  if (!client) {
    Serial.println("[pair] no client slot available");
    return false;
  }

  const NimBLEAddress addr(device.address);
  Serial.printf("[pair] connecting to %s\n", device.toString().c_str());

  bool ok = false;
  if (client->connect(addr)) {
    ok = client->secureConnection();
    Serial.printf("[pair] %s\n", ok ? "paired" : "pairing refused");
    client->disconnect();
  } else {
    Serial.println("[pair] connect failed");
  }

  NimBLEDevice::deleteClient(client);
  return ok;
}
