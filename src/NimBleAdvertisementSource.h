#pragma once

#include <cstdint>
#include <memory>

#include <NimBLEDevice.h>   // NimBLEScan, NimBLEAdvertisedDevice

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#include "AdvertisementSource.h"

// ESP32 radio source: NimBLE active scan -> FreeRTOS queue -> processing task.
// The scan callback runs on the NimBLE host task and never blocks; the
// processing task is the single producer that feeds the tracker.
class NimBleAdvertisementSource : public AdvertisementSource {
public:
  NimBleAdvertisementSource() = default;
  ~NimBleAdvertisementSource() override;

  TrackerError begin(SightingHandler onSighting, StoppedHandler onStopped) override;
  void end() override;

  static uint64_t AddressFromNative(const uint8_t* native);

private:
  struct ScanRun;

  static void processingTask(void* arg);
  static void scanEnded(NimBLEScanResults results);

  NimBLEScan*   _bleScan = nullptr;
  // Created on first begin() and kept until destruction: the scan callback
  // may still hold the handle after end().
  QueueHandle_t _obsQueue = nullptr;
  // Current run; swapped atomically (std::atomic_load / std::atomic_exchange).
  std::shared_ptr<ScanRun> _run;
};
