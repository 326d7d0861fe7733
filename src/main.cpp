#include <Arduino.h>

#include "DiscoveryTracker.h"
#include "NimBleAdvertisementSource.h"
#include "NimBlePairingAgent.h"

#define VERSION "1.0.00"

// 'c' pairs with the first listed device whose name starts with this.
static const char* PAIR_NAME_PREFIX = "lg";

static constexpr uint32_t HEARTBEAT_TIMEOUT_MS = 30 * 1000;
static constexpr uint32_t SWEEP_INTERVAL_MS    = 1000;

static NimBleAdvertisementSource g_source;
static NimBlePairingAgent g_pairing;
static DiscoveryTracker g_tracker(g_source, TrackerConfig{ HEARTBEAT_TIMEOUT_MS, SWEEP_INTERVAL_MS, nullptr });

static String g_line;

static void printEvent(const DiscoveryEvent& e)
{
  switch (e.kind) {
    case DiscoveryEventKind::Started:
      Serial.println("Started listening");
      break;
    case DiscoveryEventKind::Stopped:
      Serial.println("Stopped listening");
      break;
    case DiscoveryEventKind::NewDeviceDiscovered:
      Serial.printf("New device: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::NameChanged:
      Serial.printf("Device name changed: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::DeviceTimedOut:
      Serial.printf("Device timed out: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::DeviceDiscovered:
      // every advertisement; far too chatty for the console
      break;
  }
}

static void listDevices()
{
  const std::vector<DeviceRecord> devices = g_tracker.currentDevices();
  Serial.printf("%u devices....\n", (unsigned)devices.size());
  for (const DeviceRecord& d : devices) {
    Serial.println(d.toString().c_str());
  }
}

static void pairFirstMatch()
{
  DeviceRecord target;
  if (!g_tracker.findDeviceByNamePrefix(PAIR_NAME_PREFIX, target)) {
    Serial.printf("No '%s' device found for connecting\n", PAIR_NAME_PREFIX);
    return;
  }

  Serial.printf("Connecting to %s\n", target.toString().c_str());
  const TrackerError err = g_tracker.pair(target.address);
  if (err != TrackerError::None) {
    Serial.printf("Failed to pair: %s\n", DiscoveryTracker::ErrorName(err));
  }
}

static void handleCommand(const String& cmd)
{
  if (cmd.length() == 0) {
    listDevices();
  } else if (cmd == "c") {
    pairFirstMatch();
  } else if (cmd == "s") {
    const TrackerError err = g_tracker.start();
    if (err != TrackerError::None) Serial.printf("Start failed: %s\n", DiscoveryTracker::ErrorName(err));
  } else if (cmd == "q") {
    g_tracker.stop();
  } else {
    Serial.println("commands: <enter> list, c pair, s start, q stop");
  }
}

void setup() {
  Serial.begin(115200);
  Serial.printf("Sightline %s\n", VERSION);

  g_tracker.setPairingAgent(&g_pairing);
  g_tracker.subscribe(printEvent);

  const TrackerError err = g_tracker.start();
  if (err != TrackerError::None) {
    Serial.printf("DiscoveryTracker.start failed: %s\n", DiscoveryTracker::ErrorName(err));
  }

  Serial.printf("[heap] free=%u min=%u\n",
              (unsigned)esp_get_free_heap_size(),
              (unsigned)esp_get_minimum_free_heap_size());
}

void loop() {
  while (Serial.available() > 0) {
    const char c = (char)Serial.read();
    if (c == '\r') continue;
    if (c == '\n') {
      g_line.trim();
      handleCommand(g_line);
      g_line = "";
    } else {
      g_line += c;
    }
  }

  delay(1);
}
