#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "DiscoveryTracker.h"
#include "ReplayAdvertisementSource.h"

#define VERSION "1.0.00"

static void usage(const char* argv0)
{
  std::fprintf(stderr,
    "usage: %s [--timeout-ms N] [--sweep-ms N] [--realtime] [--verbose] <file|->\n"
    "  file lines: <timestamp_ms> <AA:BB:CC:DD:EE:FF> <rssi> [name]\n"
    "  with a file, stdin takes commands: <enter> list, q quit\n"
    "  (pairing needs a radio; it is only offered by the firmware)\n",
    argv0);
}

static bool parseU32(const char* s, uint32_t& out)
{
  if (!s || !*s) return false;
  char* end = nullptr;
  const unsigned long v = std::strtoul(s, &end, 10);
  if (*end != '\0' || v > 0xFFFFFFFFUL) return false;
  out = (uint32_t)v;
  return true;
}

static void printEvent(const DiscoveryEvent& e)
{
  switch (e.kind) {
    case DiscoveryEventKind::Started:
      std::printf("Started Listening\n");
      break;
    case DiscoveryEventKind::Stopped:
      std::printf("Stopped Listening\n");
      break;
    case DiscoveryEventKind::NewDeviceDiscovered:
      std::printf("New device: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::NameChanged:
      std::printf("Device name changed: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::DeviceTimedOut:
      std::printf("Device timed out: %s\n", e.device.toString().c_str());
      break;
    case DiscoveryEventKind::DeviceDiscovered:
      break;
  }
  std::fflush(stdout);
}

static void listDevices(DiscoveryTracker& tracker)
{
  const std::vector<DeviceRecord> devices = tracker.currentDevices();
  std::printf("%u devices....\n", (unsigned)devices.size());
  for (const DeviceRecord& d : devices) std::printf("%s\n", d.toString().c_str());
  std::fflush(stdout);
}

int main(int argc, char** argv)
{
  TrackerConfig config;
  std::string input;
  bool realtime = false;

  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    if (!std::strcmp(arg, "--timeout-ms") && i + 1 < argc) {
      if (!parseU32(argv[++i], config.heartbeat_timeout_ms)) { usage(argv[0]); return 2; }
    } else if (!std::strcmp(arg, "--sweep-ms") && i + 1 < argc) {
      if (!parseU32(argv[++i], config.sweep_interval_ms)) { usage(argv[0]); return 2; }
    } else if (!std::strcmp(arg, "--realtime")) {
      realtime = true;
    } else if (!std::strcmp(arg, "--verbose")) {
      spdlog::set_level(spdlog::level::debug);
    } else if (input.empty() && (arg[0] != '-' || !std::strcmp(arg, "-"))) {
      input = arg;
    } else {
      usage(argv[0]);
      return 2;
    }
  }
  if (input.empty()) { usage(argv[0]); return 2; }

  SPDLOG_INFO("sightline console {}", VERSION);

  const bool interactive = (input != "-");
  std::unique_ptr<ReplayAdvertisementSource> source = interactive
    ? std::unique_ptr<ReplayAdvertisementSource>(new ReplayAdvertisementSource(input, realtime))
    : std::unique_ptr<ReplayAdvertisementSource>(new ReplayAdvertisementSource(std::cin, realtime));

  // Expiry follows the recording's timeline, not the wall clock.
  ReplayAdvertisementSource* replay = source.get();
  config.clock = [replay]() { return replay->now(); };

  DiscoveryTracker tracker(*source, config);

  std::mutex m;
  std::condition_variable cv;
  bool stopped = false;

  tracker.subscribe(printEvent);
  tracker.subscribe([&](const DiscoveryEvent& e) {
    if (e.kind != DiscoveryEventKind::Stopped) return;
    std::lock_guard<std::mutex> lock(m);
    stopped = true;
    cv.notify_all();
  });

  const TrackerError err = tracker.start();
  if (err != TrackerError::None) {
    std::fprintf(stderr, "start failed: %s\n", DiscoveryTracker::ErrorName(err));
    return 1;
  }

  if (interactive) {
    std::string cmd;
    while (std::getline(std::cin, cmd)) {
      if (cmd.empty()) {
        listDevices(tracker);
      } else if (cmd == "q") {
        break;
      }
    }
  } else {
    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, [&] { return stopped; });
  }

  tracker.stop();
  return 0;
}
