#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "AdvertisementSource.h"
#include "DeviceInfoLookup.h"
#include "DeviceRecord.h"
#include "PairingAgent.h"
#include "TrackerError.h"

static constexpr uint32_t DEFAULT_HEARTBEAT_TIMEOUT_MS = 30 * 1000;
static constexpr uint32_t DEFAULT_SWEEP_INTERVAL_MS    = 1000;

enum class DiscoveryEventKind : uint8_t {
  Started = 1,
  Stopped,
  DeviceDiscovered,     // every applied sighting
  NewDeviceDiscovered,  // first sighting of an address
  NameChanged,          // known, non-empty name replaced by a different one
  DeviceTimedOut,       // evicted by the sweep
};

struct DiscoveryEvent {
  DiscoveryEventKind kind;
  DeviceRecord       device;   // default-constructed for Started / Stopped
};

using DiscoveryObserver = std::function<void(const DiscoveryEvent&)>;

struct TrackerConfig {
  uint32_t heartbeat_timeout_ms = DEFAULT_HEARTBEAT_TIMEOUT_MS;
  uint32_t sweep_interval_ms    = DEFAULT_SWEEP_INTERVAL_MS;  // 0 = no background sweep
  std::function<uint64_t()> clock;                            // monotonic ms; steady clock if empty
};

// Live registry of advertising devices keyed by hardware address.
//
// Sightings, sweeps and snapshots may run concurrently; every registry access
// is serialized on one mutex. Observers are called synchronously on the thread
// that caused the event, after that mutex has been released, so they may call
// back into the tracker.
//
// Started / Stopped are delivered in the order the transitions happened, even
// when start() and stop() race on different threads; a call that finds another
// thread delivering lifecycle events leaves its event for that thread.
class DiscoveryTracker {
public:
  using ObserverHandle = uint32_t;

  explicit DiscoveryTracker(AdvertisementSource& source, TrackerConfig config = TrackerConfig{});
  ~DiscoveryTracker();

  DiscoveryTracker(const DiscoveryTracker&) = delete;
  DiscoveryTracker& operator=(const DiscoveryTracker&) = delete;

  // Optional collaborators; pass nullptr to detach. Not owned.
  void setDeviceInfoLookup(DeviceInfoLookup* lookup);
  void setPairingAgent(PairingAgent* agent);

  ObserverHandle subscribe(DiscoveryObserver observer);
  void unsubscribe(ObserverHandle handle);

  // Stopped -> Listening. Idempotent. Source failures are returned and the
  // tracker stays stopped. Waits for a stop() running on another thread, except
  // on a source or sweeper callback thread, where it returns Busy instead.
  TrackerError start();
  // Listening -> Stopped; clears the registry. No-op when already stopped or
  // when another thread is already stopping.
  void stop();
  bool isListening() const;

  // Ingestion entry point. Never reports errors; bad sightings are dropped.
  void onSighting(const Sighting& sighting);

  // Evicts every record last seen before now_ms - timeout_ms.
  void sweep(uint64_t now_ms, uint32_t timeout_ms);

  // Sweeps, then returns a copy sorted strongest signal first.
  std::vector<DeviceRecord> currentDevices();

  bool findDevice(uint64_t address, DeviceRecord& out);
  bool findDeviceByNamePrefix(const std::string& prefix, DeviceRecord& out);

  TrackerError pair(uint64_t address);

  uint32_t heartbeatTimeout() const { return _heartbeat_timeout_ms.load(); }
  void setHeartbeatTimeout(uint32_t timeout_ms) { _heartbeat_timeout_ms.store(timeout_ms); }

  static const char* EventKindName(DiscoveryEventKind kind);
  static const char* ErrorName(TrackerError err);

private:
  using Registry = std::unordered_map<uint64_t, DeviceRecord>;

  enum class State : uint8_t {
    Stopped,
    Starting,
    Listening,
    Stopping,
  };

  uint64_t now() const;
  bool deriveCandidate(const Sighting& sighting, DeviceRecord& out);
  void sweepLocked(uint64_t now_ms, uint32_t timeout_ms, std::vector<DiscoveryEvent>& events);
  void onSourceStopped();
  void finishStopping();
  void dispatch(const std::vector<DiscoveryEvent>& events);
  void drainLifecycleEvents();

  void startSweeper();
  void stopSweeper();
  void sweepTask(uint32_t generation);

  AdvertisementSource& _source;
  TrackerConfig _config;
  std::atomic<uint32_t> _heartbeat_timeout_ms;
  std::atomic<DeviceInfoLookup*> _lookup{nullptr};
  std::atomic<PairingAgent*> _pairing{nullptr};

  // guards everything down to _lifecycle_draining
  mutable std::mutex _mutex;
  std::condition_variable _state_cv;
  Registry _devices;
  State _state = State::Stopped;
  bool _source_lost = false;          // source stopped itself during Starting
  std::deque<DiscoveryEvent> _lifecycle_events;
  bool _lifecycle_draining = false;

  std::mutex _observer_mutex;
  std::vector<std::pair<ObserverHandle, DiscoveryObserver>> _observers;
  ObserverHandle _next_handle = 1;

  std::mutex _sweep_mutex;
  std::condition_variable _sweep_cv;
  uint32_t _sweep_generation = 0;
  std::thread _sweeper;
};
