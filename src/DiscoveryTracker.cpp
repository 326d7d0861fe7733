#include "DiscoveryTracker.h"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <spdlog/spdlog.h>

// ----------------------------- Helpers -----------------------------

static uint64_t steady_now_ms() {
  using namespace std::chrono;
  return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static bool istarts_with(const std::string& s, const std::string& prefix) {
  if (prefix.size() > s.size()) return false;
  return std::equal(prefix.begin(), prefix.end(), s.begin(),
    [](char a, char b) { return std::tolower((unsigned char)a) == std::tolower((unsigned char)b); });
}

static DiscoveryEvent make_event(DiscoveryEventKind kind, const DeviceRecord& device = DeviceRecord{}) {
  DiscoveryEvent e;
  e.kind = kind;
  e.device = device;
  return e;
}

// Set while a thread runs a source callback or the sweeper for a tracker.
// The thread that stops that tracker may be joining it, so it must not block
// on a lifecycle transition.
static thread_local const DiscoveryTracker* t_worker_of = nullptr;

struct TrackerWorkerScope {
  explicit TrackerWorkerScope(const DiscoveryTracker* tracker) : prev(t_worker_of) { t_worker_of = tracker; }
  ~TrackerWorkerScope() { t_worker_of = prev; }
  const DiscoveryTracker* prev;
};

// ----------------------------- Lifecycle -----------------------------

DiscoveryTracker::DiscoveryTracker(AdvertisementSource& source, TrackerConfig config)
  : _source(source),
    _config(std::move(config)),
    _heartbeat_timeout_ms(_config.heartbeat_timeout_ms) {}

DiscoveryTracker::~DiscoveryTracker() {
  // Quiet shutdown: no Stopped event while the owner is tearing down. The
  // source is ended even after it stopped on its own, so its thread is gone
  // before we are. The state stays Stopping from here on.
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _state_cv.wait(lock, [this] { return _state == State::Stopped || _state == State::Listening; });
    _state = State::Stopping;
    _devices.clear();
    _lifecycle_events.clear();
  }
  _source.end();
  stopSweeper();
}

void DiscoveryTracker::setDeviceInfoLookup(DeviceInfoLookup* lookup) {
  _lookup.store(lookup);
}

void DiscoveryTracker::setPairingAgent(PairingAgent* agent) {
  _pairing.store(agent);
}

DiscoveryTracker::ObserverHandle DiscoveryTracker::subscribe(DiscoveryObserver observer) {
  if (!observer) return 0;

  std::lock_guard<std::mutex> lock(_observer_mutex);
  const ObserverHandle handle = _next_handle++;
  _observers.emplace_back(handle, std::move(observer));
  return handle;
}

void DiscoveryTracker::unsubscribe(ObserverHandle handle) {
  std::lock_guard<std::mutex> lock(_observer_mutex);
  _observers.erase(
    std::remove_if(_observers.begin(), _observers.end(),
      [handle](const std::pair<ObserverHandle, DiscoveryObserver>& o) { return o.first == handle; }),
    _observers.end());
}

TrackerError DiscoveryTracker::start() {
  {
    std::unique_lock<std::mutex> lock(_mutex);
    for (;;) {
      if (_state == State::Listening) return TrackerError::None;
      if (_state == State::Stopped) break;
      if (t_worker_of == this) return TrackerError::Busy;
      _state_cv.wait(lock);
    }
    _state = State::Starting;
    _source_lost = false;
  }

  TrackerError err = _source.begin(
    [this](const Sighting& s) { TrackerWorkerScope scope(this); onSighting(s); },
    [this]() { TrackerWorkerScope scope(this); onSourceStopped(); });

  if (err == TrackerError::None) {
    startSweeper();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_source_lost) {
      err = TrackerError::SourceUnavailable;
    } else {
      _state = State::Listening;
      _lifecycle_events.push_back(make_event(DiscoveryEventKind::Started));
    }
  }

  if (err != TrackerError::None) {
    stopSweeper();
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _state = State::Stopped;
    }
    _state_cv.notify_all();
    SPDLOG_WARN("tracker: advertisement source failed to start: {}", ErrorName(err));
    return err;
  }

  _state_cv.notify_all();
  SPDLOG_INFO("tracker: started listening (timeout={}ms)", heartbeatTimeout());
  drainLifecycleEvents();
  return TrackerError::None;
}

// The source and the sweeper are joined without any lock held, so their
// callbacks can call stop() (no-op) or start() (Busy) meanwhile.
void DiscoveryTracker::stop() {
  {
    std::unique_lock<std::mutex> lock(_mutex);
    for (;;) {
      if (_state == State::Listening) break;
      if (_state != State::Starting || t_worker_of == this) return;
      _state_cv.wait(lock);
    }
    _state = State::Stopping;
    _devices.clear();
  }

  _source.end();
  stopSweeper();
  finishStopping();

  SPDLOG_INFO("tracker: stopped listening");
  drainLifecycleEvents();
}

void DiscoveryTracker::finishStopping() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _state = State::Stopped;
    _lifecycle_events.push_back(make_event(DiscoveryEventKind::Stopped));
  }
  _state_cv.notify_all();
}

bool DiscoveryTracker::isListening() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _state == State::Listening;
}

// The source already stopped itself, so there is nothing to end().
void DiscoveryTracker::onSourceStopped() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == State::Starting) {
      _source_lost = true;
      return;
    }
    if (_state != State::Listening) return;
    _state = State::Stopping;
    _devices.clear();
  }

  stopSweeper();
  finishStopping();

  SPDLOG_WARN("tracker: advertisement source stopped unexpectedly");
  drainLifecycleEvents();
}

// ----------------------------- Ingestion -----------------------------

uint64_t DiscoveryTracker::now() const {
  return _config.clock ? _config.clock() : steady_now_ms();
}

bool DiscoveryTracker::deriveCandidate(const Sighting& sighting, DeviceRecord& out) {
  out = DeviceRecord::FromSighting(sighting);

  DeviceInfoLookup* lookup = _lookup.load();
  if (!lookup) return true;

  DeviceInfo info;
  switch (lookup->lookup(sighting.address, info)) {
    case LookupStatus::Resolved:
      if (!info.name.empty()) out.name = info.name;
      out.flags = info.flags;
      out.platform_id = info.platform_id;
      return true;

    case LookupStatus::NoData:
      return true;

    case LookupStatus::DeviceGone:
      break;
  }
  return false;
}

void DiscoveryTracker::onSighting(const Sighting& sighting) {
  if (!isListening()) return;

  sweep(now(), heartbeatTimeout());

  DeviceRecord candidate;
  if (!deriveCandidate(sighting, candidate)) {
    SPDLOG_DEBUG("tracker: dropped sighting of {}, device gone during lookup",
                 FormatAddress(sighting.address));
    return;
  }

  std::vector<DiscoveryEvent> events;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != State::Listening) return;

    auto it = _devices.find(candidate.address);
    const bool is_new = (it == _devices.end());
    bool name_changed = false;

    if (!is_new) {
      const std::string& prior = it->second.name;
      // a first name after an unnamed start is not a change
      name_changed = !candidate.name.empty() && !prior.empty() && candidate.name != prior;
      if (candidate.name.empty()) candidate.name = prior;
      it->second = candidate;
    } else {
      _devices.emplace(candidate.address, candidate);
    }

    events.push_back(make_event(DiscoveryEventKind::DeviceDiscovered, candidate));
    if (name_changed) events.push_back(make_event(DiscoveryEventKind::NameChanged, candidate));
    if (is_new)       events.push_back(make_event(DiscoveryEventKind::NewDeviceDiscovered, candidate));
  }

  dispatch(events);
}

// ----------------------------- Expiry -----------------------------

void DiscoveryTracker::sweepLocked(uint64_t now_ms, uint32_t timeout_ms, std::vector<DiscoveryEvent>& events) {
  if (now_ms <= timeout_ms) return;
  const uint64_t threshold = now_ms - timeout_ms;

  for (auto it = _devices.begin(); it != _devices.end(); ) {
    if (it->second.timestamp_ms < threshold) {
      events.push_back(make_event(DiscoveryEventKind::DeviceTimedOut, it->second));
      it = _devices.erase(it);
    } else {
      ++it;
    }
  }
}

void DiscoveryTracker::sweep(uint64_t now_ms, uint32_t timeout_ms) {
  std::vector<DiscoveryEvent> events;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    sweepLocked(now_ms, timeout_ms, events);
  }

  for (const DiscoveryEvent& e : events) {
    SPDLOG_DEBUG("tracker: device timed out: {}", e.device.toString());
  }
  dispatch(events);
}

void DiscoveryTracker::startSweeper() {
  if (_config.sweep_interval_ms == 0) return;

  std::thread previous;
  {
    std::lock_guard<std::mutex> lock(_sweep_mutex);
    previous = std::move(_sweeper);
    _sweep_generation++;
    _sweeper = std::thread(&DiscoveryTracker::sweepTask, this, _sweep_generation);
  }
  _sweep_cv.notify_all();
  if (previous.joinable()) previous.join();
}

void DiscoveryTracker::stopSweeper() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(_sweep_mutex);
    _sweep_generation++;
    worker = std::move(_sweeper);
  }
  _sweep_cv.notify_all();

  if (!worker.joinable()) return;
  // An observer on the sweep thread may have called stop(); that thread exits
  // by itself once it sees the new generation.
  if (worker.get_id() == std::this_thread::get_id()) {
    worker.detach();
  } else {
    worker.join();
  }
}

void DiscoveryTracker::sweepTask(uint32_t generation) {
  TrackerWorkerScope scope(this);

  std::unique_lock<std::mutex> lock(_sweep_mutex);
  while (_sweep_generation == generation) {
    const bool cancelled = _sweep_cv.wait_for(lock,
      std::chrono::milliseconds(_config.sweep_interval_ms),
      [this, generation] { return _sweep_generation != generation; });
    if (cancelled) break;

    lock.unlock();
    sweep(now(), heartbeatTimeout());
    lock.lock();
  }
}

// ----------------------------- Queries -----------------------------

std::vector<DeviceRecord> DiscoveryTracker::currentDevices() {
  sweep(now(), heartbeatTimeout());

  std::vector<DeviceRecord> out;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    out.reserve(_devices.size());
    for (const auto& kv : _devices) out.push_back(kv.second);
  }

  std::sort(out.begin(), out.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
    if (a.rssi != b.rssi) return a.rssi > b.rssi;
    return a.address < b.address;
  });
  return out;
}

bool DiscoveryTracker::findDevice(uint64_t address, DeviceRecord& out) {
  sweep(now(), heartbeatTimeout());

  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _devices.find(address);
  if (it == _devices.end()) return false;
  out = it->second;
  return true;
}

bool DiscoveryTracker::findDeviceByNamePrefix(const std::string& prefix, DeviceRecord& out) {
  for (const DeviceRecord& d : currentDevices()) {
    if (!d.name.empty() && istarts_with(d.name, prefix)) {
      out = d;
      return true;
    }
  }
  return false;
}

TrackerError DiscoveryTracker::pair(uint64_t address) {
  if (!isListening()) return TrackerError::NotListening;

  DeviceRecord device;
  if (!findDevice(address, device)) return TrackerError::UnknownDevice;
  if (HasFlag(device.flags, DeviceFlags::Paired)) return TrackerError::None;

  PairingAgent* agent = _pairing.load();
  if (!agent) return TrackerError::NoPairingAgent;

  SPDLOG_INFO("tracker: pairing with {}", device.toString());
  if (!agent->pair(device)) {
    SPDLOG_WARN("tracker: pairing with {} failed", FormatAddress(address));
    return TrackerError::PairingFailed;
  }
  return TrackerError::None;
}

// ----------------------------- Dispatch -----------------------------

void DiscoveryTracker::dispatch(const std::vector<DiscoveryEvent>& events) {
  if (events.empty()) return;

  std::vector<DiscoveryObserver> observers;
  {
    std::lock_guard<std::mutex> lock(_observer_mutex);
    observers.reserve(_observers.size());
    for (const auto& o : _observers) observers.push_back(o.second);
  }

  for (const DiscoveryEvent& e : events) {
    for (const DiscoveryObserver& observer : observers) observer(e);
  }
}

// A start()/stop() made by an observer of a lifecycle event only queues its
// event; the outer loop delivers it once the current one has reached every
// observer.
void DiscoveryTracker::drainLifecycleEvents() {
  std::unique_lock<std::mutex> lock(_mutex);
  if (_lifecycle_draining) return;
  _lifecycle_draining = true;

  while (!_lifecycle_events.empty()) {
    const DiscoveryEvent e = _lifecycle_events.front();
    _lifecycle_events.pop_front();
    lock.unlock();
    dispatch({ e });
    lock.lock();
  }
  _lifecycle_draining = false;
}

const char* DiscoveryTracker::EventKindName(DiscoveryEventKind kind) {
  switch (kind) {
    case DiscoveryEventKind::Started:             return "Started";
    case DiscoveryEventKind::Stopped:             return "Stopped";
    case DiscoveryEventKind::DeviceDiscovered:    return "DeviceDiscovered";
    case DiscoveryEventKind::NewDeviceDiscovered: return "NewDeviceDiscovered";
    case DiscoveryEventKind::NameChanged:         return "NameChanged";
    case DiscoveryEventKind::DeviceTimedOut:      return "DeviceTimedOut";
  }
  return "Unknown";
}

const char* DiscoveryTracker::ErrorName(TrackerError err) {
  switch (err) {
    case TrackerError::None:              return "None";
    case TrackerError::SourceUnavailable: return "SourceUnavailable";
    case TrackerError::PermissionDenied:  return "PermissionDenied";
    case TrackerError::NotListening:      return "NotListening";
    case TrackerError::UnknownDevice:     return "UnknownDevice";
    case TrackerError::NoPairingAgent:    return "NoPairingAgent";
    case TrackerError::PairingFailed:     return "PairingFailed";
    case TrackerError::Busy:              return "Busy";
  }
  return "Unknown";
}
