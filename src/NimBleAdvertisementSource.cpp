#include "NimBleAdvertisementSource.h"

#include <Arduino.h>
#include "esp_timer.h"

#include <algorithm>
#include <atomic>
#include <string>
#include <string.h>
#include <utility>

// ----------------------------- Tuning -----------------------------

static constexpr int OBS_QUEUE_LEN   = 256;
static constexpr int QUEUE_WAIT_MS   = 250;
static constexpr int TASK_STOP_MS    = 1000;
static constexpr int NAME_MAX        = 32;

// Scan timing in 0.625 ms units
static constexpr uint16_t SCAN_INTERVAL = 45;
static constexpr uint16_t SCAN_WINDOW   = 15;

// ----------------------------- Observations -----------------------------

// Queue items are copied byte-wise by FreeRTOS, so no std::string here.
struct Observation {
  int8_t   rssi_dbm;
  uint8_t  addr[6];
  char     name[NAME_MAX];
  uint8_t  name_len;
  uint64_t ts_ms;
};

// State of one begin()..end() cycle. The processing task keeps its own
// reference, so a task that outlives end() (stopped from its own callback)
// still sees its run as stopping after a newer run has started.
struct NimBleAdvertisementSource::ScanRun {
  SightingHandler   on_sighting;
  StoppedHandler    on_stopped;
  QueueHandle_t     queue = nullptr;
  SemaphoreHandle_t done = nullptr;
  TaskHandle_t      task = nullptr;
  std::atomic<bool> stopping{false};
  std::atomic<bool> scan_lost{false};

  ~ScanRun() {
    if (done) vSemaphoreDelete(done);
  }
};

static inline uint64_t now_ms() { return (uint64_t)esp_timer_get_time() / 1000ULL; }

// NimBLE's callbacks take no context pointer.
static std::atomic<NimBleAdvertisementSource*> g_active{nullptr};
static std::atomic<QueueHandle_t> g_obs_q{nullptr};
static std::atomic<bool> g_scanning{false};

class ScanCB : public NimBLEAdvertisedDeviceCallbacks {
public:
  void onResult(NimBLEAdvertisedDevice* dev) override {
    if (!g_scanning.load()) return;
    QueueHandle_t q = g_obs_q.load();
    if (!q) return;

    Observation obs{};
    obs.ts_ms = now_ms();
    obs.rssi_dbm = (int8_t)dev->getRSSI();

    NimBLEAddress a = dev->getAddress();
    memcpy(obs.addr, a.getNative(), 6);

    if (dev->haveName()) {
      const std::string name = dev->getName();
      size_t ncopy = std::min<size_t>(name.length(), sizeof(obs.name));
      obs.name_len = (uint8_t)ncopy;
      if (ncopy) memcpy(obs.name, name.c_str(), ncopy);
    }

    // drop on overflow rather than stall the host task
    xQueueSend(q, &obs, 0);
  }
};

static ScanCB g_scan_cb;

// ----------------------------- Source -----------------------------

NimBleAdvertisementSource::~NimBleAdvertisementSource() {
  end();

  if (_bleScan) _bleScan->setAdvertisedDeviceCallbacks(nullptr);
  g_obs_q.store(nullptr);
  if (_obsQueue) {
    vQueueDelete(_obsQueue);
    _obsQueue = nullptr;
  }
}

uint64_t NimBleAdvertisementSource::AddressFromNative(const uint8_t* native) {
  // NimBLE stores addresses little-endian
  uint64_t v = 0;
  for (int i = 5; i >= 0; i--) v = (v << 8) | native[i];
  return v;
}

TrackerError NimBleAdvertisementSource::begin(SightingHandler onSighting, StoppedHandler onStopped) {
  std::shared_ptr<ScanRun> current = std::atomic_load(&_run);
  if (current && !current->stopping.load() && !current->scan_lost.load()) return TrackerError::None;
  end();   // retire a run whose scan ended on its own

  Serial.println("[ble] scanner starting...");

  if (!_obsQueue) {
    _obsQueue = xQueueCreate(OBS_QUEUE_LEN, sizeof(Observation));
    if (!_obsQueue) {
      Serial.println("[ble] out of memory for scan queue");
      return TrackerError::SourceUnavailable;
    }
  }
  xQueueReset(_obsQueue);

  auto run = std::make_shared<ScanRun>();
  run->done = xSemaphoreCreateBinary();
  if (!run->done) {
    Serial.println("[ble] out of memory for scan run");
    return TrackerError::SourceUnavailable;
  }
  run->queue = _obsQueue;
  run->on_sighting = std::move(onSighting);
  run->on_stopped = std::move(onStopped);

  NimBLEDevice::init("");
  NimBLEDevice::setPower(ESP_PWR_LVL_P9);

  _bleScan = NimBLEDevice::getScan();
  if (!_bleScan) {
    Serial.println("[ble] no scan object");
    return TrackerError::SourceUnavailable;
  }

  std::atomic_store(&_run, run);
  g_active.store(this);
  g_obs_q.store(_obsQueue);

  // the task owns this reference
  auto* task_ref = new std::shared_ptr<ScanRun>(run);
  if (xTaskCreatePinnedToCore(processingTask, "sl_proc", 8192, task_ref, 10, &run->task, 0) != pdPASS) {
    Serial.println("[ble] processing task create failed");
    delete task_ref;
    std::atomic_store(&_run, std::shared_ptr<ScanRun>());
    g_active.store(nullptr);
    return TrackerError::SourceUnavailable;
  }

  _bleScan->setAdvertisedDeviceCallbacks(&g_scan_cb, true);
  _bleScan->setActiveScan(true);
  _bleScan->setInterval(SCAN_INTERVAL);
  _bleScan->setWindow(SCAN_WINDOW);
  _bleScan->setDuplicateFilter(false);

  g_scanning.store(true);
  if (!_bleScan->start(0, scanEnded, false)) {
    Serial.println("[ble] scan start refused");
    end();
    return TrackerError::SourceUnavailable;
  }

  Serial.println("[ble] scanner started");
  return TrackerError::None;
}

void NimBleAdvertisementSource::end() {
  std::shared_ptr<ScanRun> run = std::atomic_exchange(&_run, std::shared_ptr<ScanRun>());
  if (!run) return;

  run->stopping.store(true);
  g_scanning.store(false);
  if (_bleScan && _bleScan->isScanning()) _bleScan->stop();
  g_active.store(nullptr);

  // Stopped from inside a tracker callback: the task leaves its loop once the
  // callback returns and drops its own reference to the run.
  if (xTaskGetCurrentTaskHandle() == run->task) {
    Serial.println("[ble] scanner stopping");
    return;
  }

  // processing task signals once it has left its loop
  if (xSemaphoreTake(run->done, pdMS_TO_TICKS(TASK_STOP_MS)) != pdTRUE) {
    Serial.println("[ble] processing task did not stop in time");
  }
  Serial.println("[ble] scanner stopped");
}

// Called by NimBLE when a scan ends. Only unrequested ends are forwarded.
void NimBleAdvertisementSource::scanEnded(NimBLEScanResults) {
  NimBleAdvertisementSource* self = g_active.load();
  if (!self) return;
  std::shared_ptr<ScanRun> run = std::atomic_load(&self->_run);
  if (!run || run->stopping.load()) return;
  run->scan_lost.store(true);
}

void NimBleAdvertisementSource::processingTask(void* arg) {
  auto* task_ref = static_cast<std::shared_ptr<ScanRun>*>(arg);
  std::shared_ptr<ScanRun> run = std::move(*task_ref);
  delete task_ref;

  Observation obs;
  while (!run->stopping.load()) {
    if (xQueueReceive(run->queue, &obs, pdMS_TO_TICKS(QUEUE_WAIT_MS)) == pdTRUE) {
      // the queue is shared with the next run once this one is stopping
      if (run->stopping.load()) break;

      Sighting s;
      s.address = AddressFromNative(obs.addr);
      s.name.assign(obs.name, obs.name_len);
      s.rssi = obs.rssi_dbm;
      s.timestamp_ms = obs.ts_ms;
      run->on_sighting(s);
    }

    if (run->scan_lost.load() && !run->stopping.load()) {
      Serial.println("[ble] scan ended unexpectedly");
      g_scanning.store(false);
      run->on_stopped();
      break;
    }
  }

  xSemaphoreGive(run->done);
  run.reset();
  vTaskDelete(nullptr);
}
