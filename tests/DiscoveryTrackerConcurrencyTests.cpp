#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "DiscoveryTracker.h"
#include "FakeAdvertisementSource.h"

namespace {

constexpr int kProducers = 4;
constexpr int kSightingsPerProducer = 250;
constexpr int kDistinctDevices = 10;

TEST(DiscoveryTrackerConcurrencyTest, ParallelSightingsAndReadersConverge) {
  std::atomic<uint64_t> clock_ms{1000};
  FakeAdvertisementSource source;

  TrackerConfig config;
  config.heartbeat_timeout_ms = 60 * 1000;
  config.sweep_interval_ms = 5;
  config.clock = [&clock_ms]() { return clock_ms.load(); };

  DiscoveryTracker tracker(source, config);

  std::atomic<int> new_events{0};
  std::atomic<int> timed_out{0};
  tracker.subscribe([&](const DiscoveryEvent& e) {
    if (e.kind == DiscoveryEventKind::NewDeviceDiscovered) new_events++;
    if (e.kind == DiscoveryEventKind::DeviceTimedOut) timed_out++;
  });
  ASSERT_EQ(TrackerError::None, tracker.start());

  std::atomic<bool> producing{true};
  std::vector<std::thread> readers;
  for (int r = 0; r < 2; r++) {
    readers.emplace_back([&] {
      while (producing.load()) {
        const std::vector<DeviceRecord> snapshot = tracker.currentDevices();
        // every snapshot is internally consistent: no duplicate addresses
        std::set<uint64_t> seen;
        for (const DeviceRecord& d : snapshot) EXPECT_TRUE(seen.insert(d.address).second);
        EXPECT_LE(snapshot.size(), (size_t)kDistinctDevices);
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; p++) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kSightingsPerProducer; i++) {
        const int n = p * kSightingsPerProducer + i;
        Sighting s;
        s.address = 0x100000 + (uint64_t)(n % kDistinctDevices);
        s.name = "dev" + std::to_string(n % kDistinctDevices);
        s.rssi = (int16_t)(-30 - (n % 60));
        s.timestamp_ms = clock_ms.load();
        source.emit(s);
      }
    });
  }

  for (std::thread& t : producers) t.join();
  producing.store(false);
  for (std::thread& t : readers) t.join();

  EXPECT_EQ(kDistinctDevices, (int)tracker.currentDevices().size());
  EXPECT_EQ(kDistinctDevices, new_events.load());
  EXPECT_EQ(0, timed_out.load());

  tracker.stop();
  EXPECT_TRUE(tracker.currentDevices().empty());
}

TEST(DiscoveryTrackerConcurrencyTest, StopRacesWithSightings) {
  FakeAdvertisementSource source;
  TrackerConfig config;
  config.sweep_interval_ms = 1;
  DiscoveryTracker tracker(source, config);

  for (int round = 0; round < 20; round++) {
    ASSERT_EQ(TrackerError::None, tracker.start());

    std::thread producer([&] {
      for (int i = 0; i < 200; i++) source.emit((uint64_t)i, "", -50, (uint64_t)i);
    });
    tracker.stop();
    producer.join();

    EXPECT_FALSE(tracker.isListening());
    EXPECT_TRUE(tracker.currentDevices().empty());
  }
}

TEST(DiscoveryTrackerConcurrencyTest, SweeperObserverStoppingDuringStopDoesNotDeadlock) {
  std::atomic<uint64_t> clock_ms{100000};
  FakeAdvertisementSource source;

  TrackerConfig config;
  config.heartbeat_timeout_ms = 5000;
  config.sweep_interval_ms = 5;
  config.clock = [&clock_ms]() { return clock_ms.load(); };

  std::mutex m;
  std::condition_variable cv;
  bool in_observer = false;
  TrackerError restart_result = TrackerError::None;

  DiscoveryTracker tracker(source, config);
  tracker.subscribe([&](const DiscoveryEvent& e) {
    if (e.kind != DiscoveryEventKind::DeviceTimedOut) return;
    {
      std::lock_guard<std::mutex> lock(m);
      in_observer = true;
    }
    cv.notify_all();

    // hold the sweeper thread until the main thread is inside stop()
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (tracker.isListening() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    tracker.stop();
    restart_result = tracker.start();
  });

  ASSERT_EQ(TrackerError::None, tracker.start());
  source.emit(0xAA, "a", -50, clock_ms.load());
  clock_ms += 5001;

  {
    std::unique_lock<std::mutex> lock(m);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return in_observer; }));
  }

  std::future<void> stopped = std::async(std::launch::async, [&tracker] { tracker.stop(); });
  ASSERT_EQ(std::future_status::ready, stopped.wait_for(std::chrono::seconds(5)));

  EXPECT_FALSE(tracker.isListening());
  EXPECT_EQ(TrackerError::Busy, restart_result);

  // once the stop has finished, a normal restart works
  EXPECT_EQ(TrackerError::None, tracker.start());
  tracker.stop();
}

TEST(DiscoveryTrackerConcurrencyTest, RacingStartAndStopDeliverAlternatingLifecycleEvents) {
  FakeAdvertisementSource source;
  TrackerConfig config;
  config.sweep_interval_ms = 0;
  DiscoveryTracker tracker(source, config);

  std::mutex m;
  std::vector<DiscoveryEventKind> lifecycle;
  tracker.subscribe([&](const DiscoveryEvent& e) {
    if (e.kind != DiscoveryEventKind::Started && e.kind != DiscoveryEventKind::Stopped) return;
    std::lock_guard<std::mutex> lock(m);
    lifecycle.push_back(e.kind);
  });

  std::thread starter([&] {
    for (int i = 0; i < 500; i++) EXPECT_EQ(TrackerError::None, tracker.start());
  });
  std::thread stopper([&] {
    for (int i = 0; i < 500; i++) tracker.stop();
  });
  starter.join();
  stopper.join();

  std::lock_guard<std::mutex> lock(m);
  ASSERT_FALSE(lifecycle.empty());
  for (size_t i = 0; i < lifecycle.size(); i++) {
    const DiscoveryEventKind expected = (i % 2 == 0) ? DiscoveryEventKind::Started : DiscoveryEventKind::Stopped;
    ASSERT_EQ(expected, lifecycle[i]) << "at event " << i;
  }
  EXPECT_EQ(lifecycle.back() == DiscoveryEventKind::Started, tracker.isListening());
}

}  // namespace
