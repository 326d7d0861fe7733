#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

#include "DiscoveryTracker.h"
#include "ReplayAdvertisementSource.h"

namespace {

TEST(ReplayAdvertisementSourceTest, ParseLineReadsAllFields) {
  Sighting s;
  ASSERT_TRUE(ReplayAdvertisementSource::ParseLine("1500 aa:bb:cc:dd:ee:ff -62  LG webOS TV  ", s));
  EXPECT_EQ(1500u, s.timestamp_ms);
  EXPECT_EQ(0xAABBCCDDEEFFULL, s.address);
  EXPECT_EQ(-62, s.rssi);
  EXPECT_EQ("LG webOS TV", s.name);
}

TEST(ReplayAdvertisementSourceTest, ParseLineNameIsOptional) {
  Sighting s;
  ASSERT_TRUE(ReplayAdvertisementSource::ParseLine("0 00:00:00:00:00:01 -90", s));
  EXPECT_TRUE(s.name.empty());
  EXPECT_EQ(1u, s.address);
}

TEST(ReplayAdvertisementSourceTest, ParseLineRejectsGarbage) {
  Sighting s;
  EXPECT_FALSE(ReplayAdvertisementSource::ParseLine("", s));
  EXPECT_FALSE(ReplayAdvertisementSource::ParseLine("abc 00:00:00:00:00:01 -90", s));
  EXPECT_FALSE(ReplayAdvertisementSource::ParseLine("10 00:00:00:00:01 -90", s));
  EXPECT_FALSE(ReplayAdvertisementSource::ParseLine("10 00:00:00:00:00:01", s));
  EXPECT_FALSE(ReplayAdvertisementSource::ParseLine("10 00:00:00:00:00:01 99999", s));
}

class StopWaiter {
public:
  void operator()(const DiscoveryEvent& e) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (e.kind == DiscoveryEventKind::NewDeviceDiscovered) new_devices.push_back(e.device);
    if (e.kind == DiscoveryEventKind::Stopped) _stopped = true;
    _cv.notify_all();
  }

  bool wait() {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, std::chrono::seconds(5), [this] { return _stopped; });
  }

  std::vector<DeviceRecord> new_devices;

private:
  std::mutex _mutex;
  std::condition_variable _cv;
  bool _stopped = false;
};

TEST(ReplayAdvertisementSourceTest, ReplaysStreamIntoTrackerAndStopsAtEnd) {
  std::istringstream input(
    "# recorded in the lab\n"
    "1000 00:00:00:00:00:01 -40 Speaker\n"
    "\n"
    "1100 00:00:00:00:00:02 -70\n"
    "not a sighting\n"
    "1200 00:00:00:00:00:01 -45 Speaker\n");

  ReplayAdvertisementSource source(input);
  TrackerConfig config;
  config.sweep_interval_ms = 0;
  config.clock = [&source]() { return source.now(); };
  DiscoveryTracker tracker(source, config);

  StopWaiter waiter;
  tracker.subscribe(std::ref(waiter));
  ASSERT_EQ(TrackerError::None, tracker.start());
  ASSERT_TRUE(waiter.wait());

  EXPECT_FALSE(tracker.isListening());
  EXPECT_EQ(1200u, source.now());
  ASSERT_EQ(2u, waiter.new_devices.size());
  EXPECT_EQ(1u, waiter.new_devices[0].address);
  EXPECT_EQ("Speaker", waiter.new_devices[0].name);
  EXPECT_EQ(2u, waiter.new_devices[1].address);
}

TEST(ReplayAdvertisementSourceTest, MissingFileIsSourceUnavailable) {
  ReplayAdvertisementSource source(std::string("/nonexistent/sightline/replay.txt"));
  DiscoveryTracker tracker(source);
  EXPECT_EQ(TrackerError::SourceUnavailable, tracker.start());
  EXPECT_FALSE(tracker.isListening());
}

TEST(ReplayAdvertisementSourceTest, EndStopsPacedReplayWithoutStoppedCallback) {
  std::istringstream input(
    "0 00:00:00:00:00:01 -40\n"
    "600000 00:00:00:00:00:02 -40\n");

  ReplayAdvertisementSource source(input, true);
  int stopped = 0;
  ASSERT_EQ(TrackerError::None, source.begin([](const Sighting&) {}, [&stopped]() { stopped++; }));
  source.end();
  EXPECT_EQ(0, stopped);
}

TEST(ReplayAdvertisementSourceTest, RestartFromReaderCallbackLeavesOneReader) {
  constexpr int kLines = 2000;
  std::ostringstream text;
  for (int i = 0; i < kLines; i++) text << i << " 00:00:00:00:00:01 -40\n";
  std::istringstream input(text.str());
  ReplayAdvertisementSource source(input);

  std::mutex m;
  std::condition_variable cv;
  int stopped_calls = 0;
  int sightings = 0;
  std::set<std::thread::id> later_readers;
  bool restarted = false;

  ReplayAdvertisementSource::StoppedHandler on_stopped = [&]() {
    std::lock_guard<std::mutex> lock(m);
    stopped_calls++;
    cv.notify_all();
  };
  ReplayAdvertisementSource::SightingHandler later = [&](const Sighting&) {
    std::lock_guard<std::mutex> lock(m);
    sightings++;
    later_readers.insert(std::this_thread::get_id());
  };
  ReplayAdvertisementSource::SightingHandler first = [&](const Sighting&) {
    {
      std::lock_guard<std::mutex> lock(m);
      sightings++;
    }
    if (restarted) return;
    restarted = true;
    source.end();
    EXPECT_EQ(TrackerError::None, source.begin(later, on_stopped));
  };

  ASSERT_EQ(TrackerError::None, source.begin(first, on_stopped));
  {
    std::unique_lock<std::mutex> lock(m);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return stopped_calls > 0; }));
  }
  source.end();

  std::lock_guard<std::mutex> lock(m);
  EXPECT_EQ(1, stopped_calls);
  EXPECT_EQ(kLines, sightings);
  EXPECT_EQ(1u, later_readers.size());
}

}  // namespace
