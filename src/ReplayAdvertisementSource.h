#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "AdvertisementSource.h"

// Host-side source that replays recorded sightings, one per line:
//
//   <timestamp_ms> <AA:BB:CC:DD:EE:FF> <rssi> [name...]
//
// '#' starts a comment. Malformed lines are skipped. End of input is reported
// through the stopped handler, like a radio dropping out.
class ReplayAdvertisementSource : public AdvertisementSource {
public:
  // Opens path on begin(); a missing file fails begin().
  explicit ReplayAdvertisementSource(std::string path, bool paced = false);
  // Reads from a caller-owned stream (stdin, tests).
  explicit ReplayAdvertisementSource(std::istream& input, bool paced = false);
  ~ReplayAdvertisementSource() override;

  TrackerError begin(SightingHandler onSighting, StoppedHandler onStopped) override;
  void end() override;

  // Timestamp of the most recently replayed sighting; usable as the tracker clock.
  uint64_t now() const { return _now_ms.load(); }

  static bool ParseLine(const std::string& line, Sighting& out);

private:
  using StopToken = std::shared_ptr<std::atomic<bool>>;

  void readerTask(StopToken stop, SightingHandler onSighting, StoppedHandler onStopped);
  bool waitUntilDue(const StopToken& stop, uint64_t delta_ms);

  std::string   _path;
  std::ifstream _file;
  std::istream* _input = nullptr;
  bool          _paced = false;

  std::atomic<uint64_t> _now_ms{0};
  // One per begin(). A reader that ended itself from its own callback is
  // detached and must never touch the stream again once its token is set.
  StopToken             _stop;

  std::mutex              _mutex;
  std::condition_variable _cv;
  std::thread             _reader;
};
