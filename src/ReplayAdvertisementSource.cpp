#include "ReplayAdvertisementSource.h"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

ReplayAdvertisementSource::ReplayAdvertisementSource(std::string path, bool paced)
  : _path(std::move(path)), _paced(paced) {}

ReplayAdvertisementSource::ReplayAdvertisementSource(std::istream& input, bool paced)
  : _input(&input), _paced(paced) {}

ReplayAdvertisementSource::~ReplayAdvertisementSource() {
  end();
}

bool ReplayAdvertisementSource::ParseLine(const std::string& line, Sighting& out) {
  std::istringstream in(line);

  unsigned long long ts = 0;
  std::string addr;
  int rssi = 0;
  if (!(in >> ts >> addr >> rssi)) return false;

  uint64_t address = 0;
  if (!ParseAddress(addr.c_str(), address)) return false;
  if (rssi < INT16_MIN || rssi > INT16_MAX) return false;

  std::string name;
  std::getline(in, name);
  const size_t first = name.find_first_not_of(" \t");
  const size_t last  = name.find_last_not_of(" \t\r");
  name = (first == std::string::npos) ? std::string() : name.substr(first, last - first + 1);

  out = Sighting{};
  out.address = address;
  out.name = name;
  out.rssi = (int16_t)rssi;
  out.timestamp_ms = (uint64_t)ts;
  return true;
}

TrackerError ReplayAdvertisementSource::begin(SightingHandler onSighting, StoppedHandler onStopped) {
  end();

  if (!_path.empty()) {
    _file.close();
    _file.clear();
    _file.open(_path);
    if (!_file.is_open()) {
      SPDLOG_WARN("replay: cannot open {}", _path);
      return TrackerError::SourceUnavailable;
    }
    _input = &_file;
  }
  if (!_input) return TrackerError::SourceUnavailable;

  _stop = std::make_shared<std::atomic<bool>>(false);
  _reader = std::thread(&ReplayAdvertisementSource::readerTask, this, _stop,
                        std::move(onSighting), std::move(onStopped));
  return TrackerError::None;
}

void ReplayAdvertisementSource::end() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stop) _stop->store(true);
  }
  _cv.notify_all();

  if (!_reader.joinable()) return;
  if (_reader.get_id() == std::this_thread::get_id()) {
    _reader.detach();
  } else {
    _reader.join();
  }
}

bool ReplayAdvertisementSource::waitUntilDue(const StopToken& stop, uint64_t delta_ms) {
  std::unique_lock<std::mutex> lock(_mutex);
  return !_cv.wait_for(lock, std::chrono::milliseconds(delta_ms),
                       [&stop] { return stop->load(); });
}

void ReplayAdvertisementSource::readerTask(StopToken stop, SightingHandler onSighting, StoppedHandler onStopped) {
  std::string line;
  size_t line_no = 0;
  bool have_prev = false;
  uint64_t prev_ts = 0;

  while (!stop->load() && std::getline(*_input, line)) {
    line_no++;

    const size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos || line[start] == '#') continue;

    Sighting s;
    if (!ParseLine(line, s)) {
      SPDLOG_WARN("replay: skipping malformed line {}: '{}'", line_no, line);
      continue;
    }

    if (_paced && have_prev && s.timestamp_ms > prev_ts) {
      if (!waitUntilDue(stop, s.timestamp_ms - prev_ts)) break;
    }
    have_prev = true;
    prev_ts = s.timestamp_ms;

    _now_ms.store(s.timestamp_ms);
    onSighting(s);
  }

  if (stop->load()) return;

  SPDLOG_INFO("replay: end of input after {} lines", line_no);
  onStopped();
}
