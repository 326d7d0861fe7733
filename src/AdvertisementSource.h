#pragma once

#include <functional>

#include "DeviceRecord.h"
#include "TrackerError.h"

// Radio-side producer of sightings. Implementations deliver sightings one at a
// time from their own context and must not call either handler from end().
class AdvertisementSource {
public:
  using SightingHandler = std::function<void(const Sighting&)>;
  using StoppedHandler  = std::function<void()>;

  virtual ~AdvertisementSource() = default;

  // Opens the receiver and starts delivering. onStopped fires only when the
  // source stops on its own (end of input, radio reset, ...).
  virtual TrackerError begin(SightingHandler onSighting, StoppedHandler onStopped) = 0;
  // Stops delivery and waits for the delivering context to finish. Safe to
  // call when already stopped.
  virtual void end() = 0;
};
