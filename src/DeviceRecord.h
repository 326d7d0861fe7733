#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

enum class DeviceFlags : uint8_t {
  None      = 0,
  Connected = (1 << 0),
  CanPair   = (1 << 1),
  Paired    = (1 << 2)
};

constexpr DeviceFlags operator|(DeviceFlags a, DeviceFlags b)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return static_cast<DeviceFlags>(static_cast<U>(a) | static_cast<U>(b));
}

constexpr DeviceFlags operator&(DeviceFlags a, DeviceFlags b)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return static_cast<DeviceFlags>(static_cast<U>(a) & static_cast<U>(b));
}

constexpr DeviceFlags& operator|=(DeviceFlags& a, DeviceFlags b)
{
  a = a | b;
  return a;
}

constexpr bool HasFlag(DeviceFlags v, DeviceFlags f)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return (static_cast<U>(v) & static_cast<U>(f)) != 0;
}

// One raw advertisement as delivered by an AdvertisementSource.
struct Sighting {
  uint64_t    address = 0;        // 48-bit hardware address (identity)
  std::string name;               // empty when the advertisement carried no name
  int16_t     rssi = 0;           // dBm, passed through untouched
  uint64_t    timestamp_ms = 0;   // monotonic ms of the broadcast
  DeviceFlags flags = DeviceFlags::None;
};

// Latest known state of one device. Plain value; the tracker hands out copies.
struct DeviceRecord {
  uint64_t    address = 0;
  std::string name;
  int16_t     rssi = 0;
  uint64_t    timestamp_ms = 0;   // last broadcast
  DeviceFlags flags = DeviceFlags::None;
  std::string platform_id;        // optional id from device-info lookup, never a key

  static DeviceRecord FromSighting(const Sighting& s);

  // "<name or [No Name]> [AA:BB:CC:DD:EE:FF] (rssi)"
  std::string toString() const;
};

bool operator==(const DeviceRecord& a, const DeviceRecord& b);
bool operator!=(const DeviceRecord& a, const DeviceRecord& b);

// "AA:BB:CC:DD:EE:FF", most significant byte first.
std::string FormatAddress(uint64_t address);

// Accepts "AA:BB:CC:DD:EE:FF" (case-insensitive hex). Returns false on malformed input.
bool ParseAddress(const char* s, uint64_t& out);
