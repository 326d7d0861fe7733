#include "DeviceRecord.h"

#include <cctype>
#include <cstdio>

DeviceRecord DeviceRecord::FromSighting(const Sighting& s) {
  DeviceRecord r;
  r.address = s.address;
  r.name = s.name;
  r.rssi = s.rssi;
  r.timestamp_ms = s.timestamp_ms;
  r.flags = s.flags;
  return r;
}

std::string DeviceRecord::toString() const {
  char buf[48];
  snprintf(buf, sizeof(buf), " [%s] (%d)", FormatAddress(address).c_str(), (int)rssi);
  return (name.empty() ? std::string("[No Name]") : name) + buf;
}

bool operator==(const DeviceRecord& a, const DeviceRecord& b) {
  return a.address == b.address &&
         a.name == b.name &&
         a.rssi == b.rssi &&
         a.timestamp_ms == b.timestamp_ms &&
         a.flags == b.flags &&
         a.platform_id == b.platform_id;
}

bool operator!=(const DeviceRecord& a, const DeviceRecord& b) {
  return !(a == b);
}

std::string FormatAddress(uint64_t address) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
           (unsigned)((address >> 40) & 0xFF), (unsigned)((address >> 32) & 0xFF),
           (unsigned)((address >> 24) & 0xFF), (unsigned)((address >> 16) & 0xFF),
           (unsigned)((address >> 8) & 0xFF),  (unsigned)(address & 0xFF));
  return std::string(buf);
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = (char)std::tolower((unsigned char)c);
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool ParseAddress(const char* s, uint64_t& out) {
  if (!s) return false;

  uint64_t v = 0;
  for (int i = 0; i < 6; i++) {
    const int hi = hex_nibble(s[0]);
    const int lo = (hi < 0) ? -1 : hex_nibble(s[1]);
    if (hi < 0 || lo < 0) return false;
    v = (v << 8) | (uint64_t)((hi << 4) | lo);
    s += 2;

    if (i < 5) {
      if (*s != ':') return false;
      s++;
    }
  }
  if (*s != '\0') return false;

  out = v;
  return true;
}
