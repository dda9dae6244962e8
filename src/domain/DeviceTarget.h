// DeviceTarget.h
// Which peripheral to connect to: a specific 48-bit address, or any device
// advertising the Heart Rate service.

#pragma once

#include <stdint.h>

#include <string>

struct DeviceTarget {
  bool hasAddress = false;
  uint64_t address = 0;  // 48-bit, most significant octet first when formatted

  static DeviceTarget any() { return DeviceTarget(); }

  static DeviceTarget forAddress(uint64_t address) {
    DeviceTarget t;
    t.hasAddress = true;
    t.address = address & kAddressMask;
    return t;
  }

  // Parses "AA:BB:CC:DD:EE:FF" or a decimal 48-bit integer. Empty or
  // whitespace-only text yields any(). Returns false on malformed input and
  // leaves outTarget untouched.
  static bool parse(const char* text, DeviceTarget& outTarget);

  // Renders an address as "AA:BB:CC:DD:EE:FF".
  static std::string format(uint64_t address);

  std::string describe() const {
    return hasAddress ? format(address) : std::string("any heart rate device");
  }

  static const uint64_t kAddressMask = 0xFFFFFFFFFFFFull;
};
