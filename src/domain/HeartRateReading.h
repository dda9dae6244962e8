// HeartRateReading.h
// Decoded Heart Rate Measurement value, or an error entry carrying the most
// recent connection fault. Both travel on the same Reading stream.

#pragma once

#include <stdint.h>

#include <string>
#include <vector>

// Bits of the measurement flags byte (offset 0).
namespace HeartRateFlags {

static const uint8_t None = 0;
static const uint8_t IsShort = 1u << 0;            // BPM is uint16 instead of uint8
static const uint8_t ContactMask = 3u << 1;        // ContactSensorStatus, bits 1..2
static const uint8_t HasEnergyExpended = 1u << 3;
static const uint8_t HasRRInterval = 1u << 4;

}  // namespace HeartRateFlags

enum class ContactSensorStatus : uint8_t {
  NotSupported = 0,
  NotSupported2 = 1,
  NoContact = 2,
  Contact = 3,
};

inline const char* contactSensorStatusName(ContactSensorStatus s) {
  switch (s) {
    case ContactSensorStatus::NotSupported: return "NotSupported";
    case ContactSensorStatus::NotSupported2: return "NotSupported2";
    case ContactSensorStatus::NoContact: return "NoContact";
    case ContactSensorStatus::Contact: return "Contact";
  }
  return "Unknown";
}

struct HeartRateReading {
  uint8_t flags = HeartRateFlags::None;
  ContactSensorStatus status = ContactSensorStatus::NotSupported;
  int beatsPerMinute = 0;

  bool hasEnergyExpended = false;
  int energyExpended = 0;  // kJ, valid only when hasEnergyExpended

  // Raw values in 1/1024 s units, in frame order. Empty when absent.
  std::vector<uint16_t> rrIntervals;

  bool isError = false;
  std::string error;

  static HeartRateReading makeError(const std::string& message) {
    HeartRateReading r;
    r.isError = true;
    r.error = message;
    return r;
  }
};

// Converts a raw RR-interval value (1/1024 s) to milliseconds.
inline double rrIntervalMs(uint16_t raw) {
  return (double)raw * 1000.0 / 1024.0;
}
