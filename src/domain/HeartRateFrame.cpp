// HeartRateFrame.cpp

#include "HeartRateFrame.h"

namespace HeartRateFrame {

static inline uint16_t readLe16(const uint8_t* p) {
  return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}

size_t minimumLength(uint8_t flags) {
  return (flags & HeartRateFlags::IsShort) ? 3 : 2;
}

bool decode(const uint8_t* data, size_t length, HeartRateReading& outReading) {
  if (!data || length == 0) return false;

  const uint8_t flags = data[0];
  const bool isShort = (flags & HeartRateFlags::IsShort) != 0;
  if (length < minimumLength(flags)) return false;

  HeartRateReading r;
  r.flags = flags;
  r.status = static_cast<ContactSensorStatus>((flags >> 1) & 3);

  size_t pos = 1;
  if (isShort) {
    r.beatsPerMinute = readLe16(data + pos);
    pos += 2;
  } else {
    r.beatsPerMinute = data[pos];
    pos += 1;
  }

  if (flags & HeartRateFlags::HasEnergyExpended) {
    if (length - pos < 2) return false;
    r.hasEnergyExpended = true;
    r.energyExpended = readLe16(data + pos);
    pos += 2;
  }

  if (flags & HeartRateFlags::HasRRInterval) {
    const size_t count = (length - pos) / 2;
    r.rrIntervals.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      r.rrIntervals.push_back(readLe16(data + pos));
      pos += 2;
    }
  }

  outReading = r;
  return true;
}

}  // namespace HeartRateFrame
