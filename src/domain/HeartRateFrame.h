// HeartRateFrame.h
// Decoder for the Heart Rate Measurement characteristic (0x2A37).
//
// Frame layout (little-endian):
//   [0]      flags
//   [1]      BPM as uint8, or [1..2] as uint16 when IsShort is set
//   [..+2]   energy expended, present iff HasEnergyExpended
//   [rest]   RR intervals as uint16 each, present iff HasRRInterval

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "src/domain/HeartRateReading.h"

namespace HeartRateFrame {

// Minimum frame length implied by a flags byte.
size_t minimumLength(uint8_t flags);

// Decodes the first `length` bytes of `data` into outReading.
// Returns false (leaving outReading untouched) when the frame is shorter than
// its flags require. Never reads past `length`. An odd trailing byte in the
// RR-interval section is discarded.
bool decode(const uint8_t* data, size_t length, HeartRateReading& outReading);

}  // namespace HeartRateFrame
