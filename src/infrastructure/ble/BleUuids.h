#pragma once

#include <stdint.h>

// Bluetooth SIG assigned numbers used by the heart rate central.
namespace BleUuids {

// Services
static const uint16_t SERVICE_HEART_RATE = 0x180D;

// Characteristics
static const uint16_t CHAR_HEART_RATE_MEASUREMENT = 0x2A37;  // notify only

}
