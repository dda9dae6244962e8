// HeartRateCentral.h
// Abstract hardware surface of a BLE central able to find Heart Rate
// peripherals and open GATT links to them. The NimBLE implementation lives
// in src/infrastructure/ble; tests supply scripted fakes.
//
// Every call may block for a long time on radio I/O. Callers keep them off
// time-sensitive contexts.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "src/domain/DeviceTarget.h"

// Identity of a discovered peripheral, as logged for diagnostics.
struct BleDeviceInfo {
  std::string name;
  uint64_t address = 0;
  int rssi = 0;
};

// One GATT session to a peripheral. Owned exclusively by HeartRateService.
class HeartRateLink {
 public:
  // Invoked from the BLE host context for every measurement notification.
  // `linkId` is the id given to subscribe(); in-flight deliveries may land
  // after the link has been released.
  using NotifyCallback = void (*)(uint32_t linkId, const uint8_t* data, size_t length,
                                  void* ctx);

  virtual ~HeartRateLink() = default;

  virtual uint64_t address() const = 0;

  // Locates the Heart Rate service (0x180D). Returns false when absent.
  virtual bool resolveService() = 0;

  // Locates the Heart Rate Measurement characteristic (0x2A37) on the
  // resolved service. Returns false when absent.
  virtual bool resolveMeasurement() = 0;

  // Writes the notify bit of the CCCD and registers cb, which will be called
  // with linkId. Returns true only when the peripheral acknowledged the write
  // with success.
  virtual bool subscribe(uint32_t linkId, NotifyCallback cb, void* ctx) = 0;

  // Unsubscribes and disconnects. Idempotent.
  virtual void release() = 0;
};

class HeartRateCentral {
 public:
  virtual ~HeartRateCentral() = default;

  // Fills outDevices with candidates: the addressed device when the target
  // names one, otherwise every device advertising the Heart Rate service,
  // in discovery order. Returns false if the scan itself failed.
  virtual bool discover(const DeviceTarget& target, std::vector<BleDeviceInfo>& outDevices) = 0;

  // Establishes a GATT session. Returns nullptr when the device is
  // unreachable.
  virtual std::unique_ptr<HeartRateLink> open(const BleDeviceInfo& device) = 0;
};
