#pragma once

#include <stdint.h>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "src/config/BuildConfig.h"
#include "src/domain/HeartRateCentral.h"

// NimBLE-Arduino implementation of the heart rate central. Scans are
// blocking (BUILD_SCAN_SECONDS); GATT calls block on the NimBLE host.
class NimBleHeartRateCentral : public HeartRateCentral {
 public:
  NimBleHeartRateCentral() = default;
  ~NimBleHeartRateCentral() override = default;

  // Initializes the NimBLE host. Call once before any other method.
  void begin(const char* deviceName);

  bool discover(const DeviceTarget& target, std::vector<BleDeviceInfo>& outDevices) override;
  std::unique_ptr<HeartRateLink> open(const BleDeviceInfo& device) override;

 private:
  class Link;  // defined in .cpp

  bool started_ = false;
  uint32_t scanSeconds_ = BUILD_SCAN_SECONDS;

  // Address type (public/random) seen in the last scan, keyed by address
  std::mutex typesMutex_;
  std::map<uint64_t, uint8_t> addressTypes_;
};
