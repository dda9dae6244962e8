// HeartRateSettings.h
// Runtime configuration supplied to the connection manager and watchdog.

#pragma once

#include <stdint.h>

#include "src/config/BuildConfig.h"
#include "src/domain/DeviceTarget.h"

struct HeartRateSettings {
  DeviceTarget target;  // any() unless a device address is pinned
  uint32_t disconnectedTimeoutMs = BUILD_DISCONNECTED_TIMEOUT_MS;
  uint32_t watchdogPollMs = BUILD_WATCHDOG_POLL_MS;
  uint8_t logLevel = 2;  // LOG_LEVEL_INFO

  // Restores defaults for values a stale or hand-edited record got wrong.
  void normalize() {
    if (disconnectedTimeoutMs == 0) disconnectedTimeoutMs = BUILD_DISCONNECTED_TIMEOUT_MS;
    if (watchdogPollMs == 0) watchdogPollMs = BUILD_WATCHDOG_POLL_MS;
    if (logLevel > 3) logLevel = 2;
  }
};
