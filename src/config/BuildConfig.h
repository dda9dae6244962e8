// BuildConfig.h
// Central build-time configuration.

#pragma once

#define BUILD_LOG_BAUD_RATE 115200

// Advertised name of this central (shown by peripherals that log peers).
#ifndef BUILD_DEVICE_NAME
#define BUILD_DEVICE_NAME "HeartRateMonitor"
#endif

// Pause between failed connection attempts in HeartRateService::initiateDefault().
#ifndef BUILD_RETRY_BACKOFF_MS
#define BUILD_RETRY_BACKOFF_MS 2500
#endif

// How often the watchdog checks for stale readings.
#ifndef BUILD_WATCHDOG_POLL_MS
#define BUILD_WATCHDOG_POLL_MS 10000
#endif

// Default staleness timeout before the watchdog forces a reconnect.
#ifndef BUILD_DISCONNECTED_TIMEOUT_MS
#define BUILD_DISCONNECTED_TIMEOUT_MS 10000
#endif

// Duration of one discovery scan, in seconds.
#ifndef BUILD_SCAN_SECONDS
#define BUILD_SCAN_SECONDS 5
#endif

// Stack size for the connection worker and watchdog threads on ESP32.
#ifndef BUILD_WORKER_STACK_BYTES
#define BUILD_WORKER_STACK_BYTES 8192
#endif
