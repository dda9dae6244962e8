// HeartRateWatchdog.h
// Supervises a HeartRateSource and forces a reconnect when no Reading
// (success or error) has arrived within the staleness timeout.

#pragma once

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "src/config/BuildConfig.h"
#include "src/domain/DeviceTarget.h"
#include "src/domain/HeartRateSource.h"

class HeartRateWatchdog {
 public:
  enum class State { Idle, Running, Disposed };

  HeartRateWatchdog(HeartRateSource& source, const DeviceTarget& target, uint32_t timeoutMs,
                    uint32_t pollIntervalMs = BUILD_WATCHDOG_POLL_MS);
  ~HeartRateWatchdog();

  HeartRateWatchdog(const HeartRateWatchdog&) = delete;
  HeartRateWatchdog& operator=(const HeartRateWatchdog&) = delete;

  // Idle -> Running: resets the timer and starts the poll thread.
  // No-op when already running or disposed.
  void start();

  // -> Disposed, then joins the poll thread. Idempotent. Dispose the source
  // first if a reconnect may be in flight, otherwise this waits for it.
  void dispose();

  State state() const;

  // Number of reconnects triggered so far.
  uint32_t reconnectCount() const { return reconnects_.load(); }

 private:
  typedef std::chrono::steady_clock Clock;

  static void onReading(const HeartRateReading& reading, void* ctx);
  void resetTimer();
  void run();

  HeartRateSource& source_;
  const DeviceTarget target_;
  const Clock::duration timeout_;
  const Clock::duration pollInterval_;
  uint32_t subscription_ = 0;

  // Guards lastUpdate_ and state_
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  Clock::time_point lastUpdate_;
  State state_ = State::Idle;

  std::thread thread_;
  std::atomic<uint32_t> reconnects_;
};
