// HeartRateService.h
// Connection manager for a Heart Rate peripheral: discovery, GATT
// resolution, notify subscription and exclusive ownership of the live link.
//
// Threading
// - connect()/initiateDefault() block on radio I/O; run them on a worker.
// - Notifications arrive on the BLE host context and may overlap a link
//   replacement; deliveries for a superseded link are dropped.
// - dispose() never interrupts an in-flight connect(). The install step of
//   that connect() sees the flag, releases its new link and fails Disposed.
// - The destructor waits for notification deliveries already past the
//   disposed check; none start after dispose() has released the link.

#pragma once

#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "src/config/BuildConfig.h"
#include "src/domain/HeartRateCentral.h"
#include "src/domain/HeartRateSource.h"
#include "src/domain/LinkSlot.h"
#include "src/domain/NotificationBridge.h"
#include "src/domain/ReadingBroadcast.h"

class HeartRateService : public HeartRateSource {
 public:
  explicit HeartRateService(HeartRateCentral& central,
                            uint32_t retryBackoffMs = BUILD_RETRY_BACKOFF_MS);
  ~HeartRateService() override;

  HeartRateService(const HeartRateService&) = delete;
  HeartRateService& operator=(const HeartRateService&) = delete;

  // Single connection attempt. On success the previous link (if any) has
  // been released and the new one is installed and subscribed.
  ConnectResult connect(const DeviceTarget& target);

  // Repeats connect() until it succeeds, publishing an error Reading and
  // sleeping the retry backoff after each failure. Returns early only when
  // the service is disposed.
  ConnectResult initiateDefault(const DeviceTarget& target) override;

  // Releases the live link, if any. Idempotent.
  void cleanup();

  // Marks the service disposed and releases the live link. Idempotent.
  void dispose();

  bool isDisposed() const override { return disposed_.load(); }

  uint32_t subscribe(ReadingBroadcast::Callback cb, void* ctx) override {
    return readings_.subscribe(cb, ctx);
  }
  bool unsubscribe(uint32_t id) override { return readings_.unsubscribe(id); }

  bool isConnected() const { return !slot_.empty(); }

  const NotificationBridge& bridge() const { return bridge_; }

 private:
  static void onLinkNotification(uint32_t linkId, const uint8_t* data, size_t length,
                                 void* ctx);

  ConnectResult resolveCandidate(const DeviceTarget& target, BleDeviceInfo& outDevice);
  ConnectResult buildLink(const BleDeviceInfo& device, uint32_t linkId,
                          std::unique_ptr<HeartRateLink>& outLink);

  // Sleeps up to the retry backoff; returns early when disposed.
  void backoff();

  HeartRateCentral& central_;
  const uint32_t retryBackoffMs_;

  ReadingBroadcast readings_;
  NotificationBridge bridge_;
  LinkSlot slot_;

  std::atomic<bool> disposed_;
  // Ids handed to links so late deliveries from old links can be told apart
  std::atomic<uint32_t> nextLinkId_;

  // Exclusion lock shared by handle replacement and disposal
  std::mutex disposeMutex_;
  // Serializes whole connect() calls (worker and watchdog may both reconnect)
  std::mutex connectMutex_;

  std::mutex wakeMutex_;
  std::condition_variable wake_;

  // Notification deliveries currently inside the bridge
  std::mutex notifyMutex_;
  std::condition_variable notifyIdle_;
  uint32_t notifyInFlight_ = 0;
};
