// NotificationBridge.h
// Turns raw measurement notifications into Reading events.
// Responsibilities:
// - Drop empty payloads
// - Reuse one scratch buffer sized to the last payload (realloc on size change)
// - Decode through HeartRateFrame and publish successes; log and drop the rest

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <vector>

#include "src/domain/ReadingBroadcast.h"

class NotificationBridge {
 public:
  explicit NotificationBridge(ReadingBroadcast& readings);
  ~NotificationBridge();

  NotificationBridge(const NotificationBridge&) = delete;
  NotificationBridge& operator=(const NotificationBridge&) = delete;

  // Entry point from the BLE host context. Safe to call concurrently with
  // itself and with link teardown.
  void onNotification(const uint8_t* data, size_t length);

  uint32_t framesDecoded() const { return framesDecoded_.load(); }
  uint32_t framesSkipped() const { return framesSkipped_.load(); }

  // Number of scratch buffer (re)allocations so far.
  uint32_t bufferAllocations() const { return bufferAllocations_.load(); }

 private:
  typedef std::vector<uint8_t> Buffer;

  // Exclusive use of the scratch buffer for one decode; puts it back on scope exit.
  class ScratchLease;

  ReadingBroadcast& readings_;
  std::atomic<Buffer*> scratch_;
  std::atomic<uint32_t> framesDecoded_;
  std::atomic<uint32_t> framesSkipped_;
  std::atomic<uint32_t> bufferAllocations_;
};
