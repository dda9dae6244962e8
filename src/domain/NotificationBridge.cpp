// NotificationBridge.cpp

#include "NotificationBridge.h"

#include <string.h>

#include "src/domain/HeartRateFrame.h"
#include "src/infrastructure/Logger.h"

class NotificationBridge::ScratchLease {
 public:
  ScratchLease(NotificationBridge& owner, size_t length) : owner_(owner) {
    buffer_ = owner_.scratch_.exchange(nullptr);
    if (!buffer_ || buffer_->size() != length) {
      // Absent (first frame, or another delivery holds it) or wrong size
      delete buffer_;
      buffer_ = new Buffer(length);
      owner_.bufferAllocations_.fetch_add(1);
    }
  }

  ~ScratchLease() {
    Buffer* previous = owner_.scratch_.exchange(buffer_);
    delete previous;
  }

  ScratchLease(const ScratchLease&) = delete;
  ScratchLease& operator=(const ScratchLease&) = delete;

  uint8_t* data() { return buffer_->data(); }

 private:
  NotificationBridge& owner_;
  Buffer* buffer_ = nullptr;
};

NotificationBridge::NotificationBridge(ReadingBroadcast& readings)
    : readings_(readings),
      scratch_(nullptr),
      framesDecoded_(0),
      framesSkipped_(0),
      bufferAllocations_(0) {}

NotificationBridge::~NotificationBridge() {
  delete scratch_.exchange(nullptr);
}

void NotificationBridge::onNotification(const uint8_t* data, size_t length) {
  if (!data || length == 0) return;

  HeartRateReading reading;
  bool decoded = false;
  {
    ScratchLease lease(*this, length);
    memcpy(lease.data(), data, length);
    decoded = HeartRateFrame::decode(lease.data(), length, reading);
  }

  if (!decoded) {
    framesSkipped_.fetch_add(1);
    Logger::warn("HR: frame skipped, too short (len=%u flags=0x%02X)", (unsigned)length,
                 (unsigned)data[0]);
    return;
  }

  framesDecoded_.fetch_add(1);
  readings_.publish(reading);
}
