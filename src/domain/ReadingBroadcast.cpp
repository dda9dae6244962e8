// ReadingBroadcast.cpp

#include "ReadingBroadcast.h"

uint32_t ReadingBroadcast::subscribe(Callback cb, void* ctx) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry e;
  e.id = nextId_++;
  if (nextId_ == 0) nextId_ = 1;
  e.cb = cb;
  e.ctx = ctx;
  entries_.push_back(e);
  return e.id;
}

bool ReadingBroadcast::unsubscribe(uint32_t id) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool found = false;
  for (std::vector<Entry>::iterator it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->id == id) {
      entries_.erase(it);
      found = true;
      break;
    }
  }
  if (!found) return false;

  // Snapshots taken from now on no longer hold the entry; wait out the
  // older ones still delivering on other threads.
  const uint64_t cutoff = nextTicket_;
  const std::thread::id self = std::this_thread::get_id();
  idle_.wait(lock, [this, cutoff, self] { return !olderDeliveryRunning(cutoff, self); });
  return true;
}

bool ReadingBroadcast::olderDeliveryRunning(uint64_t cutoff, std::thread::id self) const {
  for (size_t i = 0; i < deliveries_.size(); ++i) {
    if (deliveries_[i].ticket < cutoff && deliveries_[i].thread != self) return true;
  }
  return false;
}

void ReadingBroadcast::publish(const HeartRateReading& reading) {
  std::vector<Entry> snapshot;
  uint64_t ticket;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = entries_;
    ticket = nextTicket_++;
    Delivery d;
    d.ticket = ticket;
    d.thread = std::this_thread::get_id();
    deliveries_.push_back(d);
  }

  for (size_t i = 0; i < snapshot.size(); ++i) {
    if (snapshot[i].cb) snapshot[i].cb(reading, snapshot[i].ctx);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (std::vector<Delivery>::iterator it = deliveries_.begin(); it != deliveries_.end(); ++it) {
    if (it->ticket == ticket) {
      deliveries_.erase(it);
      break;
    }
  }
  idle_.notify_all();
}

size_t ReadingBroadcast::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}
