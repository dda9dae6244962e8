// ReadingBroadcast.h
// Observer registration list for the Reading stream. Every subscriber
// receives every published reading, in registration order.

#pragma once

#include <stdint.h>

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "src/domain/HeartRateReading.h"

class ReadingBroadcast {
 public:
  // C-style callback to avoid libstdc++ bloat from std::function
  using Callback = void (*)(const HeartRateReading& reading, void* ctx);

  // Registers a subscriber and returns its id (never 0).
  uint32_t subscribe(Callback cb, void* ctx);

  // Removes a subscriber. Returns false if the id is unknown.
  // On return no delivery that could still reach the subscriber is running
  // on another thread, so its ctx may be destroyed. Deliveries on the
  // calling thread (unsubscribing from inside a callback) are not waited for.
  bool unsubscribe(uint32_t id);

  // Delivers the reading to a snapshot of the current subscribers. Callbacks
  // run outside the registration lock and may unsubscribe themselves.
  void publish(const HeartRateReading& reading);

  size_t subscriberCount() const;

 private:
  struct Entry {
    uint32_t id;
    Callback cb;
    void* ctx;
  };

  // One publish() in progress. Its snapshot was taken at `ticket`.
  struct Delivery {
    uint64_t ticket;
    std::thread::id thread;
  };

  bool olderDeliveryRunning(uint64_t cutoff, std::thread::id self) const;

  mutable std::mutex mutex_;
  std::condition_variable idle_;
  std::vector<Entry> entries_;
  std::vector<Delivery> deliveries_;
  uint32_t nextId_ = 1;
  uint64_t nextTicket_ = 0;
};
