// LinkSlot.h
// Holder for the single live HeartRateLink. The link is swapped, never
// mutated; whatever leaves the slot is released before it is destroyed.

#pragma once

#include <stdint.h>

#include <memory>
#include <mutex>

#include "src/domain/HeartRateCentral.h"

class LinkSlot {
 public:
  LinkSlot() = default;
  ~LinkSlot();

  LinkSlot(const LinkSlot&) = delete;
  LinkSlot& operator=(const LinkSlot&) = delete;

  // Takes the current link out of the slot, leaving it empty.
  std::unique_ptr<HeartRateLink> take();

  // Takes and releases the current link. Returns false if the slot was empty.
  bool releaseCurrent();

  // Releases the current link (if any), then installs next under linkId.
  void replace(std::unique_ptr<HeartRateLink> next, uint32_t linkId);

  // True if a link is installed under linkId.
  bool isCurrent(uint32_t linkId) const;

  bool empty() const;

  // Releases and destroys a link that never made it into (or left) a slot.
  static void dispose(std::unique_ptr<HeartRateLink> link);

 private:
  mutable std::mutex mutex_;
  std::unique_ptr<HeartRateLink> link_;
  uint32_t linkId_ = 0;
};
