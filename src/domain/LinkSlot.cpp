// LinkSlot.cpp

#include "LinkSlot.h"

LinkSlot::~LinkSlot() {
  releaseCurrent();
}

std::unique_ptr<HeartRateLink> LinkSlot::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  linkId_ = 0;
  return std::move(link_);
}

bool LinkSlot::releaseCurrent() {
  std::unique_ptr<HeartRateLink> old = take();
  if (!old) return false;
  dispose(std::move(old));
  return true;
}

void LinkSlot::replace(std::unique_ptr<HeartRateLink> next, uint32_t linkId) {
  // Old link is gone before the new one becomes visible
  releaseCurrent();
  std::lock_guard<std::mutex> lock(mutex_);
  link_ = std::move(next);
  linkId_ = link_ ? linkId : 0;
}

bool LinkSlot::isCurrent(uint32_t linkId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return link_ && linkId != 0 && linkId_ == linkId;
}

bool LinkSlot::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !link_;
}

void LinkSlot::dispose(std::unique_ptr<HeartRateLink> link) {
  if (!link) return;
  link->release();
  link.reset();
}
