// FakeHeartRateCentral.h
// Scripted HeartRateCentral for host tests. Records every hardware call and
// tracks how many links are alive (opened and not yet released).

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "src/domain/HeartRateCentral.h"

struct FakeScript {
  std::vector<BleDeviceInfo> devices;
  bool scanOk = true;
  bool reachable = true;
  bool hasService = true;
  bool hasMeasurement = true;
  bool subscribeAck = true;
};

class FakeHeartRateCentral;

class FakeHeartRateLink : public HeartRateLink {
 public:
  FakeHeartRateLink(FakeHeartRateCentral& owner, uint64_t address, const FakeScript& script)
      : owner_(owner), address_(address), script_(script) {}
  ~FakeHeartRateLink() override;

  uint64_t address() const override { return address_; }
  bool resolveService() override { return script_.hasService; }
  bool resolveMeasurement() override { return script_.hasMeasurement; }
  bool subscribe(uint32_t linkId, NotifyCallback cb, void* ctx) override;
  void release() override;

  // Simulates a notification from the peripheral.
  void notify(const std::vector<uint8_t>& frame) {
    if (cb_) cb_(linkId_, frame.data(), frame.size(), ctx_);
  }

  bool released() const { return released_; }

 private:
  FakeHeartRateCentral& owner_;
  uint64_t address_;
  FakeScript script_;
  uint32_t linkId_ = 0;
  NotifyCallback cb_ = nullptr;
  void* ctx_ = nullptr;
  bool released_ = false;
};

class FakeHeartRateCentral : public HeartRateCentral {
 public:
  bool discover(const DeviceTarget& target, std::vector<BleDeviceInfo>& outDevices) override {
    std::lock_guard<std::mutex> lock(mutex_);
    discoverCalls++;
    outDevices.clear();
    if (!script.scanOk) return false;
    for (size_t i = 0; i < script.devices.size(); ++i) {
      if (target.hasAddress && script.devices[i].address != target.address) continue;
      outDevices.push_back(script.devices[i]);
    }
    return true;
  }

  std::unique_ptr<HeartRateLink> open(const BleDeviceInfo& device) override {
    std::unique_ptr<HeartRateLink> result;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      openCalls++;
      lastOpened = device;
      if (script.reachable) {
        FakeHeartRateLink* link = new FakeHeartRateLink(*this, device.address, script);
        links.push_back(link);
        int live = ++liveLinks;
        if (live > maxLiveLinks) maxLiveLinks = live;
        result.reset(link);
      }
    }
    // Runs unlocked so it may block while the test drives the service
    if (openHook) openHook();
    return result;
  }

  // Changes reachability while a worker may be inside open().
  void setReachable(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    script.reachable = reachable;
  }

  // Most recently opened link; valid until the service destroys it.
  FakeHeartRateLink* lastLink() {
    std::lock_guard<std::mutex> lock(mutex_);
    return links.empty() ? nullptr : links.back();
  }

  int hardwareCalls() const { return discoverCalls.load() + openCalls.load(); }

  // Replays a delivery through the callback registered by the n-th
  // subscription, as a late in-flight notification would arrive.
  void deliverFrom(size_t n, const std::vector<uint8_t>& frame) {
    Subscription sub;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (n >= subscriptions_.size()) return;
      sub = subscriptions_[n];
    }
    sub.cb(sub.linkId, frame.data(), frame.size(), sub.ctx);
  }

  FakeScript script;
  // Called at the end of every open(), after the session exists
  std::function<void()> openHook;
  BleDeviceInfo lastOpened;
  std::atomic<int> discoverCalls{0};
  std::atomic<int> openCalls{0};
  std::atomic<int> liveLinks{0};
  std::atomic<int> releases{0};
  int maxLiveLinks = 0;

 private:
  friend class FakeHeartRateLink;

  struct Subscription {
    uint32_t linkId = 0;
    HeartRateLink::NotifyCallback cb = nullptr;
    void* ctx = nullptr;
  };

  std::mutex mutex_;
  std::vector<FakeHeartRateLink*> links;
  std::vector<Subscription> subscriptions_;
};

inline FakeHeartRateLink::~FakeHeartRateLink() {
  release();
  std::lock_guard<std::mutex> lock(owner_.mutex_);
  for (size_t i = 0; i < owner_.links.size(); ++i) {
    if (owner_.links[i] == this) {
      owner_.links.erase(owner_.links.begin() + i);
      break;
    }
  }
}

inline bool FakeHeartRateLink::subscribe(uint32_t linkId, NotifyCallback cb, void* ctx) {
  linkId_ = linkId;
  cb_ = cb;
  ctx_ = ctx;
  FakeHeartRateCentral::Subscription sub;
  sub.linkId = linkId;
  sub.cb = cb;
  sub.ctx = ctx;
  std::lock_guard<std::mutex> lock(owner_.mutex_);
  owner_.subscriptions_.push_back(sub);
  return script_.subscribeAck;
}

inline void FakeHeartRateLink::release() {
  if (released_) return;
  released_ = true;
  cb_ = nullptr;
  owner_.releases++;
  owner_.liveLinks--;
}

inline BleDeviceInfo makeDevice(const char* name, uint64_t address, int rssi = -60) {
  BleDeviceInfo d;
  d.name = name;
  d.address = address;
  d.rssi = rssi;
  return d;
}
