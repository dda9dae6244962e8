// HeartRateService.cpp
// See HeartRateService.h for responsibilities and threading rules.

#include "HeartRateService.h"

#include <chrono>
#include <vector>

#include "src/infrastructure/Logger.h"

HeartRateService::HeartRateService(HeartRateCentral& central, uint32_t retryBackoffMs)
    : central_(central),
      retryBackoffMs_(retryBackoffMs),
      bridge_(readings_),
      disposed_(false),
      nextLinkId_(1) {}

HeartRateService::~HeartRateService() {
  dispose();
  std::unique_lock<std::mutex> lock(notifyMutex_);
  notifyIdle_.wait(lock, [this] { return notifyInFlight_ == 0; });
}

ConnectResult HeartRateService::resolveCandidate(const DeviceTarget& target,
                                                 BleDeviceInfo& outDevice) {
  std::vector<BleDeviceInfo> devices;
  if (!central_.discover(target, devices)) {
    Logger::warn("HR: discovery scan failed");
    devices.clear();
  }

  if (!target.hasAddress) {
    // Log every candidate so the user can pin one in settings later
    for (size_t i = 0; i < devices.size(); ++i) {
      Logger::info("HR: found candidate [name=%s, address=%s, rssi=%d]",
                   devices[i].name.c_str(), DeviceTarget::format(devices[i].address).c_str(),
                   devices[i].rssi);
    }
  }

  if (devices.empty()) {
    Logger::warn("HR: unable to locate a device");
    if (target.hasAddress) {
      const std::string addr = DeviceTarget::format(target.address);
      Logger::warn("HR: configured device %s was not found; clear it from settings to pick any device",
                   addr.c_str());
      return ConnectResult::failure(
          ConnectError::DiscoveryFailed,
          "Unable to locate heart rate device " + addr + " (explicit target). Ensure it is powered on and in range.");
    }
    return ConnectResult::failure(
        ConnectError::DiscoveryFailed,
        "Unable to locate a heart rate device (no explicit target). Ensure it is powered on and in range.");
  }

  // Deterministic pick: first in discovery order
  outDevice = devices.front();
  return ConnectResult::success();
}

ConnectResult HeartRateService::buildLink(const BleDeviceInfo& device, uint32_t linkId,
                                          std::unique_ptr<HeartRateLink>& outLink) {
  const std::string who = device.name.empty()
                              ? DeviceTarget::format(device.address)
                              : device.name + " (" + DeviceTarget::format(device.address) + ")";

  std::unique_ptr<HeartRateLink> link = central_.open(device);
  if (!link) {
    Logger::warn("HR: session to %s failed", who.c_str());
    return ConnectResult::failure(
        ConnectError::ConnectionFailed,
        "Unable to connect to device " + who + ". Is it in use by another central?");
  }

  if (!link->resolveService()) {
    Logger::warn("HR: heart rate service missing on %s", who.c_str());
    LinkSlot::dispose(std::move(link));
    return ConnectResult::failure(ConnectError::ConnectionFailed,
                                  "Unable to get heart rate service on " + who + ".");
  }

  Logger::info("HR: connected to %s", who.c_str());

  if (!link->resolveMeasurement()) {
    Logger::warn("HR: measurement characteristic missing on %s", who.c_str());
    LinkSlot::dispose(std::move(link));
    return ConnectResult::failure(ConnectError::ConnectionFailed,
                                  "Unable to locate heart rate measurement on " + who + ".");
  }

  if (!link->subscribe(linkId, &HeartRateService::onLinkNotification, this)) {
    Logger::warn("HR: notify subscription rejected by %s", who.c_str());
    LinkSlot::dispose(std::move(link));
    return ConnectResult::failure(ConnectError::ConfigurationFailed,
                                  "Attempt to configure notifications on " + who + " failed.");
  }

  outLink = std::move(link);
  return ConnectResult::success();
}

ConnectResult HeartRateService::connect(const DeviceTarget& target) {
  std::lock_guard<std::mutex> serial(connectMutex_);

  if (disposed_.load()) {
    return ConnectResult::failure(ConnectError::Disposed, "HeartRateService is disposed.");
  }

  BleDeviceInfo device;
  ConnectResult r = resolveCandidate(target, device);
  if (!r.ok()) return r;

  Logger::info("HR: trying to connect to [name=%s, address=%s]", device.name.c_str(),
               DeviceTarget::format(device.address).c_str());

  {
    std::lock_guard<std::mutex> lock(disposeMutex_);
    if (disposed_.load()) {
      return ConnectResult::failure(ConnectError::Disposed, "HeartRateService is disposed.");
    }
    // Never more than one subscription: drop the old one first
    slot_.releaseCurrent();
  }

  uint32_t linkId = nextLinkId_.fetch_add(1);
  if (linkId == 0) linkId = nextLinkId_.fetch_add(1);
  std::unique_ptr<HeartRateLink> link;
  r = buildLink(device, linkId, link);
  if (!r.ok()) return r;

  {
    std::lock_guard<std::mutex> lock(disposeMutex_);
    if (disposed_.load()) {
      Logger::info("HR: disposed while connecting, discarding new link");
      LinkSlot::dispose(std::move(link));
      return ConnectResult::failure(ConnectError::Disposed, "HeartRateService is disposed.");
    }
    slot_.replace(std::move(link), linkId);
  }

  Logger::info("HR: notifications started");
  return ConnectResult::success();
}

ConnectResult HeartRateService::initiateDefault(const DeviceTarget& target) {
  for (;;) {
    ConnectResult r = connect(target);
    if (r.ok()) return r;

    if (r.error == ConnectError::Disposed) {
      Logger::info("HR: disposed, giving up reconnect");
      return r;
    }

    Logger::warn("HR: connect failed (%s): %s", connectErrorName(r.error), r.message.c_str());
    readings_.publish(HeartRateReading::makeError(r.message));

    backoff();
  }
}

void HeartRateService::backoff() {
  std::unique_lock<std::mutex> lock(wakeMutex_);
  wake_.wait_for(lock, std::chrono::milliseconds(retryBackoffMs_),
                 [this] { return disposed_.load(); });
}

void HeartRateService::cleanup() {
  if (slot_.releaseCurrent()) {
    Logger::info("HR: link released");
  }
}

void HeartRateService::dispose() {
  {
    std::lock_guard<std::mutex> lock(disposeMutex_);
    disposed_.store(true);
    cleanup();
  }
  {
    std::lock_guard<std::mutex> lock(wakeMutex_);
  }
  wake_.notify_all();
}

void HeartRateService::onLinkNotification(uint32_t linkId, const uint8_t* data, size_t length,
                                          void* ctx) {
  HeartRateService* self = static_cast<HeartRateService*>(ctx);
  if (!self) return;
  {
    std::lock_guard<std::mutex> lock(self->notifyMutex_);
    if (self->disposed_.load() || !self->slot_.isCurrent(linkId)) {
      Logger::debug("HR: dropped notification from stale link %lu (len=%u)",
                    (unsigned long)linkId, (unsigned)length);
      return;
    }
    self->notifyInFlight_++;
  }

  self->bridge_.onNotification(data, length);

  // Notify under the lock: the destructor may free the service as soon as
  // it observes zero.
  std::lock_guard<std::mutex> lock(self->notifyMutex_);
  self->notifyInFlight_--;
  self->notifyIdle_.notify_all();
}
