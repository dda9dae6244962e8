#include "NimBleHeartRateCentral.h"

#include <NimBLEDevice.h>

#include "src/infrastructure/Logger.h"
#include "src/infrastructure/ble/BleUuids.h"

class NimBleHeartRateCentral::Link : public HeartRateLink {
 public:
  Link(NimBLEClient* client, uint64_t address) : client_(client), address_(address) {}
  ~Link() override { release(); }

  uint64_t address() const override { return address_; }

  bool resolveService() override {
    if (!client_) return false;
    service_ = client_->getService(NimBLEUUID(BleUuids::SERVICE_HEART_RATE));
    return service_ != nullptr;
  }

  bool resolveMeasurement() override {
    if (!service_) return false;
    measurement_ = service_->getCharacteristic(NimBLEUUID(BleUuids::CHAR_HEART_RATE_MEASUREMENT));
    if (!measurement_) return false;
    Logger::info("BLE: measurement [canNotify=%d, canRead=%d]", measurement_->canNotify() ? 1 : 0,
                 measurement_->canRead() ? 1 : 0);
    return measurement_->canNotify();
  }

  bool subscribe(uint32_t linkId, NotifyCallback cb, void* ctx) override {
    if (!measurement_) return false;
    // Captures values only; in-flight deliveries may outlive this link
    bool ok = measurement_->subscribe(
        true,
        [cb, ctx, linkId](NimBLERemoteCharacteristic* /*c*/, uint8_t* data, size_t length, bool /*isNotify*/) {
          cb(linkId, data, length, ctx);
        },
        true);
    subscribed_ = ok;
    Logger::info("BLE: notify subscribe %s", ok ? "acknowledged" : "rejected");
    return ok;
  }

  void release() override {
    if (!client_) return;
    if (subscribed_ && measurement_ && client_->isConnected()) {
      if (!measurement_->unsubscribe(true)) {
        Logger::warn("BLE: unsubscribe not acknowledged");
      }
    }
    subscribed_ = false;
    measurement_ = nullptr;
    service_ = nullptr;
    if (client_->isConnected()) client_->disconnect();
    NimBLEDevice::deleteClient(client_);
    client_ = nullptr;
  }

 private:
  NimBLEClient* client_ = nullptr;
  NimBLERemoteService* service_ = nullptr;
  NimBLERemoteCharacteristic* measurement_ = nullptr;
  uint64_t address_ = 0;
  bool subscribed_ = false;
};

void NimBleHeartRateCentral::begin(const char* deviceName) {
  if (started_) return;
  NimBLEDevice::init(deviceName);
  NimBLEScan* scan = NimBLEDevice::getScan();
  scan->setActiveScan(true);
  scan->setInterval(100);
  scan->setWindow(99);
  started_ = true;
  Logger::info("BLE: central initialized as '%s'", deviceName);
}

bool NimBleHeartRateCentral::discover(const DeviceTarget& target,
                                      std::vector<BleDeviceInfo>& outDevices) {
  outDevices.clear();
  if (!started_) return false;

  NimBLEScan* scan = NimBLEDevice::getScan();
  if (scan->isScanning()) scan->stop();

  Logger::info("BLE: scanning %lus for %s", (unsigned long)scanSeconds_, target.describe().c_str());
  NimBLEScanResults results = scan->start(scanSeconds_, false);

  const NimBLEUUID hrService(BleUuids::SERVICE_HEART_RATE);
  std::lock_guard<std::mutex> lock(typesMutex_);
  addressTypes_.clear();
  for (int i = 0; i < results.getCount(); ++i) {
    NimBLEAdvertisedDevice dev = results.getDevice(i);
    NimBLEAddress addr = dev.getAddress();
    const uint64_t value = (uint64_t)addr;

    if (target.hasAddress) {
      if (value != target.address) continue;
    } else if (!dev.isAdvertisingService(hrService)) {
      continue;
    }

    BleDeviceInfo info;
    info.name = dev.haveName() ? dev.getName() : std::string();
    info.address = value;
    info.rssi = dev.getRSSI();
    outDevices.push_back(info);
    addressTypes_[value] = addr.getType();
  }
  scan->clearResults();
  return true;
}

std::unique_ptr<HeartRateLink> NimBleHeartRateCentral::open(const BleDeviceInfo& device) {
  if (!started_) return std::unique_ptr<HeartRateLink>();

  uint8_t type = BLE_ADDR_PUBLIC;
  {
    std::lock_guard<std::mutex> lock(typesMutex_);
    std::map<uint64_t, uint8_t>::const_iterator it = addressTypes_.find(device.address);
    if (it != addressTypes_.end()) type = it->second;
  }
  const NimBLEAddress addr(device.address, type);

  NimBLEClient* client = NimBLEDevice::createClient();
  if (!client) {
    Logger::error("BLE: no free client slot");
    return std::unique_ptr<HeartRateLink>();
  }
  client->setConnectTimeout(10);

  if (!client->connect(addr, true)) {
    Logger::warn("BLE: connect to %s failed (err=%d)", addr.toString().c_str(),
                 client->getLastError());
    NimBLEDevice::deleteClient(client);
    return std::unique_ptr<HeartRateLink>();
  }

  Logger::info("BLE: session open to %s (rssi=%d)", addr.toString().c_str(), client->getRssi());
  return std::unique_ptr<HeartRateLink>(new Link(client, device.address));
}
