#include "NimBleTransport.h"

#ifdef ARDUINO

#include <Arduino.h>
#include <esp_task_wdt.h>

#include <utility>

#include "system/Log.h"

namespace owlink {

uint64_t ArduinoClock::nowMs() const {
    return millis();
}

void ArduinoClock::delayMs(uint32_t ms) {
    esp_task_wdt_reset();
    delay(ms);
}

NimBleTransport::~NimBleTransport() {
    if (client_ != nullptr) {
        if (client_->isConnected()) {
            client_->disconnect();
        }
        NimBLEDevice::deleteClient(client_);
        client_ = nullptr;
    }
}

bool NimBleTransport::begin(const char* localName) {
    NimBLEDevice::init(localName);
    NimBLEDevice::setPower(9);

    client_ = NimBLEDevice::createClient();
    if (client_ == nullptr) {
        system::logLine("LINK", "failed to create BLE client");
        return false;
    }
    client_->setClientCallbacks(&clientCallbacks_, false);

    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setScanCallbacks(&scanCallbacks_, false);
    scan->setActiveScan(true);
    scan->setInterval(100);
    scan->setWindow(80);
    return true;
}

void NimBleTransport::ScanCallbacks::onResult(const NimBLEAdvertisedDevice* device) {
    if (device == nullptr) {
        return;
    }

    Advertisement adv;
    adv.id = device->getAddress().toString();
    adv.name = device->getName();
    adv.rssi = device->getRSSI();
    adv.address = adv.id;
    for (uint8_t i = 0; i < device->getServiceUUIDCount(); ++i) {
        adv.serviceIds.push_back(device->getServiceUUID(i).toString());
    }

    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.addressTypes_[adv.id] = device->getAddress().getType();
    owner_.scanResults_[adv.id] = std::move(adv);
    owner_.scanDirty_ = true;
}

void NimBleTransport::ScanCallbacks::onScanEnd(const NimBLEScanResults& results, int reason) {
    system::logLine("SCAN", "scan ended reason=%d seen=%d", reason, results.getCount());
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.scanEnded_ = true;
}

void NimBleTransport::ClientCallbacks::onDisconnect(NimBLEClient* client, int reason) {
    (void)client;
    owner_.lastDisconnectReason_ = reason;
    system::logLine("LINK", "peer disconnected reason=0x%02x", reason);
}

bool NimBleTransport::startScan(uint32_t durationMs, ScanHandlers handlers) {
    NimBLEScan* scan = NimBLEDevice::getScan();
    if (scan == nullptr) {
        return false;
    }
    if (scan->isScanning()) {
        scan->stop();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        scanResults_.clear();
        scanDirty_ = false;
        scanEnded_ = false;
    }
    scanHandlers_ = std::move(handlers);

    if (!scan->start(durationMs, false)) {
        system::logLine("SCAN", "scan start rejected by controller");
        scanHandlers_ = ScanHandlers{};
        return false;
    }
    return true;
}

void NimBleTransport::stopScan() {
    scanHandlers_ = ScanHandlers{};
    NimBLEScan* scan = NimBLEDevice::getScan();
    if (scan != nullptr && scan->isScanning()) {
        scan->stop();
    }
}

bool NimBleTransport::connect(const std::string& deviceId, uint32_t timeoutMs) {
    if (client_ == nullptr) {
        return false;
    }
    if (client_->isConnected()) {
        client_->disconnect();
    }

    uint8_t type = BLE_ADDR_PUBLIC;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = addressTypes_.find(deviceId);
        if (it != addressTypes_.end()) {
            type = it->second;
        }
    }

    client_->setConnectTimeout(timeoutMs);
    const NimBLEAddress address(deviceId, type);
    esp_task_wdt_reset();
    if (!client_->connect(address)) {
        system::logLine("LINK", "connect to %s failed", deviceId.c_str());
        return false;
    }
    system::logLine("LINK", "connected to %s mtu=%u", deviceId.c_str(), static_cast<unsigned>(client_->getMTU()));
    return true;
}

bool NimBleTransport::discoverServices(const std::string& serviceUuid, uint32_t timeoutMs,
                                       std::vector<CharacteristicInfo>& out) {
    out.clear();
    characteristics_.clear();
    if (client_ == nullptr || !client_->isConnected()) {
        return false;
    }

    const uint32_t start = millis();
    esp_task_wdt_reset();
    NimBLERemoteService* service = client_->getService(NimBLEUUID(serviceUuid));
    if (service == nullptr) {
        system::logLine("LINK", "service %s not present", serviceUuid.c_str());
        return false;
    }

    esp_task_wdt_reset();
    const auto& remote = service->getCharacteristics(true);
    const uint32_t elapsed = millis() - start;
    if (elapsed > timeoutMs) {
        system::logLine("LINK", "discovery took %lums (budget %lums)", static_cast<unsigned long>(elapsed),
                        static_cast<unsigned long>(timeoutMs));
        return false;
    }

    for (NimBLERemoteCharacteristic* chr : remote) {
        if (chr == nullptr) {
            continue;
        }
        CharacteristicInfo info;
        info.uuid = chr->getUUID().toString();
        info.handle = chr->getHandle();
        info.canRead = chr->canRead();
        info.canWrite = chr->canWrite() || chr->canWriteNoResponse();
        info.canNotify = chr->canNotify() || chr->canIndicate();
        characteristics_[info.handle] = chr;
        out.push_back(info);
    }
    return true;
}

NimBLERemoteCharacteristic* NimBleTransport::findCharacteristic(CharHandle handle) const {
    auto it = characteristics_.find(handle);
    return it == characteristics_.end() ? nullptr : it->second;
}

bool NimBleTransport::read(CharHandle handle, uint32_t timeoutMs, Bytes& out) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(handle);
    if (chr == nullptr || !isConnected()) {
        return false;
    }

    const uint32_t start = millis();
    esp_task_wdt_reset();
    NimBLEAttValue value = chr->readValue();
    const uint32_t elapsed = millis() - start;
    if (elapsed > timeoutMs) {
        system::logLine("LINK", "read 0x%04x timed out after %lums", handle, static_cast<unsigned long>(elapsed));
        return false;
    }
    if (value.size() == 0) {
        return false;
    }
    out.assign(value.data(), value.data() + value.size());
    return true;
}

bool NimBleTransport::write(CharHandle handle, const Bytes& data) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(handle);
    if (chr == nullptr || !isConnected()) {
        return false;
    }
    esp_task_wdt_reset();
    return chr->writeValue(data.data(), data.size(), true);
}

void NimBleTransport::enqueueNotification(CharHandle handle, const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (notifications_.size() >= kMaxQueuedNotifications) {
        notifications_.pop_front();
        ++droppedNotifications_;
    }
    PendingNotification pending;
    pending.handle = handle;
    pending.payload.assign(data, data + len);
    notifications_.push_back(std::move(pending));
}

bool NimBleTransport::subscribe(CharHandle handle, NotifyHandler handler) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(handle);
    if (chr == nullptr || !isConnected()) {
        return false;
    }

    const bool notifications = chr->canNotify();
    esp_task_wdt_reset();
    const bool ok = chr->subscribe(notifications,
                                   [this](NimBLERemoteCharacteristic* source, uint8_t* data, size_t len, bool) {
                                       if (source != nullptr) {
                                           enqueueNotification(source->getHandle(), data, len);
                                       }
                                   });
    if (!ok) {
        return false;
    }
    handlers_[handle] = std::move(handler);
    return true;
}

bool NimBleTransport::unsubscribe(CharHandle handle) {
    handlers_.erase(handle);
    NimBLERemoteCharacteristic* chr = findCharacteristic(handle);
    if (chr == nullptr || !isConnected()) {
        return false;
    }
    return chr->unsubscribe();
}

bool NimBleTransport::isConnected() const {
    return client_ != nullptr && client_->isConnected();
}

void NimBleTransport::disconnect() {
    handlers_.clear();
    characteristics_.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.clear();
    }
    if (client_ != nullptr && client_->isConnected()) {
        client_->disconnect();
    }
}

void NimBleTransport::poll() {
    std::vector<Advertisement> batch;
    bool deliverBatch = false;
    bool ended = false;
    std::deque<PendingNotification> pending;
    uint32_t dropped = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scanDirty_) {
            batch.reserve(scanResults_.size());
            for (const auto& item : scanResults_) {
                batch.push_back(item.second);
            }
            scanDirty_ = false;
            deliverBatch = true;
        }
        ended = scanEnded_;
        scanEnded_ = false;
        pending.swap(notifications_);
        dropped = droppedNotifications_;
        droppedNotifications_ = 0;
    }

    if (dropped > 0) {
        system::logLine("SUBS", "notification queue overflow, dropped %lu", static_cast<unsigned long>(dropped));
    }

    if (deliverBatch && scanHandlers_.onBatch) {
        auto onBatch = scanHandlers_.onBatch;
        onBatch(batch);
    }
    if (ended && scanHandlers_.onComplete) {
        auto onComplete = scanHandlers_.onComplete;
        scanHandlers_ = ScanHandlers{};
        onComplete();
    }

    for (const auto& item : pending) {
        auto it = handlers_.find(item.handle);
        if (it == handlers_.end()) {
            continue;
        }
        NotifyHandler handler = it->second;
        handler(item.handle, item.payload);
    }
}

}  // namespace owlink

#endif  // ARDUINO
