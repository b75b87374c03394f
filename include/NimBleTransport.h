#pragma once

#ifdef ARDUINO

#include <NimBLEDevice.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "BleTransport.h"

namespace owlink {

class ArduinoClock : public Clock {
public:
    uint64_t nowMs() const override;
    // Feeds the task watchdog while the link engine waits.
    void delayMs(uint32_t ms) override;
};

/**
 * @brief BleTransport on top of the NimBLE central role.
 *
 * NimBLE invokes scan and notification callbacks from its host task; they
 * only enqueue under `mutex_`. poll() hands queued work to the engine on the
 * loop task.
 */
class NimBleTransport : public BleTransport {
public:
    NimBleTransport() = default;
    ~NimBleTransport() override;

    NimBleTransport(const NimBleTransport&) = delete;
    NimBleTransport& operator=(const NimBleTransport&) = delete;

    bool begin(const char* localName);

    bool startScan(uint32_t durationMs, ScanHandlers handlers) override;
    void stopScan() override;
    bool connect(const std::string& deviceId, uint32_t timeoutMs) override;
    bool discoverServices(const std::string& serviceUuid, uint32_t timeoutMs,
                          std::vector<CharacteristicInfo>& out) override;
    bool read(CharHandle handle, uint32_t timeoutMs, Bytes& out) override;
    bool write(CharHandle handle, const Bytes& data) override;
    bool subscribe(CharHandle handle, NotifyHandler handler) override;
    bool unsubscribe(CharHandle handle) override;
    bool isConnected() const override;
    void disconnect() override;
    void poll() override;

    int lastDisconnectReason() const { return lastDisconnectReason_; }

private:
    class ScanCallbacks : public NimBLEScanCallbacks {
    public:
        explicit ScanCallbacks(NimBleTransport& owner) : owner_(owner) {}
        void onResult(const NimBLEAdvertisedDevice* device) override;
        void onScanEnd(const NimBLEScanResults& results, int reason) override;

    private:
        NimBleTransport& owner_;
    };

    class ClientCallbacks : public NimBLEClientCallbacks {
    public:
        explicit ClientCallbacks(NimBleTransport& owner) : owner_(owner) {}
        void onDisconnect(NimBLEClient* client, int reason) override;

    private:
        NimBleTransport& owner_;
    };

    struct PendingNotification {
        CharHandle handle = 0;
        Bytes payload;
    };

    static constexpr size_t kMaxQueuedNotifications = 64;

    NimBLERemoteCharacteristic* findCharacteristic(CharHandle handle) const;
    void enqueueNotification(CharHandle handle, const uint8_t* data, size_t len);

    ScanCallbacks scanCallbacks_{*this};
    ClientCallbacks clientCallbacks_{*this};
    NimBLEClient* client_ = nullptr;

    std::mutex mutex_;
    std::map<std::string, Advertisement> scanResults_;
    std::map<std::string, uint8_t> addressTypes_;
    bool scanDirty_ = false;
    bool scanEnded_ = false;
    std::deque<PendingNotification> notifications_;
    uint32_t droppedNotifications_ = 0;
    std::atomic<int> lastDisconnectReason_{0};

    ScanHandlers scanHandlers_;
    std::map<CharHandle, NotifyHandler> handlers_;
    std::map<CharHandle, NimBLERemoteCharacteristic*> characteristics_;
};

}  // namespace owlink

#endif  // ARDUINO
