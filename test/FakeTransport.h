#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "BleTransport.h"
#include "BoardTypes.h"
#include "CharacteristicRegistry.h"
#include "TelemetryCodec.h"

namespace owlink::test {

// Virtual clock: delayMs() advances time instead of sleeping.
class FakeClock : public Clock {
public:
    uint64_t nowMs() const override { return now; }
    void delayMs(uint32_t ms) override { now += ms; }
    void advance(uint64_t ms) { now += ms; }

    uint64_t now = 1000;
};

/**
 * Scripted in-memory transport. Scan batches and notifications queue until
 * poll(), like the radio-backed implementation. `onWrite` lets a test play
 * the board side of an exchange (e.g. answer a trigger write with a
 * challenge notification).
 */
class FakeTransport : public BleTransport {
public:
    explicit FakeTransport(FakeClock& clock) : clock_(clock) {}

    // --- scripting -------------------------------------------------------
    bool scanStartFails = false;
    uint32_t connectFailures = 0;
    uint32_t connectLatencyMs = 0;
    uint32_t readLatencyMs = 0;
    bool serviceAvailable = true;
    bool writeFails = false;
    std::set<CharHandle> failingReads;
    std::map<CharHandle, Bytes> readValues;
    std::vector<CharacteristicInfo> characteristics;
    std::function<void(CharHandle, const Bytes&)> onWrite;
    std::function<void(const std::string&)> onConnect;
    std::function<void()> onDiscover;

    // --- observation -----------------------------------------------------
    bool connected = false;
    bool scanning = false;
    uint32_t connectCalls = 0;
    uint32_t disconnectCalls = 0;
    uint32_t stopScanCalls = 0;
    uint32_t lastConnectTimeoutMs = 0;
    std::string lastConnectId;
    std::vector<std::pair<CharHandle, Bytes>> writes;
    std::vector<CharHandle> reads;

    CharHandle add(uint16_t shortId, bool canRead, bool canWrite, bool canNotify) {
        CharacteristicInfo info;
        info.uuid = characteristicUuid(shortId);
        info.handle = nextHandle_++;
        info.canRead = canRead;
        info.canWrite = canWrite;
        info.canNotify = canNotify;
        characteristics.push_back(info);
        return info.handle;
    }

    CharHandle handleFor(uint16_t shortId) const {
        const std::string uuid = characteristicUuid(shortId);
        for (const auto& info : characteristics) {
            if (info.uuid == uuid) {
                return info.handle;
            }
        }
        return 0;
    }

    void notify(CharHandle handle, const Bytes& payload) { notifications_.push_back({handle, payload}); }

    void emitScan(const std::vector<Advertisement>& batch) { batches_.push_back(batch); }
    void completeScan() { scanCompletePending_ = true; }

    // Link loss as seen by the watchdog.
    void dropLink() { connected = false; }

    bool isSubscribed(CharHandle handle) const { return handlers_.count(handle) > 0; }
    size_t subscriptionCount() const { return handlers_.size(); }

    size_t writesTo(CharHandle handle) const {
        size_t count = 0;
        for (const auto& write : writes) {
            if (write.first == handle) {
                ++count;
            }
        }
        return count;
    }

    const Bytes* lastWriteTo(CharHandle handle) const {
        for (auto it = writes.rbegin(); it != writes.rend(); ++it) {
            if (it->first == handle) {
                return &it->second;
            }
        }
        return nullptr;
    }

    // --- BleTransport ----------------------------------------------------
    bool startScan(uint32_t, ScanHandlers handlers) override {
        if (scanStartFails) {
            return false;
        }
        scanHandlers_ = std::move(handlers);
        scanning = true;
        return true;
    }

    void stopScan() override {
        ++stopScanCalls;
        scanning = false;
        scanHandlers_ = ScanHandlers{};
        batches_.clear();
        scanCompletePending_ = false;
    }

    bool connect(const std::string& deviceId, uint32_t timeoutMs) override {
        ++connectCalls;
        lastConnectId = deviceId;
        lastConnectTimeoutMs = timeoutMs;
        clock_.advance(connectLatencyMs);
        if (onConnect) {
            onConnect(deviceId);
        }
        if (connectFailures > 0) {
            --connectFailures;
            return false;
        }
        connected = true;
        return true;
    }

    bool discoverServices(const std::string&, uint32_t, std::vector<CharacteristicInfo>& out) override {
        out.clear();
        if (!connected || !serviceAvailable) {
            return false;
        }
        out = characteristics;
        if (onDiscover) {
            onDiscover();
        }
        return true;
    }

    bool read(CharHandle handle, uint32_t, Bytes& out) override {
        reads.push_back(handle);
        clock_.advance(readLatencyMs);
        if (!connected || failingReads.count(handle) > 0) {
            return false;
        }
        auto it = readValues.find(handle);
        if (it == readValues.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool write(CharHandle handle, const Bytes& data) override {
        if (!connected || writeFails) {
            return false;
        }
        writes.push_back({handle, data});
        if (onWrite) {
            onWrite(handle, data);
        }
        return true;
    }

    bool subscribe(CharHandle handle, NotifyHandler handler) override {
        if (!connected) {
            return false;
        }
        handlers_[handle] = std::move(handler);
        return true;
    }

    bool unsubscribe(CharHandle handle) override {
        handlers_.erase(handle);
        return connected;
    }

    bool isConnected() const override { return connected; }

    void disconnect() override {
        ++disconnectCalls;
        connected = false;
        handlers_.clear();
        notifications_.clear();
    }

    void poll() override {
        while (!batches_.empty() && scanHandlers_.onBatch) {
            const std::vector<Advertisement> batch = batches_.front();
            batches_.pop_front();
            auto onBatch = scanHandlers_.onBatch;
            onBatch(batch);
        }
        if (scanCompletePending_ && scanHandlers_.onComplete) {
            scanCompletePending_ = false;
            scanning = false;
            auto onComplete = scanHandlers_.onComplete;
            scanHandlers_ = ScanHandlers{};
            onComplete();
        }

        std::deque<std::pair<CharHandle, Bytes>> pending;
        pending.swap(notifications_);
        for (const auto& item : pending) {
            auto it = handlers_.find(item.first);
            if (it == handlers_.end()) {
                continue;
            }
            NotifyHandler handler = it->second;
            handler(item.first, item.second);
        }
    }

private:
    FakeClock& clock_;
    CharHandle nextHandle_ = 0x20;
    ScanHandlers scanHandlers_;
    std::deque<std::vector<Advertisement>> batches_;
    bool scanCompletePending_ = false;
    std::deque<std::pair<CharHandle, Bytes>> notifications_;
    std::map<CharHandle, NotifyHandler> handlers_;
};

// Twelve-characteristic legacy board (classic Pint / XR firmware).
inline void addLegacyBoard(FakeTransport& transport) {
    transport.add(0xf301, true, false, true);   // serial
    transport.add(0xf302, true, false, true);   // ride mode
    transport.add(0xf303, true, false, true);   // battery
    transport.add(0xf304, true, false, true);   // pitch
    transport.add(0xf305, true, false, true);   // roll
    transport.add(0xf306, true, false, true);   // yaw
    transport.add(0xf308, true, false, true);   // rpm
    transport.add(0xf309, true, false, true);   // temperature
    transport.add(0xf30a, true, true, false);   // firmware
    transport.add(0xf30c, true, false, true);   // voltage
    transport.add(0xf30e, false, false, true);  // read channel
    transport.add(0xf30f, false, true, false);  // write channel
}

// Extended layout used by GT / GT-S firmware.
inline void addExtendedBoard(FakeTransport& transport) {
    transport.add(0xf301, true, false, true);   // serial
    transport.add(0xf302, true, false, true);   // ride mode
    transport.add(0xf303, true, false, true);   // battery
    transport.add(0xf307, true, false, true);   // pitch
    transport.add(0xf308, true, false, true);   // roll
    transport.add(0xf309, true, false, true);   // yaw
    transport.add(0xf30b, true, false, true);   // rpm
    transport.add(0xf310, true, false, true);   // temperature
    transport.add(0xf311, true, true, false);   // firmware
    transport.add(0xf312, true, false, true);   // current
    transport.add(0xf316, true, false, true);   // voltage
    transport.add(0xf3fe, false, false, true);  // read channel
    transport.add(0xf3ff, false, true, false);  // write channel
}

inline Bytes makeChallenge(size_t len, uint8_t seed) {
    Bytes challenge = {0x43, 0x52, 0x58};
    for (size_t i = challenge.size(); i < len; ++i) {
        challenge.push_back(static_cast<uint8_t>(seed + i * 7));
    }
    return challenge;
}

}  // namespace owlink::test
