#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "BoardTypes.h"
#include "CharacteristicRegistry.h"

namespace owlink {

class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t nowMs() const = 0;
    virtual void delayMs(uint32_t ms) = 0;
};

struct ScanHandlers {
    std::function<void(const std::vector<Advertisement>&)> onBatch;
    std::function<void()> onComplete;
};

using NotifyHandler = std::function<void(CharHandle handle, const Bytes& payload)>;

/**
 * @brief Central-role BLE operations the link engine depends on.
 *
 * Every call is time-boxed and reports failure instead of blocking
 * indefinitely. Scan batches and notifications are queued by the
 * implementation and delivered from poll() on the caller's thread, so the
 * engine never runs inside a radio callback.
 */
class BleTransport {
public:
    virtual ~BleTransport() = default;

    virtual bool startScan(uint32_t durationMs, ScanHandlers handlers) = 0;
    virtual void stopScan() = 0;

    virtual bool connect(const std::string& deviceId, uint32_t timeoutMs) = 0;

    // Fills `out` with the characteristics of `serviceUuid`. False when the
    // service is absent or discovery timed out.
    virtual bool discoverServices(const std::string& serviceUuid, uint32_t timeoutMs,
                                  std::vector<CharacteristicInfo>& out) = 0;

    virtual bool read(CharHandle handle, uint32_t timeoutMs, Bytes& out) = 0;
    virtual bool write(CharHandle handle, const Bytes& data) = 0;
    virtual bool subscribe(CharHandle handle, NotifyHandler handler) = 0;
    virtual bool unsubscribe(CharHandle handle) = 0;

    virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;

    virtual void poll() = 0;
};

}  // namespace owlink
