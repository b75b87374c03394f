#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "BleTransport.h"
#include "BoardTypes.h"
#include "CharacteristicRegistry.h"
#include "EventChannel.h"
#include "TelemetryCodec.h"
#include "system/Diagnostics.h"
#include "system/TaskScheduler.h"

namespace owlink {

/**
 * @brief State holder shared by every link collaborator.
 *
 * Owns the connection state, the characteristic registry, the telemetry
 * snapshot and the diagnostic log of the current session. `transition()` is
 * the only way the state changes; it validates the edge and publishes the
 * change on the event channel.
 *
 * Each connect attempt runs under a generation number. Teardown bumps it, and
 * every wait helper returns false once the generation it was started under is
 * stale, so in-flight steps unwind without touching the next session.
 */
class LinkSession {
public:
    LinkSession(BleTransport& transport, Clock& clock, system::TaskScheduler& scheduler, EventChannel& events,
                uint32_t pollStepMs);

    ConnectionState state() const { return state_; }
    bool transition(ConnectionState next, LinkError error = LinkError::None, const std::string& message = {});
    static bool isAllowed(ConnectionState from, ConnectionState to);

    uint32_t generation() const { return generation_; }
    uint32_t invalidate() { return ++generation_; }
    bool alive(uint32_t gen) const { return gen == generation_; }

    // Drains transport events and runs due timers.
    void pump();
    bool sleepMs(uint32_t ms, uint32_t gen);
    // Pumps until `done` holds. False on timeout or when the attempt is stale.
    bool waitUntil(uint32_t timeoutMs, uint32_t gen, const std::function<bool()>& done);

    void recordError(LinkError error, const std::string& message);
    void clearError();
    LinkError lastError() const { return lastError_; }
    const std::string& lastErrorMessage() const { return lastErrorMessage_; }

    void setDevice(const std::string& id, const std::string& name);
    const std::string& deviceId() const { return deviceId_; }
    const std::string& deviceName() const { return deviceName_; }

    void setModel(BoardModel model, UnlockProfile profile);
    BoardModel model() const { return model_; }
    UnlockProfile profile() const { return profile_; }

    void noteDecodeFailure() { ++decodeFailures_; }
    uint32_t decodeFailures() const { return decodeFailures_; }

    // Clears per-connection data (registry, snapshot, device, model).
    void resetConnectionData();

    uint64_t nowMs() const { return clock_.nowMs(); }

    BleTransport& transport() { return transport_; }
    Clock& clock() { return clock_; }
    system::TaskScheduler& scheduler() { return scheduler_; }
    EventChannel& events() { return events_; }
    CharacteristicRegistry& registry() { return registry_; }
    const CharacteristicRegistry& registry() const { return registry_; }
    TelemetrySnapshot& snapshot() { return snapshot_; }
    const TelemetrySnapshot& snapshot() const { return snapshot_; }
    system::DiagnosticLog& diagnostics() { return diagnostics_; }
    const system::DiagnosticLog& diagnostics() const { return diagnostics_; }

private:
    BleTransport& transport_;
    Clock& clock_;
    system::TaskScheduler& scheduler_;
    EventChannel& events_;
    uint32_t pollStepMs_;

    ConnectionState state_ = ConnectionState::Disconnected;
    uint32_t generation_ = 0;
    LinkError lastError_ = LinkError::None;
    std::string lastErrorMessage_;
    std::string deviceId_;
    std::string deviceName_;
    BoardModel model_ = BoardModel::Unknown;
    UnlockProfile profile_ = UnlockProfile::Unknown;
    uint32_t decodeFailures_ = 0;

    CharacteristicRegistry registry_;
    TelemetrySnapshot snapshot_;
    system::DiagnosticLog diagnostics_;
};

}  // namespace owlink
