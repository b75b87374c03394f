#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "AuthOrchestrator.h"
#include "BleTransport.h"
#include "BoardTypes.h"
#include "DeviceFilter.h"
#include "EventChannel.h"
#include "LinkConfig.h"
#include "LinkSession.h"
#include "LivenessScheduler.h"
#include "SubscriptionManager.h"
#include "TelemetryCodec.h"
#include "system/Diagnostics.h"
#include "system/TaskScheduler.h"

namespace owlink {

struct DiagnosticSnapshot {
    ConnectionState state = ConnectionState::Disconnected;
    std::string deviceId;
    std::string deviceName;
    BoardModel model = BoardModel::Unknown;
    UnlockProfile profile = UnlockProfile::Unknown;
    CharacteristicLayout layout = CharacteristicLayout::Legacy;
    size_t candidateCount = 0;
    size_t characteristicCount = 0;
    size_t subscriptionCount = 0;
    bool heartbeatActive = false;
    bool watchdogActive = false;
    bool keepaliveActive = false;
    uint32_t decodeFailures = 0;
    uint32_t strategyAttempts = 0;
    uint32_t diagnosticEntries = 0;
    LinkError lastError = LinkError::None;
    std::string lastErrorMessage;
};

/**
 * @brief Connection state machine for a single board.
 *
 * Sequences scan, connect, service discovery, authentication and
 * subscription, then keeps the session alive until a failure or a disconnect
 * tears it down. connect() blocks while it pumps the transport and the timer
 * set, so it must be called from the thread that owns the transport.
 *
 * @code
 * owlink::BoardLink link(config, transport, clock);
 * link.events().onState([](const owlink::StateChange& change) { report(change); });
 * link.startScan();
 * // loop():
 * link.service();
 * if (!link.candidates().empty()) {
 *     link.connect(link.candidates().front());
 * }
 * @endcode
 */
class BoardLink {
public:
    BoardLink(const LinkConfig& config, BleTransport& transport, Clock& clock);

    EventChannel& events() { return events_; }

    bool startScan();
    void stopScan();
    const std::vector<DeviceCandidate>& candidates() const { return candidates_.candidates(); }

    // Ignored unless the link is Disconnected or Scanning.
    bool connect(const DeviceCandidate& candidate);
    bool connect(const std::string& deviceId);
    void disconnect();

    // Call from the main loop: drains transport events and runs timers.
    void service();

    ConnectionState state() const { return session_.state(); }
    const TelemetrySnapshot& telemetry() const { return session_.snapshot(); }
    LinkError lastError() const { return session_.lastError(); }
    const std::string& lastErrorMessage() const { return session_.lastErrorMessage(); }
    DiagnosticSnapshot diagnostics() const;
    const system::DiagnosticLog& diagnosticLog() const { return session_.diagnostics(); }

    bool setMinRssi(int rssi);
    bool setHeartbeatFailureLimit(uint32_t limit);
    void setAutoReconnect(bool enabled);
    bool autoReconnect() const { return autoReconnect_; }
    const std::string& rememberedDeviceId() const { return rememberedDeviceId_; }

    const LinkConfig& config() const { return config_; }
    const AuthOrchestrator& auth() const { return auth_; }
    const LivenessScheduler& liveness() const { return liveness_; }
    const SubscriptionManager& subscriptions() const { return subscriptions_; }

private:
    bool isNewerVariant(const std::string& name) const;
    bool connectWithRetry(const std::string& deviceId, const LinkTiming& timing, uint32_t gen);
    void fail(LinkError error, const std::string& message);
    void teardown();
    void handleScanBatch(const std::vector<Advertisement>& batch);
    void handleScanComplete();

    LinkConfig config_;
    system::TaskScheduler scheduler_;
    EventChannel events_;
    LinkSession session_;
    CandidateList candidates_;
    SubscriptionManager subscriptions_;
    AuthOrchestrator auth_;
    LivenessScheduler liveness_;

    bool autoReconnect_ = true;
    std::string rememberedDeviceId_;
};

}  // namespace owlink
