#include "BoardLink.h"

#include "PersistentConfig.h"
#include "system/Log.h"

namespace owlink {

namespace {

constexpr int kMinRssiFloor = -100;
constexpr int kMinRssiCeiling = -30;
constexpr uint32_t kMaxHeartbeatFailureLimit = 10;

bool validRssi(int rssi) {
    return rssi >= kMinRssiFloor && rssi <= kMinRssiCeiling;
}

bool validFailureLimit(uint32_t limit) {
    return limit >= 1 && limit <= kMaxHeartbeatFailureLimit;
}

}  // namespace

BoardLink::BoardLink(const LinkConfig& config, BleTransport& transport, Clock& clock)
    : config_(config),
      session_(transport, clock, scheduler_, events_, config_.pollStepMs),
      candidates_(config_.filter),
      subscriptions_(session_, config_),
      auth_(session_, subscriptions_, config_),
      liveness_(session_, config_, [this](LinkError error, const std::string& message) { fail(error, message); }) {
    LinkSettings stored;
    if (loadLinkSettings(stored)) {
        if (stored.hasMinRssi && validRssi(stored.minRssi)) {
            config_.filter.minRssi = stored.minRssi;
            candidates_.setMinRssi(stored.minRssi);
        }
        if (stored.hasHeartbeatFailureLimit && validFailureLimit(stored.heartbeatFailureLimit)) {
            config_.heartbeatFailureLimit = stored.heartbeatFailureLimit;
        }
        if (stored.hasAutoReconnect) {
            autoReconnect_ = stored.autoReconnect;
        }
        if (stored.hasLastDeviceId) {
            rememberedDeviceId_ = stored.lastDeviceId;
        }
    }
}

bool BoardLink::startScan() {
    if (session_.state() != ConnectionState::Disconnected) {
        system::logLine("SCAN", "scan ignored in state %s", toString(session_.state()));
        return false;
    }

    candidates_.clear();
    session_.clearError();
    session_.transition(ConnectionState::Scanning);

    ScanHandlers handlers;
    handlers.onBatch = [this](const std::vector<Advertisement>& batch) { handleScanBatch(batch); };
    handlers.onComplete = [this]() { handleScanComplete(); };
    if (!session_.transport().startScan(config_.scanDurationMs, handlers)) {
        fail(LinkError::ScanFailure, "Scan could not be started");
        return false;
    }
    system::logLine("SCAN", "scanning for %lums", static_cast<unsigned long>(config_.scanDurationMs));
    return true;
}

void BoardLink::stopScan() {
    if (session_.state() != ConnectionState::Scanning) {
        return;
    }
    session_.transport().stopScan();
    session_.transition(ConnectionState::Disconnected);
}

void BoardLink::handleScanBatch(const std::vector<Advertisement>& batch) {
    if (session_.state() != ConnectionState::Scanning) {
        return;
    }
    candidates_.applyBatch(batch);
    system::traceLine("SCAN", "batch of %u, %u candidates", static_cast<unsigned>(batch.size()),
                      static_cast<unsigned>(candidates_.size()));
    events_.publishCandidates(candidates_.candidates());
}

void BoardLink::handleScanComplete() {
    if (session_.state() == ConnectionState::Scanning) {
        system::logLine("SCAN", "scan finished with %u candidates", static_cast<unsigned>(candidates_.size()));
        session_.transition(ConnectionState::Disconnected);
    }
}

bool BoardLink::connect(const std::string& deviceId) {
    const DeviceCandidate* candidate = candidates_.find(deviceId);
    if (candidate != nullptr) {
        return connect(*candidate);
    }
    DeviceCandidate bare;
    bare.id = deviceId;
    return connect(bare);
}

bool BoardLink::connect(const DeviceCandidate& requested) {
    // The caller may pass an entry of candidates_, which pumping can replace.
    const DeviceCandidate candidate = requested;
    const ConnectionState current = session_.state();
    if (current != ConnectionState::Disconnected && current != ConnectionState::Scanning) {
        system::logLine("LINK", "connect ignored, session already %s", toString(current));
        return false;
    }
    if (current == ConnectionState::Scanning) {
        session_.transport().stopScan();
    }

    const uint32_t gen = session_.invalidate();
    session_.clearError();
    session_.resetConnectionData();
    session_.setDevice(candidate.id, candidate.name);

    const bool newer = isNewerVariant(candidate.name);
    const LinkTiming& timing = newer ? config_.newer : config_.classic;
    system::logLine("LINK", "connecting to %s (%s) timings=%s", candidate.name.c_str(), candidate.id.c_str(),
                    newer ? "newer" : "classic");

    session_.transition(ConnectionState::Connecting);
    if (!session_.alive(gen)) {
        return false;
    }
    if (!connectWithRetry(candidate.id, timing, gen)) {
        if (session_.alive(gen)) {
            fail(LinkError::ConnectFailure,
                 "Connection failed after " + std::to_string(timing.connectAttempts) + " attempts");
        }
        return false;
    }

    session_.transition(ConnectionState::Connected);
    // State listeners run inside transition() and may have disconnected.
    if (!session_.alive(gen)) {
        return false;
    }
    liveness_.startWatchdog(timing.watchdogGraceMs);

    std::vector<CharacteristicInfo> discovered;
    const bool found = session_.transport().discoverServices(config_.filter.serviceId, timing.discoveryTimeoutMs,
                                                             discovered);
    session_.pump();
    if (!session_.alive(gen)) {
        return false;
    }
    if (!found) {
        fail(LinkError::ServiceNotFound, "Board service not found");
        return false;
    }
    session_.registry().populate(discovered);
    system::logLine("LINK", "found board service with %u characteristics (%s layout)",
                    static_cast<unsigned>(session_.registry().size()), toString(session_.registry().layout()));

    session_.transition(ConnectionState::Authenticating);
    if (!session_.alive(gen)) {
        return false;
    }
    const AuthResult result = auth_.authenticate(newer, gen);
    if (result.aborted || !session_.alive(gen)) {
        return false;
    }
    if (!result.success) {
        fail(result.error, result.message);
        return false;
    }

    subscriptions_.subscribeAll(session_.profile(), gen);
    if (!session_.alive(gen)) {
        return false;
    }

    const CharacteristicInfo* firmwareChar = session_.registry().find(TelemetryField::FirmwareRevision);
    if (firmwareChar != nullptr) {
        liveness_.startHeartbeat(firmwareChar->handle, auth_.firmware());
        if (result.challengeFlow) {
            liveness_.startKeepalive(firmwareChar->handle, auth_.firmware(), result.keepaliveIntervalMs);
        }
    }

    session_.transition(ConnectionState::Authenticated);
    if (!session_.alive(gen)) {
        return false;
    }
    system::logLine("LINK", "authenticated %s via %s", session_.deviceName().c_str(), toString(result.strategy));

    if (rememberedDeviceId_ != candidate.id) {
        rememberedDeviceId_ = candidate.id;
        storeLastDeviceId(candidate.id);
    }
    return true;
}

bool BoardLink::connectWithRetry(const std::string& deviceId, const LinkTiming& timing, uint32_t gen) {
    for (uint32_t attempt = 1; attempt <= timing.connectAttempts; ++attempt) {
        if (session_.transport().connect(deviceId, timing.connectTimeoutMs)) {
            return true;
        }
        system::logLine("LINK", "connection attempt %lu/%lu failed", static_cast<unsigned long>(attempt),
                        static_cast<unsigned long>(timing.connectAttempts));
        if (attempt < timing.connectAttempts && !session_.sleepMs(timing.connectBackoffMs * attempt, gen)) {
            return false;
        }
    }
    return false;
}

void BoardLink::disconnect() {
    if (session_.state() == ConnectionState::Scanning) {
        session_.transport().stopScan();
    }
    teardown();
}

void BoardLink::service() {
    session_.pump();

    if (!autoReconnect_ || rememberedDeviceId_.empty() || session_.state() != ConnectionState::Scanning) {
        return;
    }
    const DeviceCandidate* remembered = candidates_.find(rememberedDeviceId_);
    if (remembered != nullptr) {
        system::logLine("LINK", "remembered board %s in range, reconnecting", remembered->id.c_str());
        connect(*remembered);
    }
}

void BoardLink::fail(LinkError error, const std::string& message) {
    system::logLine("LINK", "failure %s: %s", toString(error), message.c_str());
    if (!session_.transition(ConnectionState::Error, error, message)) {
        session_.recordError(error, message);
    }
    teardown();
}

void BoardLink::teardown() {
    session_.invalidate();
    liveness_.stop();
    subscriptions_.unsubscribeAll();
    scheduler_.cancelAll();
    session_.transport().disconnect();
    auth_.reset();
    session_.resetConnectionData();
    session_.transition(ConnectionState::Disconnected);
}

bool BoardLink::isNewerVariant(const std::string& name) const {
    return containsIgnoreCase(name, config_.newerNameMarker);
}

bool BoardLink::setMinRssi(int rssi) {
    if (!validRssi(rssi)) {
        return false;
    }
    config_.filter.minRssi = rssi;
    candidates_.setMinRssi(rssi);
    storeMinRssi(rssi);
    return true;
}

bool BoardLink::setHeartbeatFailureLimit(uint32_t limit) {
    if (!validFailureLimit(limit)) {
        return false;
    }
    config_.heartbeatFailureLimit = limit;
    storeHeartbeatFailureLimit(limit);
    return true;
}

void BoardLink::setAutoReconnect(bool enabled) {
    autoReconnect_ = enabled;
    storeAutoReconnect(enabled);
}

DiagnosticSnapshot BoardLink::diagnostics() const {
    DiagnosticSnapshot snap;
    snap.state = session_.state();
    snap.deviceId = session_.deviceId();
    snap.deviceName = session_.deviceName();
    snap.model = session_.model();
    snap.profile = session_.profile();
    snap.layout = session_.registry().layout();
    snap.candidateCount = candidates_.size();
    snap.characteristicCount = session_.registry().size();
    snap.subscriptionCount = subscriptions_.activeCount();
    snap.heartbeatActive = liveness_.heartbeatActive();
    snap.watchdogActive = liveness_.watchdogActive();
    snap.keepaliveActive = liveness_.keepaliveActive();
    snap.decodeFailures = session_.decodeFailures();
    snap.strategyAttempts = static_cast<uint32_t>(auth_.attempted().size());
    snap.diagnosticEntries = session_.diagnostics().totalRecorded();
    snap.lastError = session_.lastError();
    snap.lastErrorMessage = session_.lastErrorMessage();
    return snap;
}

}  // namespace owlink
