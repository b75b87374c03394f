#include "LivenessScheduler.h"

#include "system/Log.h"

#include <utility>

namespace owlink {

LivenessScheduler::LivenessScheduler(LinkSession& session, const LinkConfig& config, FailureHandler onFailure)
    : session_(session), config_(config), onFailure_(std::move(onFailure)) {}

void LivenessScheduler::startWatchdog(uint32_t graceMs) {
    auto& scheduler = session_.scheduler();
    scheduler.cancel(watchdogTask_);
    watchdogTask_ = scheduler.schedule("watchdog", graceMs, config_.watchdogIntervalMs, session_.nowMs(),
                                       [this](uint64_t) { checkLink(); });
    system::logLine("LIVE", "watchdog armed grace=%lums interval=%lums", static_cast<unsigned long>(graceMs),
                    static_cast<unsigned long>(config_.watchdogIntervalMs));
}

void LivenessScheduler::startHeartbeat(CharHandle handle, const Bytes& payload) {
    auto& scheduler = session_.scheduler();
    scheduler.cancel(heartbeatTask_);
    heartbeatHandle_ = handle;
    heartbeatPayload_ = payload;
    heartbeatFailures_ = 0;
    heartbeatTask_ = scheduler.schedule("heartbeat", config_.heartbeatIntervalMs, config_.heartbeatIntervalMs,
                                        session_.nowMs(), [this](uint64_t) { sendHeartbeat(); });
}

void LivenessScheduler::startKeepalive(CharHandle handle, const Bytes& payload, uint32_t intervalMs) {
    auto& scheduler = session_.scheduler();
    scheduler.cancel(keepaliveTask_);
    keepaliveHandle_ = handle;
    keepalivePayload_ = payload;
    keepaliveTask_ = scheduler.schedule("keepalive", intervalMs, intervalMs, session_.nowMs(),
                                        [this](uint64_t) { sendKeepalive(); });
}

void LivenessScheduler::stop() {
    auto& scheduler = session_.scheduler();
    scheduler.cancel(watchdogTask_);
    scheduler.cancel(heartbeatTask_);
    scheduler.cancel(keepaliveTask_);
    watchdogTask_ = system::TaskScheduler::kInvalidTask;
    heartbeatTask_ = system::TaskScheduler::kInvalidTask;
    keepaliveTask_ = system::TaskScheduler::kInvalidTask;
    heartbeatFailures_ = 0;
}

void LivenessScheduler::checkLink() {
    if (session_.transport().isConnected()) {
        return;
    }
    system::logLine("LIVE", "watchdog: link no longer connected");
    if (onFailure_) {
        onFailure_(LinkError::WatchdogDisconnect, "Connection lost - device disconnected");
    }
}

void LivenessScheduler::sendHeartbeat() {
    if (session_.transport().write(heartbeatHandle_, heartbeatPayload_)) {
        heartbeatFailures_ = 0;
        system::traceLine("LIVE", "heartbeat sent");
        return;
    }

    ++heartbeatFailures_;
    system::logLine("LIVE", "heartbeat failed (%lu consecutive)", static_cast<unsigned long>(heartbeatFailures_));
    if (heartbeatFailures_ >= config_.heartbeatFailureLimit && onFailure_) {
        onFailure_(LinkError::HeartbeatFailure, "Connection lost - heartbeat failed");
    }
}

void LivenessScheduler::sendKeepalive() {
    if (session_.transport().write(keepaliveHandle_, keepalivePayload_)) {
        system::traceLine("LIVE", "keepalive sent");
        return;
    }
    ++keepaliveFailures_;
    session_.diagnostics().record("keepalive", LinkError::None, "keepalive write failed", session_.nowMs());
}

}  // namespace owlink
