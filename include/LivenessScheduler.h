#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "BoardTypes.h"
#include "CharacteristicRegistry.h"
#include "LinkConfig.h"
#include "LinkSession.h"
#include "system/TaskScheduler.h"

namespace owlink {

/**
 * @brief Watchdog, heartbeat and keepalive timers of a live session.
 *
 * The watchdog polls the transport link status; the heartbeat writes the
 * cached firmware bytes and reports connection loss after
 * `heartbeatFailureLimit` consecutive failed writes. The keepalive repeats the
 * challenge trigger and only logs its failures. stop() cancels all three.
 */
class LivenessScheduler {
public:
    using FailureHandler = std::function<void(LinkError error, const std::string& message)>;

    LivenessScheduler(LinkSession& session, const LinkConfig& config, FailureHandler onFailure);

    void startWatchdog(uint32_t graceMs);
    void startHeartbeat(CharHandle handle, const Bytes& payload);
    void startKeepalive(CharHandle handle, const Bytes& payload, uint32_t intervalMs);
    void stop();

    bool watchdogActive() const { return session_.scheduler().active(watchdogTask_); }
    bool heartbeatActive() const { return session_.scheduler().active(heartbeatTask_); }
    bool keepaliveActive() const { return session_.scheduler().active(keepaliveTask_); }

    uint32_t heartbeatFailures() const { return heartbeatFailures_; }
    uint32_t keepaliveFailures() const { return keepaliveFailures_; }

private:
    void checkLink();
    void sendHeartbeat();
    void sendKeepalive();

    LinkSession& session_;
    const LinkConfig& config_;
    FailureHandler onFailure_;

    system::TaskScheduler::TaskId watchdogTask_ = system::TaskScheduler::kInvalidTask;
    system::TaskScheduler::TaskId heartbeatTask_ = system::TaskScheduler::kInvalidTask;
    system::TaskScheduler::TaskId keepaliveTask_ = system::TaskScheduler::kInvalidTask;

    CharHandle heartbeatHandle_ = 0;
    Bytes heartbeatPayload_;
    CharHandle keepaliveHandle_ = 0;
    Bytes keepalivePayload_;
    uint32_t heartbeatFailures_ = 0;
    uint32_t keepaliveFailures_ = 0;
};

}  // namespace owlink
