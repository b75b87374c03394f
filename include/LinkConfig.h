#pragma once

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>

#include "BoardTypes.h"
#include "ChallengeResponse.h"
#include "Config.h"
#include "DeviceFilter.h"

namespace owlink {

// Per-family timing; classic boards and the newer GT family differ.
struct LinkTiming {
    uint32_t connectAttempts = CLASSIC_CONNECT_ATTEMPTS;
    uint32_t connectBackoffMs = CLASSIC_CONNECT_BACKOFF_MS;
    uint32_t connectTimeoutMs = CLASSIC_CONNECT_TIMEOUT_MS;
    uint32_t watchdogGraceMs = CLASSIC_WATCHDOG_GRACE_MS;
    uint32_t discoveryTimeoutMs = CLASSIC_DISCOVERY_TIMEOUT_MS;
    uint32_t firmwareReadAttempts = CLASSIC_FIRMWARE_READ_ATTEMPTS;
    uint32_t readTimeoutMs = CLASSIC_READ_TIMEOUT_MS;
    uint32_t minChallengeBytes = CLASSIC_MIN_CHALLENGE_BYTES;
    uint32_t challengeTimeoutMs = CLASSIC_CHALLENGE_TIMEOUT_MS;
    uint32_t keepaliveIntervalMs = CLASSIC_KEEPALIVE_INTERVAL_MS;
};

inline LinkTiming classicTiming() {
    return LinkTiming{};
}

inline LinkTiming newerTiming() {
    LinkTiming timing;
    timing.connectAttempts = NEWER_CONNECT_ATTEMPTS;
    timing.connectBackoffMs = NEWER_CONNECT_BACKOFF_MS;
    timing.connectTimeoutMs = NEWER_CONNECT_TIMEOUT_MS;
    timing.watchdogGraceMs = NEWER_WATCHDOG_GRACE_MS;
    timing.discoveryTimeoutMs = NEWER_DISCOVERY_TIMEOUT_MS;
    timing.firmwareReadAttempts = NEWER_FIRMWARE_READ_ATTEMPTS;
    timing.readTimeoutMs = NEWER_READ_TIMEOUT_MS;
    timing.minChallengeBytes = NEWER_MIN_CHALLENGE_BYTES;
    timing.challengeTimeoutMs = NEWER_CHALLENGE_TIMEOUT_MS;
    timing.keepaliveIntervalMs = NEWER_KEEPALIVE_INTERVAL_MS;
    return timing;
}

struct LinkConfig {
    LinkTiming classic = classicTiming();
    LinkTiming newer = newerTiming();
    std::string newerNameMarker = NEWER_BOARD_NAME_MARKER;

    uint32_t scanDurationMs = SCAN_DURATION_MS;
    uint32_t heartbeatIntervalMs = HEARTBEAT_INTERVAL_MS;
    uint32_t watchdogIntervalMs = WATCHDOG_INTERVAL_MS;
    uint32_t heartbeatFailureLimit = HEARTBEAT_FAILURE_LIMIT;

    uint32_t unlockPauseMs = UNLOCK_PAUSE_MS;
    uint32_t settleDelayMs = RESPONSE_SETTLE_MS;
    uint32_t subscriptionSpacingMs = SUBSCRIPTION_SPACING_MS;
    uint32_t firmwareRetryBackoffMs = FIRMWARE_RETRY_BACKOFF_MS;
    uint32_t pollStepMs = POLL_STEP_MS;

    FilterConfig filter;
    SecretKey secretKey = defaultSecretKey();
    Bytes directUnlockCommand = defaultDirectUnlockCommand();
    Bytes alternateUnlockCommand = defaultAlternateUnlockCommand();
};

// Longest single blocking radio call the configured timings allow.
inline uint32_t longestBlockingMs(const LinkConfig& config) {
    uint32_t longest = ATT_TRANSACTION_TIMEOUT_MS;
    for (const LinkTiming* timing : {&config.classic, &config.newer}) {
        longest = std::max({longest, timing->connectTimeoutMs, timing->discoveryTimeoutMs, timing->readTimeoutMs});
    }
    return longest;
}

inline uint32_t taskWatchdogTimeoutS(const LinkConfig& config) {
    return (longestBlockingMs(config) + 999) / 1000 + TASK_WATCHDOG_MARGIN_S;
}

}  // namespace owlink
