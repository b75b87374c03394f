#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Primary board service. Every characteristic shares the
// e659fXXX-ea98-11e3-ac10-0800200c9a66 pattern.
#define BOARD_SERVICE_UUID "e659f300-ea98-11e3-ac10-0800200c9a66"
#define BOARD_UUID_PREFIX "e659f"
#define BOARD_UUID_SUFFIX "-ea98-11e3-ac10-0800200c9a66"

// Candidate filtering
#define MIN_CANDIDATE_RSSI -80
#define SCAN_DURATION_MS 20000

// Classic boards (Pint, XR, unknown)
#define CLASSIC_CONNECT_ATTEMPTS 3
#define CLASSIC_CONNECT_BACKOFF_MS 500
#define CLASSIC_CONNECT_TIMEOUT_MS 15000
#define CLASSIC_WATCHDOG_GRACE_MS 2000
#define CLASSIC_DISCOVERY_TIMEOUT_MS 10000
#define CLASSIC_FIRMWARE_READ_ATTEMPTS 3
#define CLASSIC_READ_TIMEOUT_MS 3000
#define CLASSIC_MIN_CHALLENGE_BYTES 20
#define CLASSIC_CHALLENGE_TIMEOUT_MS 15000
#define CLASSIC_KEEPALIVE_INTERVAL_MS 20000

// Newer boards (GT, GT-S)
#define NEWER_CONNECT_ATTEMPTS 5
#define NEWER_CONNECT_BACKOFF_MS 800
#define NEWER_CONNECT_TIMEOUT_MS 25000
#define NEWER_WATCHDOG_GRACE_MS 5000
#define NEWER_DISCOVERY_TIMEOUT_MS 15000
#define NEWER_FIRMWARE_READ_ATTEMPTS 5
#define NEWER_READ_TIMEOUT_MS 5000
#define NEWER_MIN_CHALLENGE_BYTES 10
#define NEWER_CHALLENGE_TIMEOUT_MS 25000
#define NEWER_KEEPALIVE_INTERVAL_MS 30000

// Advertised-name marker that selects the newer connect timings
#define NEWER_BOARD_NAME_MARKER "gt"

// Liveness
#define HEARTBEAT_INTERVAL_MS 15000
#define WATCHDOG_INTERVAL_MS 5000
#define HEARTBEAT_FAILURE_LIMIT 1

// Task watchdog. A single NimBLE read or discovery can block for the full
// ATT transaction timeout.
#define ATT_TRANSACTION_TIMEOUT_MS 30000
#define TASK_WATCHDOG_MARGIN_S 10

// Pauses inside the unlock sequence
#define UNLOCK_PAUSE_MS 250
#define RESPONSE_SETTLE_MS 100
#define SUBSCRIPTION_SPACING_MS 50
#define FIRMWARE_RETRY_BACKOFF_MS 200
#define POLL_STEP_MS 10

inline std::vector<std::string> defaultNameFragments() {
    return {"onewheel", "ow", "future motion", "fm", "pint", "xr", "gt"};
}

inline std::vector<std::string> defaultManufacturerPrefixes() {
    return {"00:13:43", "00:1B:63"};
}

inline std::array<uint8_t, 16> defaultSecretKey() {
    return {0xd9, 0x25, 0x5f, 0x0f, 0x23, 0x35, 0x4e, 0x19,
            0xba, 0x73, 0x9c, 0xcd, 0xc4, 0xa9, 0x17, 0x65};
}

// Unlock commands for the newer boards. None of these has been confirmed on
// hardware; swap them here when a capture says otherwise.
inline std::vector<uint8_t> defaultDirectUnlockCommand() {
    return {0x43, 0x52, 0x58, 0x01, 0x00};
}

inline std::vector<uint8_t> defaultAlternateUnlockCommand() {
    return {0x43, 0x52, 0x58, 0x02, 0x00};
}

// Tooling port (firmware only)
#define TOOLING_BAUD 115200
#define TOOLING_RX_PIN 16
#define TOOLING_TX_PIN 17
#define STATUS_LOG_INTERVAL_MS 10000
#define DIAGNOSTICS_PUSH_INTERVAL_MS 5000
#define TELEMETRY_FRAME_INTERVAL_MS 100
#define AUTO_RESCAN_INTERVAL_MS 30000
