#include <Arduino.h>
#include <esp_system.h>
#include <esp_task_wdt.h>

#include <array>
#include <memory>
#include <string>

#include "BoardLink.h"
#include "Config.h"
#include "EventCodec.h"
#include "LinkConfig.h"
#include "NimBleTransport.h"
#include "PersistentConfig.h"

static constexpr const char* kFirmwareVersion = "0.4.0";
static constexpr const char* kLocalName = "owlink";

static owlink::ArduinoClock g_clock;
static owlink::NimBleTransport g_transport;
static std::unique_ptr<owlink::BoardLink> g_link;
static owlink::FrameAssembler g_rxFrames;
static HardwareSerial& g_tooling = Serial1;

static bool g_bleReady = false;
static uint32_t g_framesSent = 0;
static uint32_t g_framesFailed = 0;
static uint32_t g_commandsHandled = 0;
static uint32_t g_commandsRejected = 0;
static uint64_t g_lastTelemetryFrameMs = 0;
static bool g_telemetryPending = false;
static owlink::TelemetryField g_pendingField = owlink::TelemetryField::Unknown;

static void sendFrame(const owlink::FrameBuffer& buffer, size_t totalLen) {
    const size_t written = g_tooling.write(buffer.data(), totalLen);
    if (written != totalLen) {
        Serial.println("[TOOL] short write on tooling port");
        ++g_framesFailed;
        return;
    }
    ++g_framesSent;
}

static void sendDiagnostics(uint64_t now) {
    if (!g_link) {
        return;
    }
    owlink::FrameBuffer buffer{};
    size_t totalLen = 0;
    if (owlink::encodeDiagnosticsEvent(g_link->diagnostics(), now, buffer, totalLen)) {
        sendFrame(buffer, totalLen);
    } else {
        ++g_framesFailed;
    }
}

static void flushTelemetry(uint64_t now) {
    if (!g_link || !g_telemetryPending) {
        return;
    }
    if (now - g_lastTelemetryFrameMs < TELEMETRY_FRAME_INTERVAL_MS) {
        return;
    }
    owlink::FrameBuffer buffer{};
    size_t totalLen = 0;
    if (owlink::encodeTelemetryEvent(g_link->telemetry(), g_pendingField, now, buffer, totalLen)) {
        sendFrame(buffer, totalLen);
    } else {
        ++g_framesFailed;
    }
    g_telemetryPending = false;
    g_lastTelemetryFrameMs = now;
}

static void attachEventRelays() {
    owlink::EventChannel& events = g_link->events();

    events.onState([](const owlink::StateChange& change) {
        Serial.print("[LINK] ");
        Serial.print(owlink::toString(change.previous));
        Serial.print(" -> ");
        Serial.print(owlink::toString(change.current));
        if (change.error != owlink::LinkError::None) {
            Serial.print(" error=");
            Serial.print(owlink::toString(change.error));
        }
        if (!change.message.empty()) {
            Serial.print(" msg=");
            Serial.print(change.message.c_str());
        }
        Serial.println();

        owlink::FrameBuffer buffer{};
        size_t totalLen = 0;
        if (owlink::encodeStateEvent(change, buffer, totalLen)) {
            sendFrame(buffer, totalLen);
        } else {
            ++g_framesFailed;
        }
    });

    events.onTelemetry([](const owlink::TelemetrySnapshot&, owlink::TelemetryField field) {
        g_pendingField = field;
        g_telemetryPending = true;
    });

    events.onCandidates([](const std::vector<owlink::DeviceCandidate>& candidates) {
        owlink::FrameBuffer buffer{};
        size_t totalLen = 0;
        if (owlink::encodeCandidateEvent(candidates, millis(), buffer, totalLen)) {
            sendFrame(buffer, totalLen);
        } else {
            ++g_framesFailed;
        }
    });
}

static void processCommand(const owlink::LinkCommandRequest& cmd) {
    if (!g_link) {
        return;
    }

    Serial.print("[TOOL] <- ");
    Serial.println(owlink::toString(cmd.kind));

    const uint64_t now = millis();
    switch (cmd.kind) {
        case owlink::CommandKind::StartScan:
            if (!g_link->startScan()) {
                ++g_commandsRejected;
            }
            break;
        case owlink::CommandKind::StopScan:
            g_link->stopScan();
            break;
        case owlink::CommandKind::Connect:
            if (!g_link->connect(cmd.deviceId)) {
                ++g_commandsRejected;
            }
            break;
        case owlink::CommandKind::Disconnect:
            g_link->disconnect();
            break;
        case owlink::CommandKind::RequestDiagnostics:
            sendDiagnostics(now);
            break;
        case owlink::CommandKind::SetMinRssi:
            if (!g_link->setMinRssi(cmd.minRssi)) {
                Serial.print("[TOOL] min rssi out of range: ");
                Serial.println(cmd.minRssi);
                ++g_commandsRejected;
            }
            break;
        case owlink::CommandKind::SetAutoReconnect:
            g_link->setAutoReconnect(cmd.autoReconnect);
            break;
    }
    ++g_commandsHandled;
}

static void drainToolingPort() {
    while (g_tooling.available() > 0) {
        const int value = g_tooling.read();
        if (value < 0) {
            break;
        }
        if (!g_rxFrames.push(static_cast<uint8_t>(value))) {
            continue;
        }
        owlink::LinkCommandRequest cmd;
        if (owlink::decodeCommandFrame(g_rxFrames.frame(), g_rxFrames.frameLength(), cmd)) {
            processCommand(cmd);
        } else {
            ++g_commandsRejected;
        }
    }
}

static void setupLink() {
    owlink::LinkConfig cfg;
    g_link = std::make_unique<owlink::BoardLink>(cfg, g_transport, g_clock);
    attachEventRelays();
}

static void printStatus(uint64_t now) {
    const owlink::DiagnosticSnapshot diag = g_link->diagnostics();
    Serial.println("[STATUS] --------------------------------");
    Serial.print("[STATUS] Uptime_s=");
    Serial.println(static_cast<unsigned long>(now / 1000));
    Serial.print("[STATUS] ble_ready=");
    Serial.println(g_bleReady ? "true" : "false");
    Serial.print("[STATUS] state=");
    Serial.println(owlink::toString(diag.state));
    if (!diag.deviceId.empty()) {
        Serial.print("[STATUS] device=");
        Serial.print(diag.deviceName.c_str());
        Serial.print(" (");
        Serial.print(diag.deviceId.c_str());
        Serial.println(")");
        Serial.print("[STATUS] model=");
        Serial.print(owlink::toString(diag.model));
        Serial.print(" profile=");
        Serial.print(owlink::toString(diag.profile));
        Serial.print(" layout=");
        Serial.println(owlink::toString(diag.layout));
    }
    Serial.print("[STATUS] candidates=");
    Serial.print(static_cast<unsigned>(diag.candidateCount));
    Serial.print(" characteristics=");
    Serial.print(static_cast<unsigned>(diag.characteristicCount));
    Serial.print(" subscriptions=");
    Serial.println(static_cast<unsigned>(diag.subscriptionCount));
    Serial.print("[STATUS] heartbeat=");
    Serial.print(diag.heartbeatActive ? "on" : "off");
    Serial.print(" watchdog=");
    Serial.print(diag.watchdogActive ? "on" : "off");
    Serial.print(" keepalive=");
    Serial.println(diag.keepaliveActive ? "on" : "off");
    Serial.print("[STATUS] decode_failures=");
    Serial.print(diag.decodeFailures);
    Serial.print(" strategy_attempts=");
    Serial.println(diag.strategyAttempts);
    if (diag.lastError != owlink::LinkError::None) {
        Serial.print("[STATUS] last_error=");
        Serial.print(owlink::toString(diag.lastError));
        Serial.print(" msg=");
        Serial.println(diag.lastErrorMessage.c_str());
    } else {
        Serial.println("[STATUS] last_error=none");
    }
    const owlink::TelemetrySnapshot& telemetry = g_link->telemetry();
    if (telemetry.batteryPercent) {
        Serial.print("[STATUS] battery=");
        Serial.print(*telemetry.batteryPercent, 0);
        Serial.print("% ");
        Serial.println(telemetry.batteryStatus());
    }
    Serial.print("[STATUS] frames_sent=");
    Serial.print(g_framesSent);
    Serial.print(" frames_failed=");
    Serial.print(g_framesFailed);
    Serial.print(" commands=");
    Serial.print(g_commandsHandled);
    Serial.print(" rejected=");
    Serial.print(g_commandsRejected);
    Serial.print(" rx_dropped=");
    Serial.println(g_rxFrames.droppedFrames());
    Serial.println("[STATUS] --------------------------------");
}

void setup() {
    Serial.begin(115200);
    delay(100);
    Serial.println();
    Serial.println("========================================");
    Serial.println("    owlink - Booting");
    Serial.println("========================================");
    Serial.print("Firmware version: ");
    Serial.println(kFirmwareVersion);
    Serial.println();

    esp_reset_reason_t resetReason = esp_reset_reason();
    Serial.print("Reset reason: ");
    switch (resetReason) {
        case ESP_RST_POWERON: Serial.println("Power-on reset"); break;
        case ESP_RST_SW: Serial.println("Software reset via esp_restart"); break;
        case ESP_RST_PANIC: Serial.println("!!! PANIC/EXCEPTION !!!"); break;
        case ESP_RST_INT_WDT: Serial.println("!!! INTERRUPT WATCHDOG !!!"); break;
        case ESP_RST_TASK_WDT: Serial.println("!!! TASK WATCHDOG !!!"); break;
        case ESP_RST_WDT: Serial.println("!!! OTHER WATCHDOG !!!"); break;
        case ESP_RST_BROWNOUT: Serial.println("!!! BROWNOUT !!!"); break;
        default: Serial.println("Unknown"); break;
    }

    Serial.print("Free heap: ");
    Serial.print(ESP.getFreeHeap());
    Serial.println(" bytes");
    Serial.println();

    const uint32_t wdtSeconds = owlink::taskWatchdogTimeoutS(owlink::LinkConfig{});
    Serial.print("Initializing watchdog timer (");
    Serial.print(wdtSeconds);
    Serial.println("s timeout)...");
    esp_task_wdt_init(wdtSeconds, true);
    esp_task_wdt_add(NULL);
    Serial.println("Watchdog enabled");

    g_tooling.begin(TOOLING_BAUD, SERIAL_8N1, TOOLING_RX_PIN, TOOLING_TX_PIN);
    Serial.println("Tooling port: OK");

    g_bleReady = g_transport.begin(kLocalName);
    Serial.println(g_bleReady ? "BLE central: OK" : "BLE central: FAILED");

    setupLink();

    Serial.println();
    Serial.println("[BOOT] --------------------------------");
    Serial.println("[BOOT] System ready");
    Serial.print("[BOOT] min_rssi=");
    Serial.println(g_link->config().filter.minRssi);
    Serial.print("[BOOT] heartbeat_failure_limit=");
    Serial.println(g_link->config().heartbeatFailureLimit);
    Serial.print("[BOOT] auto_reconnect=");
    Serial.println(g_link->autoReconnect() ? "true" : "false");
    Serial.print("[BOOT] remembered_device=");
    Serial.println(g_link->rememberedDeviceId().empty() ? "none" : g_link->rememberedDeviceId().c_str());
    Serial.println("[BOOT] --------------------------------");
    Serial.println();

    if (g_bleReady && g_link->autoReconnect() && !g_link->rememberedDeviceId().empty()) {
        Serial.println("[BOOT] scanning for remembered board");
        g_link->startScan();
    }

    esp_task_wdt_reset();
}

void loop() {
    uint64_t now = millis();

    drainToolingPort();
    if (g_link) {
        g_link->service();
    }
    now = millis();
    flushTelemetry(now);

    static uint64_t lastRescan = 0;
    if (g_bleReady && g_link && g_link->autoReconnect() && !g_link->rememberedDeviceId().empty() &&
        g_link->state() == owlink::ConnectionState::Disconnected && now - lastRescan > AUTO_RESCAN_INTERVAL_MS) {
        lastRescan = now;
        g_link->startScan();
    }

    static uint64_t lastDiagnostics = 0;
    if (now - lastDiagnostics > DIAGNOSTICS_PUSH_INTERVAL_MS) {
        sendDiagnostics(now);
        lastDiagnostics = now;
    }

    static uint64_t lastStatus = 0;
    if (g_link && now - lastStatus > STATUS_LOG_INTERVAL_MS) {
        printStatus(now);
        lastStatus = now;
    }

    static uint64_t lastWdtReset = 0;
    if (now - lastWdtReset > 5000) {
        esp_task_wdt_reset();
        lastWdtReset = now;
    }

    delay(5);
}
