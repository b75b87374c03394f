#include "EventCodec.h"

#include <pb_decode.h>
#include <pb_encode.h>

#include "owlink.pb.h"
#include "system/Log.h"

#include <algorithm>
#include <cstring>

namespace owlink {

namespace {

owlink_tooling_LinkState toProtoState(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return owlink_tooling_LinkState_LINK_STATE_DISCONNECTED;
        case ConnectionState::Scanning:
            return owlink_tooling_LinkState_LINK_STATE_SCANNING;
        case ConnectionState::Connecting:
            return owlink_tooling_LinkState_LINK_STATE_CONNECTING;
        case ConnectionState::Connected:
            return owlink_tooling_LinkState_LINK_STATE_CONNECTED;
        case ConnectionState::Authenticating:
            return owlink_tooling_LinkState_LINK_STATE_AUTHENTICATING;
        case ConnectionState::Authenticated:
            return owlink_tooling_LinkState_LINK_STATE_AUTHENTICATED;
        case ConnectionState::Error:
            return owlink_tooling_LinkState_LINK_STATE_ERROR;
    }
    return owlink_tooling_LinkState_LINK_STATE_DISCONNECTED;
}

owlink_tooling_LinkErrorKind toProtoError(LinkError error) {
    switch (error) {
        case LinkError::None:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_NONE;
        case LinkError::ScanFailure:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_SCAN_FAILURE;
        case LinkError::ConnectFailure:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_CONNECT_FAILURE;
        case LinkError::ServiceNotFound:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_SERVICE_NOT_FOUND;
        case LinkError::CharacteristicsMissing:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_CHARACTERISTICS_MISSING;
        case LinkError::FirmwareReadFailure:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_FIRMWARE_READ_FAILURE;
        case LinkError::ChallengeTimeout:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_CHALLENGE_TIMEOUT;
        case LinkError::InvalidChallengeSignature:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_INVALID_CHALLENGE_SIGNATURE;
        case LinkError::WriteFailure:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_WRITE_FAILURE;
        case LinkError::AllStrategiesExhausted:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_ALL_STRATEGIES_EXHAUSTED;
        case LinkError::HeartbeatFailure:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_HEARTBEAT_FAILURE;
        case LinkError::WatchdogDisconnect:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_WATCHDOG_DISCONNECT;
        case LinkError::SentinelLocked:
            return owlink_tooling_LinkErrorKind_LINK_ERROR_SENTINEL_LOCKED;
    }
    return owlink_tooling_LinkErrorKind_LINK_ERROR_NONE;
}

owlink_tooling_BoardModelKind toProtoModel(BoardModel model) {
    switch (model) {
        case BoardModel::Unknown:
            return owlink_tooling_BoardModelKind_BOARD_MODEL_UNKNOWN;
        case BoardModel::Pint:
            return owlink_tooling_BoardModelKind_BOARD_MODEL_PINT;
        case BoardModel::XR:
            return owlink_tooling_BoardModelKind_BOARD_MODEL_XR;
        case BoardModel::GT:
            return owlink_tooling_BoardModelKind_BOARD_MODEL_GT;
        case BoardModel::GTS:
            return owlink_tooling_BoardModelKind_BOARD_MODEL_GTS;
    }
    return owlink_tooling_BoardModelKind_BOARD_MODEL_UNKNOWN;
}

// Truncating copy into a nanopb fixed-size string field.
template <size_t N>
void copyString(char (&dst)[N], const std::string& src) {
    const size_t len = std::min(src.size(), N - 1);
    std::memcpy(dst, src.data(), len);
    dst[len] = '\0';
}

template <typename T>
void setOptional(bool& has, float& slot, const std::optional<T>& value) {
    has = value.has_value();
    if (has) {
        slot = static_cast<float>(*value);
    }
}

void setOptional(bool& has, uint32_t& slot, const std::optional<uint16_t>& value) {
    has = value.has_value();
    if (has) {
        slot = *value;
    }
}

bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, FrameBuffer& buffer, size_t& totalLen) {
    pb_ostream_t stream = pb_ostream_from_buffer(buffer.data() + kLengthPrefixBytes, kProtoBufferSize);
    if (!pb_encode(&stream, fields, src)) {
        system::logLine("TOOL", "encode error: %s", PB_GET_ERROR(&stream));
        return false;
    }
    const size_t payloadLen = stream.bytes_written;
    if (payloadLen > 0xFFFF) {
        system::logLine("TOOL", "encode error: payload too large");
        return false;
    }
    buffer[0] = static_cast<uint8_t>(payloadLen & 0xFF);
    buffer[1] = static_cast<uint8_t>((payloadLen >> 8) & 0xFF);
    totalLen = payloadLen + kLengthPrefixBytes;
    return true;
}

}  // namespace

bool encodeStateEvent(const StateChange& change, FrameBuffer& buffer, size_t& totalLen) {
    owlink_tooling_LinkEvent evt = owlink_tooling_LinkEvent_init_zero;
    evt.timestamp_ms = change.timestampMs;
    evt.which_event = owlink_tooling_LinkEvent_state_tag;
    evt.event.state.previous = toProtoState(change.previous);
    evt.event.state.current = toProtoState(change.current);
    evt.event.state.error = toProtoError(change.error);
    copyString(evt.event.state.message, change.message);
    return encodeWithLength(owlink_tooling_LinkEvent_fields, &evt, buffer, totalLen);
}

bool encodeTelemetryEvent(const TelemetrySnapshot& snapshot, TelemetryField field, uint64_t nowMs,
                          FrameBuffer& buffer, size_t& totalLen) {
    owlink_tooling_LinkEvent evt = owlink_tooling_LinkEvent_init_zero;
    evt.timestamp_ms = nowMs;
    evt.which_event = owlink_tooling_LinkEvent_telemetry_tag;

    auto& t = evt.event.telemetry;
    copyString(t.field, toString(field));
    setOptional(t.has_battery_percent, t.battery_percent, snapshot.batteryPercent);
    setOptional(t.has_pitch, t.pitch, snapshot.pitch);
    setOptional(t.has_roll, t.roll, snapshot.roll);
    setOptional(t.has_yaw, t.yaw, snapshot.yaw);
    setOptional(t.has_rpm, t.rpm, snapshot.rpm);
    setOptional(t.has_temperature, t.temperature, snapshot.temperature);
    setOptional(t.has_current_amps, t.current_amps, snapshot.currentAmps);
    setOptional(t.has_battery_voltage, t.battery_voltage, snapshot.batteryVoltage);
    setOptional(t.has_trip_odometer_km, t.trip_odometer_km, snapshot.tripOdometerKm);
    setOptional(t.has_lifetime_odometer_km, t.lifetime_odometer_km, snapshot.lifetimeOdometerKm);
    setOptional(t.has_ride_mode, t.ride_mode, snapshot.rideMode);
    setOptional(t.has_serial_number, t.serial_number, snapshot.serialNumber);
    setOptional(t.has_firmware_revision, t.firmware_revision, snapshot.firmwareRevision);
    if (snapshot.rpm.has_value()) {
        t.has_speed_mph = true;
        t.speed_mph = static_cast<float>(snapshot.speedMph());
    }
    t.charging = snapshot.isCharging();
    t.riding = snapshot.isRiding();
    t.update_count = snapshot.updateCount;
    return encodeWithLength(owlink_tooling_LinkEvent_fields, &evt, buffer, totalLen);
}

bool encodeDiagnosticsEvent(const DiagnosticSnapshot& diagnostics, uint64_t nowMs, FrameBuffer& buffer,
                            size_t& totalLen) {
    owlink_tooling_LinkEvent evt = owlink_tooling_LinkEvent_init_zero;
    evt.timestamp_ms = nowMs;
    evt.which_event = owlink_tooling_LinkEvent_diagnostics_tag;

    auto& d = evt.event.diagnostics;
    d.state = toProtoState(diagnostics.state);
    copyString(d.device_id, diagnostics.deviceId);
    copyString(d.device_name, diagnostics.deviceName);
    d.model = toProtoModel(diagnostics.model);
    copyString(d.profile, toString(diagnostics.profile));
    copyString(d.layout, toString(diagnostics.layout));
    d.candidate_count = static_cast<uint32_t>(diagnostics.candidateCount);
    d.characteristic_count = static_cast<uint32_t>(diagnostics.characteristicCount);
    d.subscription_count = static_cast<uint32_t>(diagnostics.subscriptionCount);
    d.heartbeat_active = diagnostics.heartbeatActive;
    d.watchdog_active = diagnostics.watchdogActive;
    d.keepalive_active = diagnostics.keepaliveActive;
    d.decode_failures = diagnostics.decodeFailures;
    d.strategy_attempts = diagnostics.strategyAttempts;
    d.last_error = toProtoError(diagnostics.lastError);
    copyString(d.last_error_message, diagnostics.lastErrorMessage);
    d.diagnostic_entries = diagnostics.diagnosticEntries;
    return encodeWithLength(owlink_tooling_LinkEvent_fields, &evt, buffer, totalLen);
}

bool encodeCandidateEvent(const std::vector<DeviceCandidate>& candidates, uint64_t nowMs, FrameBuffer& buffer,
                          size_t& totalLen) {
    std::vector<const DeviceCandidate*> ranked;
    ranked.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        ranked.push_back(&candidate);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const DeviceCandidate* a, const DeviceCandidate* b) { return a->rssi > b->rssi; });

    owlink_tooling_LinkEvent evt = owlink_tooling_LinkEvent_init_zero;
    evt.timestamp_ms = nowMs;
    evt.which_event = owlink_tooling_LinkEvent_candidates_tag;

    auto& list = evt.event.candidates;
    const size_t count = std::min(ranked.size(), kMaxFrameCandidates);
    for (size_t i = 0; i < count; ++i) {
        auto& entry = list.candidates[i];
        copyString(entry.id, ranked[i]->id);
        copyString(entry.name, ranked[i]->name);
        entry.rssi = ranked[i]->rssi;
    }
    list.candidates_count = static_cast<pb_size_t>(count);
    return encodeWithLength(owlink_tooling_LinkEvent_fields, &evt, buffer, totalLen);
}

const char* toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::StartScan:
            return "start_scan";
        case CommandKind::StopScan:
            return "stop_scan";
        case CommandKind::Connect:
            return "connect";
        case CommandKind::Disconnect:
            return "disconnect";
        case CommandKind::RequestDiagnostics:
            return "request_diagnostics";
        case CommandKind::SetMinRssi:
            return "set_min_rssi";
        case CommandKind::SetAutoReconnect:
            return "set_auto_reconnect";
    }
    return "unknown";
}

bool decodeCommand(const uint8_t* payload, size_t len, LinkCommandRequest& out) {
    owlink_tooling_LinkCommand cmd = owlink_tooling_LinkCommand_init_default;
    pb_istream_t stream = pb_istream_from_buffer(payload, len);
    if (!pb_decode(&stream, owlink_tooling_LinkCommand_fields, &cmd)) {
        system::logLine("TOOL", "decode error: %s", PB_GET_ERROR(&stream));
        return false;
    }

    switch (cmd.which_command) {
        case owlink_tooling_LinkCommand_start_scan_tag:
            out.kind = CommandKind::StartScan;
            return true;
        case owlink_tooling_LinkCommand_stop_scan_tag:
            out.kind = CommandKind::StopScan;
            return true;
        case owlink_tooling_LinkCommand_connect_tag:
            out.kind = CommandKind::Connect;
            out.deviceId = cmd.command.connect.device_id;
            if (out.deviceId.empty()) {
                system::logLine("TOOL", "connect without device id");
                return false;
            }
            return true;
        case owlink_tooling_LinkCommand_disconnect_tag:
            out.kind = CommandKind::Disconnect;
            return true;
        case owlink_tooling_LinkCommand_request_diagnostics_tag:
            out.kind = CommandKind::RequestDiagnostics;
            return true;
        case owlink_tooling_LinkCommand_set_min_rssi_tag:
            out.kind = CommandKind::SetMinRssi;
            out.minRssi = cmd.command.set_min_rssi.rssi;
            return true;
        case owlink_tooling_LinkCommand_set_auto_reconnect_tag:
            out.kind = CommandKind::SetAutoReconnect;
            out.autoReconnect = cmd.command.set_auto_reconnect.enabled;
            return true;
        default:
            system::logLine("TOOL", "unknown command tag %u", static_cast<unsigned>(cmd.which_command));
            return false;
    }
}

bool decodeCommandFrame(const uint8_t* frame, size_t len, LinkCommandRequest& out) {
    if (frame == nullptr || len < kLengthPrefixBytes) {
        system::logLine("TOOL", "<- frame too short (%u bytes)", static_cast<unsigned>(len));
        return false;
    }
    const size_t expected = static_cast<size_t>(frame[0]) | (static_cast<size_t>(frame[1]) << 8);
    if (expected != len - kLengthPrefixBytes) {
        system::logLine("TOOL", "<- length mismatch (prefix=%u, payload=%u)", static_cast<unsigned>(expected),
                        static_cast<unsigned>(len - kLengthPrefixBytes));
        return false;
    }
    return decodeCommand(frame + kLengthPrefixBytes, expected, out);
}

bool FrameAssembler::push(uint8_t byte) {
    if (complete_) {
        length_ = 0;
        complete_ = false;
    }

    buffer_[length_++] = byte;
    if (length_ < kLengthPrefixBytes) {
        return false;
    }

    const size_t payloadLen = static_cast<size_t>(buffer_[0]) | (static_cast<size_t>(buffer_[1]) << 8);
    if (payloadLen > kProtoBufferSize) {
        system::logLine("TOOL", "<- oversize frame (%u bytes), dropping", static_cast<unsigned>(payloadLen));
        ++dropped_;
        length_ = 0;
        return false;
    }
    if (length_ == kLengthPrefixBytes + payloadLen) {
        complete_ = true;
        return true;
    }
    return false;
}

}  // namespace owlink
