#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "BoardLink.h"
#include "BoardTypes.h"
#include "EventChannel.h"
#include "TelemetryCodec.h"

namespace owlink {

constexpr size_t kProtoBufferSize = 512;
constexpr size_t kLengthPrefixBytes = 2;
constexpr size_t kMaxFrameCandidates = 8;

using FrameBuffer = std::array<uint8_t, kLengthPrefixBytes + kProtoBufferSize>;

// Each encoder writes a length-prefixed LinkEvent frame; totalLen includes
// the 2-byte prefix.
bool encodeStateEvent(const StateChange& change, FrameBuffer& buffer, size_t& totalLen);
bool encodeTelemetryEvent(const TelemetrySnapshot& snapshot, TelemetryField field, uint64_t nowMs,
                          FrameBuffer& buffer, size_t& totalLen);
bool encodeDiagnosticsEvent(const DiagnosticSnapshot& diagnostics, uint64_t nowMs, FrameBuffer& buffer,
                            size_t& totalLen);
// Strongest candidates first, capped at kMaxFrameCandidates.
bool encodeCandidateEvent(const std::vector<DeviceCandidate>& candidates, uint64_t nowMs, FrameBuffer& buffer,
                          size_t& totalLen);

enum class CommandKind { StartScan, StopScan, Connect, Disconnect, RequestDiagnostics, SetMinRssi, SetAutoReconnect };

const char* toString(CommandKind kind);

struct LinkCommandRequest {
    CommandKind kind = CommandKind::RequestDiagnostics;
    std::string deviceId;
    int minRssi = 0;
    bool autoReconnect = false;
};

// Decodes a bare LinkCommand payload (no length prefix).
bool decodeCommand(const uint8_t* payload, size_t len, LinkCommandRequest& out);
// Decodes a length-prefixed frame; rejects frames whose prefix disagrees with len.
bool decodeCommandFrame(const uint8_t* frame, size_t len, LinkCommandRequest& out);

/**
 * @brief Reassembles length-prefixed frames from a byte stream.
 *
 * push() returns true once a complete frame is buffered; frame() then holds
 * prefix and payload. A prefix announcing more than kProtoBufferSize bytes
 * discards the frame and resynchronises on the next byte.
 */
class FrameAssembler {
public:
    bool push(uint8_t byte);
    void reset() { length_ = 0; }

    const uint8_t* frame() const { return buffer_.data(); }
    size_t frameLength() const { return length_; }
    uint32_t droppedFrames() const { return dropped_; }

private:
    FrameBuffer buffer_{};
    size_t length_ = 0;
    bool complete_ = false;
    uint32_t dropped_ = 0;
};

}  // namespace owlink
