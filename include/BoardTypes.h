#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace owlink {

using Bytes = std::vector<uint8_t>;

enum class ConnectionState { Disconnected, Scanning, Connecting, Connected, Authenticating, Authenticated, Error };

enum class LinkError {
    None,
    ScanFailure,
    ConnectFailure,
    ServiceNotFound,
    CharacteristicsMissing,
    FirmwareReadFailure,
    ChallengeTimeout,
    InvalidChallengeSignature,
    WriteFailure,
    AllStrategiesExhausted,
    HeartbeatFailure,
    WatchdogDisconnect,
    SentinelLocked
};

enum class BoardModel { Unknown, Pint, XR, GT, GTS };

// Selects the unlock strategy list used for a board.
enum class UnlockProfile { Classic, GT, GTS, Unknown };

struct Advertisement {
    std::string id;
    std::string name;
    int rssi = 0;
    std::vector<std::string> serviceIds;
    std::optional<std::string> address;
};

struct DeviceCandidate {
    std::string id;
    std::string name;
    int rssi = 0;
    std::vector<std::string> serviceIds;
};

const char* toString(ConnectionState state);
const char* toString(LinkError error);
const char* toString(BoardModel model);
const char* toString(UnlockProfile profile);

std::string toLower(const std::string& value);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

}  // namespace owlink
