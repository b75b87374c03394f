#include "BoardTypes.h"

#include <algorithm>
#include <cctype>

namespace owlink {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Scanning: return "Scanning";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Authenticating: return "Authenticating";
        case ConnectionState::Authenticated: return "Authenticated";
        case ConnectionState::Error: return "Error";
    }
    return "Unknown";
}

const char* toString(LinkError error) {
    switch (error) {
        case LinkError::None: return "None";
        case LinkError::ScanFailure: return "ScanFailure";
        case LinkError::ConnectFailure: return "ConnectFailure";
        case LinkError::ServiceNotFound: return "ServiceNotFound";
        case LinkError::CharacteristicsMissing: return "CharacteristicsMissing";
        case LinkError::FirmwareReadFailure: return "FirmwareReadFailure";
        case LinkError::ChallengeTimeout: return "ChallengeTimeout";
        case LinkError::InvalidChallengeSignature: return "InvalidChallengeSignature";
        case LinkError::WriteFailure: return "WriteFailure";
        case LinkError::AllStrategiesExhausted: return "AllStrategiesExhausted";
        case LinkError::HeartbeatFailure: return "HeartbeatFailure";
        case LinkError::WatchdogDisconnect: return "WatchdogDisconnect";
        case LinkError::SentinelLocked: return "SentinelLocked";
    }
    return "Unknown";
}

const char* toString(BoardModel model) {
    switch (model) {
        case BoardModel::Unknown: return "Unknown";
        case BoardModel::Pint: return "Pint";
        case BoardModel::XR: return "XR";
        case BoardModel::GT: return "GT";
        case BoardModel::GTS: return "GT-S";
    }
    return "Unknown";
}

const char* toString(UnlockProfile profile) {
    switch (profile) {
        case UnlockProfile::Classic: return "Classic";
        case UnlockProfile::GT: return "GT";
        case UnlockProfile::GTS: return "GT-S";
        case UnlockProfile::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string toLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return false;
    }
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

}  // namespace owlink
