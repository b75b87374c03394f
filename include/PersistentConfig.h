#pragma once

#include <cstdint>
#include <string>

namespace owlink {

struct LinkSettings {
    bool hasMinRssi = false;
    int32_t minRssi = 0;
    bool hasHeartbeatFailureLimit = false;
    uint32_t heartbeatFailureLimit = 0;
    bool hasAutoReconnect = false;
    bool autoReconnect = true;
    bool hasLastDeviceId = false;
    std::string lastDeviceId;
};

bool loadLinkSettings(LinkSettings& out);
void storeMinRssi(int32_t value);
void storeHeartbeatFailureLimit(uint32_t value);
void storeAutoReconnect(bool value);
void storeLastDeviceId(const std::string& value);
void clearLinkSettings();

}  // namespace owlink
