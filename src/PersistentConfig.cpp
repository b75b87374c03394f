#include "PersistentConfig.h"

#ifdef ARDUINO
#include <Preferences.h>

namespace owlink {
namespace {
constexpr const char* kNamespace = "owlink";
constexpr const char* kKeyMinRssi = "minrssi";
constexpr const char* kKeyHbLimit = "hblimit";
constexpr const char* kKeyAutoReconnect = "autorc";
constexpr const char* kKeyLastDevice = "lastdev";

bool readInt(Preferences& prefs, const char* key, int32_t& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getInt(key, 0);
    return true;
}

bool readUInt(Preferences& prefs, const char* key, uint32_t& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getUInt(key, 0U);
    return true;
}

}  // namespace

bool loadLinkSettings(LinkSettings& out) {
    Preferences prefs;
    if (!prefs.begin(kNamespace, true)) {
        return false;
    }
    bool any = false;
    if (readInt(prefs, kKeyMinRssi, out.minRssi)) {
        out.hasMinRssi = true;
        any = true;
    }
    if (readUInt(prefs, kKeyHbLimit, out.heartbeatFailureLimit)) {
        out.hasHeartbeatFailureLimit = true;
        any = true;
    }
    if (prefs.isKey(kKeyAutoReconnect)) {
        out.autoReconnect = prefs.getBool(kKeyAutoReconnect, true);
        out.hasAutoReconnect = true;
        any = true;
    }
    if (prefs.isKey(kKeyLastDevice)) {
        out.lastDeviceId = prefs.getString(kKeyLastDevice, "").c_str();
        out.hasLastDeviceId = !out.lastDeviceId.empty();
        any = any || out.hasLastDeviceId;
    }
    prefs.end();
    return any;
}

void storeMinRssi(int32_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putInt(kKeyMinRssi, value);
    prefs.end();
}

void storeHeartbeatFailureLimit(uint32_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUInt(kKeyHbLimit, value);
    prefs.end();
}

void storeAutoReconnect(bool value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putBool(kKeyAutoReconnect, value);
    prefs.end();
}

void storeLastDeviceId(const std::string& value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putString(kKeyLastDevice, value.c_str());
    prefs.end();
}

void clearLinkSettings() {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.clear();
    prefs.end();
}

}  // namespace owlink
#else

namespace owlink {
namespace {
LinkSettings g_settings;
}

bool loadLinkSettings(LinkSettings& out) {
    out = g_settings;
    return g_settings.hasMinRssi || g_settings.hasHeartbeatFailureLimit || g_settings.hasAutoReconnect ||
           g_settings.hasLastDeviceId;
}

void storeMinRssi(int32_t value) {
    g_settings.minRssi = value;
    g_settings.hasMinRssi = true;
}

void storeHeartbeatFailureLimit(uint32_t value) {
    g_settings.heartbeatFailureLimit = value;
    g_settings.hasHeartbeatFailureLimit = true;
}

void storeAutoReconnect(bool value) {
    g_settings.autoReconnect = value;
    g_settings.hasAutoReconnect = true;
}

void storeLastDeviceId(const std::string& value) {
    g_settings.lastDeviceId = value;
    g_settings.hasLastDeviceId = !value.empty();
}

void clearLinkSettings() {
    g_settings = LinkSettings{};
}

}  // namespace owlink

#endif  // ARDUINO
