#include "TelemetryCodec.h"

#include "BoardTypes.h"
#include "Config.h"

#include <cmath>
#include <cstdio>

namespace owlink {

namespace {

constexpr double kMphPerRpm = 0.01667;

struct FieldIds {
    TelemetryField field;
    uint16_t legacy;
    uint16_t extended;
};

constexpr FieldIds kFieldIds[] = {
    {TelemetryField::SerialNumber, 0xf301, 0xf301},
    {TelemetryField::RideMode, 0xf302, 0xf302},
    {TelemetryField::BatteryPercent, 0xf303, 0xf303},
    {TelemetryField::Pitch, 0xf304, 0xf307},
    {TelemetryField::Roll, 0xf305, 0xf308},
    {TelemetryField::Yaw, 0xf306, 0xf309},
    {TelemetryField::TripOdometer, 0xf307, 0xf30a},
    {TelemetryField::Rpm, 0xf308, 0xf30b},
    {TelemetryField::Temperature, 0xf309, 0xf310},
    {TelemetryField::FirmwareRevision, 0xf30a, 0xf311},
    {TelemetryField::CurrentAmps, 0xf30b, 0xf312},
    {TelemetryField::BatteryVoltage, 0xf30c, 0xf316},
    {TelemetryField::LifetimeOdometer, 0xf30d, 0xf319},
    {TelemetryField::ReadChannel, 0xf30e, 0xf3fe},
    {TelemetryField::WriteChannel, 0xf30f, 0xf3ff},
};

uint16_t readU16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8);
}

int16_t readI16(const uint8_t* data) {
    return static_cast<int16_t>(readU16(data));
}

uint32_t readU32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

}  // namespace

double TelemetrySnapshot::speedMph() const {
    if (!rpm.has_value()) {
        return 0.0;
    }
    return std::fabs(rpm.value() * kMphPerRpm);
}

bool TelemetrySnapshot::isCharging() const {
    return currentAmps.has_value() && currentAmps.value() < 0.0;
}

bool TelemetrySnapshot::isRiding() const {
    return speedMph() > 0.1;
}

const char* TelemetrySnapshot::batteryStatus() const {
    const double battery = batteryPercent.value_or(0.0);
    if (battery > 80.0) return "Full";
    if (battery > 60.0) return "Good";
    if (battery > 40.0) return "Medium";
    if (battery > 20.0) return "Low";
    return "Critical";
}

void TelemetrySnapshot::reset() {
    *this = TelemetrySnapshot{};
}

std::string characteristicUuid(uint16_t shortId) {
    char buffer[8] = {0};
    std::snprintf(buffer, sizeof(buffer), "%03x", static_cast<unsigned>(shortId & 0x0FFF));
    return std::string(BOARD_UUID_PREFIX) + buffer + BOARD_UUID_SUFFIX;
}

std::string normalizeUuid(const std::string& uuid) {
    return toLower(uuid);
}

TelemetryField fieldFor(const std::string& uuid, CharacteristicLayout layout) {
    const std::string key = normalizeUuid(uuid);
    for (const auto& ids : kFieldIds) {
        const uint16_t shortId = (layout == CharacteristicLayout::Legacy) ? ids.legacy : ids.extended;
        if (characteristicUuid(shortId) == key) {
            return ids.field;
        }
    }
    return TelemetryField::Unknown;
}

std::string uuidFor(TelemetryField field, CharacteristicLayout layout) {
    for (const auto& ids : kFieldIds) {
        if (ids.field == field) {
            return characteristicUuid(layout == CharacteristicLayout::Legacy ? ids.legacy : ids.extended);
        }
    }
    return std::string();
}

const char* toString(TelemetryField field) {
    switch (field) {
        case TelemetryField::SerialNumber: return "serial";
        case TelemetryField::RideMode: return "rideMode";
        case TelemetryField::BatteryPercent: return "battery";
        case TelemetryField::Pitch: return "pitch";
        case TelemetryField::Roll: return "roll";
        case TelemetryField::Yaw: return "yaw";
        case TelemetryField::TripOdometer: return "trip";
        case TelemetryField::Rpm: return "rpm";
        case TelemetryField::Temperature: return "temperature";
        case TelemetryField::FirmwareRevision: return "firmware";
        case TelemetryField::CurrentAmps: return "current";
        case TelemetryField::BatteryVoltage: return "voltage";
        case TelemetryField::LifetimeOdometer: return "lifetime";
        case TelemetryField::ReadChannel: return "read";
        case TelemetryField::WriteChannel: return "write";
        case TelemetryField::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(CharacteristicLayout layout) {
    return layout == CharacteristicLayout::Legacy ? "legacy" : "extended";
}

bool isTelemetryField(TelemetryField field) {
    return field != TelemetryField::ReadChannel &&
           field != TelemetryField::WriteChannel &&
           field != TelemetryField::Unknown;
}

bool decodeValue(TelemetryField field, const uint8_t* data, size_t len, double& out) {
    if (data == nullptr || len == 0) {
        return false;
    }

    switch (field) {
        case TelemetryField::BatteryPercent:
            out = static_cast<double>(data[0]);
            return true;

        case TelemetryField::Pitch:
        case TelemetryField::Roll:
        case TelemetryField::Yaw:
        case TelemetryField::Temperature:
        case TelemetryField::CurrentAmps:
        case TelemetryField::BatteryVoltage:
            if (len < 2) {
                return false;
            }
            out = static_cast<double>(readI16(data)) / 100.0;
            return true;

        case TelemetryField::RideMode:
            out = (len < 2) ? static_cast<double>(data[0]) : static_cast<double>(readU16(data));
            return true;

        case TelemetryField::Rpm:
        case TelemetryField::SerialNumber:
        case TelemetryField::FirmwareRevision:
            if (len < 2) {
                return false;
            }
            out = static_cast<double>(readU16(data));
            return true;

        case TelemetryField::TripOdometer:
        case TelemetryField::LifetimeOdometer:
            if (len < 4) {
                return false;
            }
            out = static_cast<double>(readU32(data)) / 1000.0;
            return true;

        case TelemetryField::ReadChannel:
        case TelemetryField::WriteChannel:
        case TelemetryField::Unknown:
            return false;
    }
    return false;
}

bool applyValue(TelemetrySnapshot& snapshot, TelemetryField field, double value, uint64_t nowMs) {
    switch (field) {
        case TelemetryField::BatteryPercent: snapshot.batteryPercent = value; break;
        case TelemetryField::Pitch: snapshot.pitch = value; break;
        case TelemetryField::Roll: snapshot.roll = value; break;
        case TelemetryField::Yaw: snapshot.yaw = value; break;
        case TelemetryField::Rpm: snapshot.rpm = value; break;
        case TelemetryField::Temperature: snapshot.temperature = value; break;
        case TelemetryField::CurrentAmps: snapshot.currentAmps = value; break;
        case TelemetryField::BatteryVoltage: snapshot.batteryVoltage = value; break;
        case TelemetryField::TripOdometer: snapshot.tripOdometerKm = value; break;
        case TelemetryField::LifetimeOdometer: snapshot.lifetimeOdometerKm = value; break;
        case TelemetryField::RideMode: snapshot.rideMode = static_cast<uint16_t>(value); break;
        case TelemetryField::SerialNumber: snapshot.serialNumber = static_cast<uint16_t>(value); break;
        case TelemetryField::FirmwareRevision: snapshot.firmwareRevision = static_cast<uint16_t>(value); break;
        case TelemetryField::ReadChannel:
        case TelemetryField::WriteChannel:
        case TelemetryField::Unknown:
            return false;
    }
    snapshot.timestampMs = nowMs;
    ++snapshot.updateCount;
    return true;
}

}  // namespace owlink
