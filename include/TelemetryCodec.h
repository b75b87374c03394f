#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace owlink {

enum class TelemetryField {
    SerialNumber,
    RideMode,
    BatteryPercent,
    Pitch,
    Roll,
    Yaw,
    TripOdometer,
    Rpm,
    Temperature,
    FirmwareRevision,
    CurrentAmps,
    BatteryVoltage,
    LifetimeOdometer,
    ReadChannel,
    WriteChannel,
    Unknown
};

// Two characteristic id assignments exist across firmware revisions.
enum class CharacteristicLayout { Legacy, Extended };

struct TelemetrySnapshot {
    std::optional<double> batteryPercent;
    std::optional<double> pitch;
    std::optional<double> roll;
    std::optional<double> yaw;
    std::optional<double> rpm;
    std::optional<double> temperature;
    std::optional<double> currentAmps;
    std::optional<double> batteryVoltage;
    std::optional<double> tripOdometerKm;
    std::optional<double> lifetimeOdometerKm;
    std::optional<uint16_t> rideMode;
    std::optional<uint16_t> serialNumber;
    std::optional<uint16_t> firmwareRevision;
    uint64_t timestampMs = 0;
    uint32_t updateCount = 0;

    // Approximate ground speed from wheel RPM.
    double speedMph() const;
    bool isCharging() const;
    bool isRiding() const;
    const char* batteryStatus() const;
    void reset();
};

std::string characteristicUuid(uint16_t shortId);
std::string normalizeUuid(const std::string& uuid);

TelemetryField fieldFor(const std::string& uuid, CharacteristicLayout layout);
std::string uuidFor(TelemetryField field, CharacteristicLayout layout);
const char* toString(TelemetryField field);
const char* toString(CharacteristicLayout layout);

// True for fields that carry sensor values (not the auth channels).
bool isTelemetryField(TelemetryField field);

/**
 * @brief Decode one characteristic payload into its scaled value.
 *
 * Payloads are little-endian. Longer payloads decode from their leading
 * bytes; shorter ones fail.
 *
 * @code
 * double pitch = 0.0;
 * const uint8_t raw[] = {0x2E, 0xFB};   // -1234
 * decodeValue(TelemetryField::Pitch, raw, sizeof(raw), pitch);   // -12.34
 * @endcode
 */
bool decodeValue(TelemetryField field, const uint8_t* data, size_t len, double& out);

// Stores a decoded value into its snapshot slot and stamps the update.
bool applyValue(TelemetrySnapshot& snapshot, TelemetryField field, double value, uint64_t nowMs);

}  // namespace owlink
