#include "AuthOrchestrator.h"

#include "ChallengeResponse.h"
#include "system/Log.h"

#include <algorithm>
#include <cstdio>

namespace owlink {

namespace {

constexpr TelemetryField kWakeSweepFields[] = {
    TelemetryField::SerialNumber,
    TelemetryField::RideMode,
    TelemetryField::BatteryPercent,
    TelemetryField::FirmwareRevision,
    TelemetryField::BatteryVoltage,
};

BoardModel modelFromText(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower.find("gt-s") != std::string::npos || lower.find("gts") != std::string::npos) {
        return BoardModel::GTS;
    }
    if (lower.find("gt") != std::string::npos) {
        return BoardModel::GT;
    }
    if (lower.find("pint") != std::string::npos) {
        return BoardModel::Pint;
    }
    if (lower.find("xr") != std::string::npos) {
        return BoardModel::XR;
    }
    return BoardModel::Unknown;
}

std::string printable(const Bytes& data) {
    std::string out;
    for (uint8_t c : data) {
        if (c >= 32 && c <= 126) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

void fail(AuthResult& result, LinkError error, const std::string& message) {
    result.success = false;
    result.error = error;
    result.message = message;
}

}  // namespace

const char* toString(UnlockStrategy strategy) {
    switch (strategy) {
        case UnlockStrategy::ClassicChallenge: return "ClassicChallenge";
        case UnlockStrategy::DirectUnlock: return "DirectUnlock";
        case UnlockStrategy::AlternateUnlock: return "AlternateUnlock";
        case UnlockStrategy::WakeSweep: return "WakeSweep";
        case UnlockStrategy::ModifiedChallenge: return "ModifiedChallenge";
    }
    return "Unknown";
}

BoardModel deriveModel(const std::string& name, const Bytes& firmware) {
    const BoardModel fromName = modelFromText(name);
    if (fromName != BoardModel::Unknown) {
        return fromName;
    }
    return modelFromText(printable(firmware));
}

UnlockProfile profileFor(BoardModel model) {
    switch (model) {
        case BoardModel::Pint:
        case BoardModel::XR:
            return UnlockProfile::Classic;
        case BoardModel::GT:
            return UnlockProfile::GT;
        case BoardModel::GTS:
            return UnlockProfile::GTS;
        case BoardModel::Unknown:
            return UnlockProfile::Unknown;
    }
    return UnlockProfile::Unknown;
}

std::vector<UnlockStrategy> strategiesFor(UnlockProfile profile) {
    switch (profile) {
        case UnlockProfile::GT:
        case UnlockProfile::GTS:
            return {UnlockStrategy::DirectUnlock, UnlockStrategy::AlternateUnlock, UnlockStrategy::WakeSweep,
                    UnlockStrategy::ModifiedChallenge};
        case UnlockProfile::Classic:
        case UnlockProfile::Unknown:
            return {UnlockStrategy::ClassicChallenge};
    }
    return {UnlockStrategy::ClassicChallenge};
}

AuthOrchestrator::AuthOrchestrator(LinkSession& session, SubscriptionManager& subscriptions,
                                   const LinkConfig& config)
    : session_(session), subscriptions_(subscriptions), config_(config) {}

void AuthOrchestrator::reset() {
    firmwareChar_ = CharacteristicInfo{};
    readChar_ = CharacteristicInfo{};
    writeChar_ = CharacteristicInfo{};
    firmware_.clear();
    attempted_.clear();
}

AuthResult AuthOrchestrator::authenticate(bool newerVariant, uint32_t gen) {
    reset();
    AuthResult result;

    const CharacteristicRegistry& registry = session_.registry();
    if (registry.empty()) {
        fail(result, LinkError::CharacteristicsMissing, "No characteristics discovered");
        return result;
    }

    const CharacteristicInfo* firmwareChar = registry.find(TelemetryField::FirmwareRevision);
    const CharacteristicInfo* readChar = registry.find(TelemetryField::ReadChannel);
    const CharacteristicInfo* writeChar = registry.find(TelemetryField::WriteChannel);
    if (firmwareChar == nullptr || readChar == nullptr || writeChar == nullptr) {
        fail(result, LinkError::CharacteristicsMissing, "Required characteristics not found for authentication");
        return result;
    }
    firmwareChar_ = *firmwareChar;
    readChar_ = *readChar;
    writeChar_ = *writeChar;
    timing_ = newerVariant ? config_.newer : config_.classic;

    if (!readFirmware(firmwareChar_, timing_, gen)) {
        if (!session_.alive(gen)) {
            result.aborted = true;
            return result;
        }
        fail(result, LinkError::FirmwareReadFailure, "Firmware revision could not be read");
        return result;
    }

    const BoardModel model = deriveModel(session_.deviceName(), firmware_);
    const UnlockProfile profile = profileFor(model);
    session_.setModel(model, profile);
    system::logLine("AUTH", "model=%s profile=%s layout=%s", toString(model), toString(profile),
                    toString(registry.layout()));

    const std::vector<UnlockStrategy> strategies = strategiesFor(profile);
    for (UnlockStrategy strategy : strategies) {
        attempted_.push_back(strategy);
        system::logLine("AUTH", "trying %s", toString(strategy));

        AuthResult attempt;
        attempt.strategy = strategy;
        const bool ok = runStrategy(strategy, gen, attempt);
        if (!session_.alive(gen)) {
            result.aborted = true;
            return result;
        }

        char line[64] = {0};
        if (ok) {
            std::snprintf(line, sizeof(line), "%s unlocked", toString(strategy));
            session_.diagnostics().record("strategy", LinkError::None, line, session_.nowMs());
            attempt.success = true;
            return attempt;
        }

        std::snprintf(line, sizeof(line), "%s failed: %s", toString(strategy), attempt.message.c_str());
        session_.diagnostics().record("strategy", attempt.error, line, session_.nowMs());
        result = attempt;
    }

    if (strategies.size() > 1) {
        fail(result, LinkError::AllStrategiesExhausted, "All unlock strategies failed");
    }
    return result;
}

bool AuthOrchestrator::readFirmware(const CharacteristicInfo& info, const LinkTiming& timing, uint32_t gen) {
    for (uint32_t attempt = 0; attempt < timing.firmwareReadAttempts; ++attempt) {
        Bytes value;
        if (session_.transport().read(info.handle, timing.readTimeoutMs, value) && !value.empty()) {
            firmware_ = value;
            system::logLine("AUTH", "firmware read %u bytes", static_cast<unsigned>(firmware_.size()));
            return true;
        }
        system::logLine("AUTH", "firmware read attempt %lu/%lu failed", static_cast<unsigned long>(attempt + 1),
                        static_cast<unsigned long>(timing.firmwareReadAttempts));
        if (attempt + 1 < timing.firmwareReadAttempts &&
            !session_.sleepMs(config_.firmwareRetryBackoffMs * (attempt + 1), gen)) {
            return false;
        }
    }
    return false;
}

bool AuthOrchestrator::runStrategy(UnlockStrategy strategy, uint32_t gen, AuthResult& result) {
    switch (strategy) {
        case UnlockStrategy::ClassicChallenge:
            return challengeFlow(false, gen, result);

        case UnlockStrategy::DirectUnlock:
            subscriptions_.subscribeAll(session_.profile(), gen);
            if (!session_.sleepMs(config_.unlockPauseMs, gen)) {
                return false;
            }
            return commandUnlock(config_.directUnlockCommand, TelemetryField::BatteryPercent, gen, result);

        case UnlockStrategy::AlternateUnlock:
            return commandUnlock(config_.alternateUnlockCommand, TelemetryField::Pitch, gen, result);

        case UnlockStrategy::WakeSweep:
            return wakeSweep(gen, result);

        case UnlockStrategy::ModifiedChallenge:
            return challengeFlow(true, gen, result);
    }
    return false;
}

bool AuthOrchestrator::commandUnlock(const Bytes& command, TelemetryField sentinel, uint32_t gen,
                                     AuthResult& result) {
    if (!session_.transport().write(writeChar_.handle, command)) {
        fail(result, LinkError::WriteFailure, "unlock command write failed");
        return false;
    }
    if (!session_.sleepMs(config_.unlockPauseMs, gen)) {
        return false;
    }
    if (!verifySentinel(sentinel, gen)) {
        fail(result, LinkError::SentinelLocked, std::string(toString(sentinel)) + " sentinel still locked");
        return false;
    }
    return true;
}

bool AuthOrchestrator::wakeSweep(uint32_t gen, AuthResult& result) {
    for (TelemetryField field : kWakeSweepFields) {
        const CharacteristicInfo* info = session_.registry().find(field);
        if (info == nullptr || !info->canRead) {
            continue;
        }
        Bytes ignored;
        if (!session_.transport().read(info->handle, timing_.readTimeoutMs, ignored)) {
            system::traceLine("AUTH", "wake read %s failed", toString(field));
        }
        session_.pump();
        if (!session_.alive(gen)) {
            return false;
        }
    }

    if (!verifySentinel(TelemetryField::BatteryPercent, gen)) {
        fail(result, LinkError::SentinelLocked, "battery sentinel still locked after wake sweep");
        return false;
    }
    return true;
}

bool AuthOrchestrator::challengeFlow(bool modified, uint32_t gen, AuthResult& result) {
    const LinkTiming& timing = modified ? config_.newer : config_.classic;

    const bool subscribedHere = !subscriptions_.isSubscribed(readChar_.handle);
    if (subscribedHere && !subscriptions_.subscribe(readChar_)) {
        fail(result, LinkError::ChallengeTimeout, "read channel subscription failed");
        return false;
    }

    Bytes challenge;
    subscriptions_.setTap(readChar_.handle, [&challenge](const Bytes& payload) {
        challenge.insert(challenge.end(), payload.begin(), payload.end());
        system::traceLine("AUTH", "challenge progress %u bytes", static_cast<unsigned>(challenge.size()));
    });

    const bool collected = collectChallenge(timing, modified, gen, challenge, result);
    subscriptions_.clearTap(readChar_.handle);
    if (!session_.alive(gen)) {
        return false;
    }
    if (subscribedHere) {
        subscriptions_.unsubscribe(readChar_.handle);
    }
    if (!collected) {
        return false;
    }

    if (!hasValidSignature(challenge)) {
        fail(result, LinkError::InvalidChallengeSignature, "Invalid challenge signature");
        return false;
    }

    Bytes response;
    if (!computeResponse(challenge, config_.secretKey, session_.profile(), response)) {
        fail(result, LinkError::ChallengeTimeout,
             "challenge too short (" + std::to_string(challenge.size()) + " bytes)");
        return false;
    }

    if (!session_.transport().write(writeChar_.handle, response)) {
        fail(result, LinkError::WriteFailure, "challenge response write failed");
        return false;
    }
    if (!session_.sleepMs(config_.settleDelayMs, gen)) {
        return false;
    }

    result.challengeFlow = true;
    result.keepaliveIntervalMs = timing.keepaliveIntervalMs;
    system::logLine("AUTH", "challenge answered (%u byte challenge)", static_cast<unsigned>(challenge.size()));
    return true;
}

bool AuthOrchestrator::collectChallenge(const LinkTiming& timing, bool allowRetrigger, uint32_t gen, Bytes& challenge,
                                        AuthResult& result) {
    auto enough = [&challenge, &timing]() { return challenge.size() >= timing.minChallengeBytes; };

    if (!session_.transport().write(firmwareChar_.handle, firmware_)) {
        fail(result, LinkError::WriteFailure, "challenge trigger write failed");
        return false;
    }
    session_.waitUntil(timing.challengeTimeoutMs, gen, enough);
    if (!session_.alive(gen)) {
        return false;
    }

    if (challenge.empty() && allowRetrigger) {
        system::logLine("AUTH", "no challenge yet, sending alternate trigger");
        if (!session_.transport().write(writeChar_.handle, firmware_)) {
            fail(result, LinkError::WriteFailure, "alternate trigger write failed");
            return false;
        }
        session_.waitUntil(timing.challengeTimeoutMs, gen, enough);
        if (!session_.alive(gen)) {
            return false;
        }
    }

    if (challenge.empty()) {
        fail(result, LinkError::ChallengeTimeout, "Challenge timeout - no response from device");
        return false;
    }
    if (!enough()) {
        system::logLine("AUTH", "proceeding with partial challenge (%u bytes)",
                        static_cast<unsigned>(challenge.size()));
    }
    return true;
}

bool AuthOrchestrator::verifySentinel(TelemetryField field, uint32_t gen) {
    const CharacteristicInfo* info = session_.registry().find(field);
    if (info == nullptr) {
        return false;
    }

    Bytes value;
    const bool ok = session_.transport().read(info->handle, timing_.readTimeoutMs, value);
    if (!session_.alive(gen) || !ok) {
        return false;
    }
    if (std::all_of(value.begin(), value.end(), [](uint8_t b) { return b == 0; })) {
        return false;
    }

    double decoded = 0.0;
    if (!decodeValue(field, value.data(), value.size(), decoded)) {
        return false;
    }
    if (field == TelemetryField::BatteryPercent && decoded > 100.0) {
        return false;
    }

    if (applyValue(session_.snapshot(), field, decoded, session_.nowMs())) {
        session_.events().publishTelemetry(session_.snapshot(), field);
    }
    return true;
}

}  // namespace owlink
