#include "SubscriptionManager.h"

#include "system/Log.h"

#include <utility>
#include <vector>

namespace owlink {

namespace {

constexpr TelemetryField kPriorityFields[] = {
    TelemetryField::BatteryPercent,
    TelemetryField::Pitch,
    TelemetryField::Roll,
    TelemetryField::BatteryVoltage,
    TelemetryField::Rpm,
    TelemetryField::ReadChannel,
};

bool isNewerProfile(UnlockProfile profile) {
    return profile == UnlockProfile::GT || profile == UnlockProfile::GTS;
}

}  // namespace

SubscriptionManager::SubscriptionManager(LinkSession& session, const LinkConfig& config)
    : session_(session), config_(config) {}

bool SubscriptionManager::subscribe(const CharacteristicInfo& info) {
    if (!info.canNotify) {
        return false;
    }
    if (isSubscribed(info.handle)) {
        return true;
    }

    const bool ok = session_.transport().subscribe(info.handle, [this](CharHandle handle, const Bytes& payload) {
        handleNotification(handle, payload);
    });
    if (!ok) {
        system::logLine("SUBS", "subscribe failed uuid=%s", info.uuid.c_str());
        return false;
    }
    active_.insert(info.handle);
    system::traceLine("SUBS", "subscribed uuid=%s", info.uuid.c_str());
    return true;
}

size_t SubscriptionManager::subscribeAll(UnlockProfile profile, uint32_t gen) {
    const CharacteristicRegistry& registry = session_.registry();

    if (isNewerProfile(profile)) {
        for (TelemetryField field : kPriorityFields) {
            const CharacteristicInfo* info = registry.find(field);
            if (info == nullptr || !info->canNotify || isSubscribed(info->handle)) {
                continue;
            }
            subscribe(*info);
            if (!session_.sleepMs(config_.subscriptionSpacingMs, gen)) {
                return active_.size();
            }
        }
    }

    for (const auto& info : registry.notifiable()) {
        if (!session_.alive(gen)) {
            break;
        }
        if (!isSubscribed(info.handle)) {
            subscribe(info);
        }
    }

    system::logLine("SUBS", "%u subscriptions active", static_cast<unsigned>(active_.size()));
    return active_.size();
}

bool SubscriptionManager::unsubscribe(CharHandle handle) {
    if (!isSubscribed(handle)) {
        return false;
    }
    active_.erase(handle);
    if (!session_.transport().unsubscribe(handle)) {
        system::logLine("SUBS", "unsubscribe failed handle=%u", static_cast<unsigned>(handle));
        return false;
    }
    return true;
}

void SubscriptionManager::unsubscribeAll() {
    const std::vector<CharHandle> handles(active_.begin(), active_.end());
    for (CharHandle handle : handles) {
        unsubscribe(handle);
    }
    active_.clear();
    taps_.clear();
}

void SubscriptionManager::handleNotification(CharHandle handle, const Bytes& payload) {
    auto tap = taps_.find(handle);
    if (tap != taps_.end()) {
        Tap callback = tap->second;
        callback(payload);
    }

    const TelemetryField field = session_.registry().fieldOf(handle);
    if (!isTelemetryField(field)) {
        return;
    }

    const ConnectionState state = session_.state();
    if (state != ConnectionState::Authenticating && state != ConnectionState::Authenticated) {
        system::traceLine("SUBS", "dropped %s in state %s", toString(field), toString(state));
        return;
    }

    double value = 0.0;
    if (!decodeValue(field, payload.data(), payload.size(), value)) {
        session_.noteDecodeFailure();
        system::traceLine("SUBS", "decode failed field=%s len=%u", toString(field),
                          static_cast<unsigned>(payload.size()));
        return;
    }

    TelemetrySnapshot& snapshot = session_.snapshot();
    if (applyValue(snapshot, field, value, session_.nowMs())) {
        system::traceLine("SUBS", "%s=%.2f", toString(field), value);
        session_.events().publishTelemetry(snapshot, field);
    }
}

}  // namespace owlink
