#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <utility>

#include "BoardTypes.h"
#include "CharacteristicRegistry.h"
#include "LinkConfig.h"
#include "LinkSession.h"

namespace owlink {

/**
 * @brief Owns notification subscriptions and routes their payloads.
 *
 * Telemetry payloads are decoded into the session snapshot while the link is
 * Authenticating or Authenticated and dropped otherwise. The read and write
 * channels are never decoded; an optional tap per handle sees their raw
 * payloads (the challenge collector uses this).
 */
class SubscriptionManager {
public:
    using Tap = std::function<void(const Bytes&)>;

    SubscriptionManager(LinkSession& session, const LinkConfig& config);

    // Subscribes every notify-capable characteristic not yet subscribed.
    // Newer boards get the priority subset first, spaced apart.
    size_t subscribeAll(UnlockProfile profile, uint32_t gen);
    bool subscribe(const CharacteristicInfo& info);
    bool unsubscribe(CharHandle handle);
    void unsubscribeAll();

    bool isSubscribed(CharHandle handle) const { return active_.count(handle) > 0; }
    size_t activeCount() const { return active_.size(); }

    void setTap(CharHandle handle, Tap tap) { taps_[handle] = std::move(tap); }
    void clearTap(CharHandle handle) { taps_.erase(handle); }

    void handleNotification(CharHandle handle, const Bytes& payload);

private:
    LinkSession& session_;
    const LinkConfig& config_;
    std::set<CharHandle> active_;
    std::map<CharHandle, Tap> taps_;
};

}  // namespace owlink
