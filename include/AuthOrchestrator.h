#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "BoardTypes.h"
#include "CharacteristicRegistry.h"
#include "LinkConfig.h"
#include "LinkSession.h"
#include "SubscriptionManager.h"

namespace owlink {

enum class UnlockStrategy { ClassicChallenge, DirectUnlock, AlternateUnlock, WakeSweep, ModifiedChallenge };

const char* toString(UnlockStrategy strategy);

BoardModel deriveModel(const std::string& name, const Bytes& firmware);
UnlockProfile profileFor(BoardModel model);

// Ordered unlock strategies for a profile. Later entries run only after the
// earlier ones have failed.
std::vector<UnlockStrategy> strategiesFor(UnlockProfile profile);

struct AuthResult {
    bool success = false;
    // The attempt was torn down while authenticating; nothing to report.
    bool aborted = false;
    LinkError error = LinkError::None;
    std::string message;
    UnlockStrategy strategy = UnlockStrategy::ClassicChallenge;
    // Set when a challenge flow unlocked the board; keepalive should run.
    bool challengeFlow = false;
    uint32_t keepaliveIntervalMs = 0;
};

class AuthOrchestrator {
public:
    AuthOrchestrator(LinkSession& session, SubscriptionManager& subscriptions, const LinkConfig& config);

    /**
     * @brief Run the unlock sequence for the connected board.
     *
     * Reads the firmware revision, derives the board model and walks the
     * profile's strategy list strictly in order. Each attempt is recorded in
     * the session diagnostics.
     *
     * @param newerVariant  Board was flagged as a newer model at connect time;
     *                      selects the longer firmware-read budget.
     * @param gen           Attempt generation the caller runs under.
     */
    AuthResult authenticate(bool newerVariant, uint32_t gen);

    const Bytes& firmware() const { return firmware_; }
    const std::vector<UnlockStrategy>& attempted() const { return attempted_; }
    void reset();

private:
    bool readFirmware(const CharacteristicInfo& info, const LinkTiming& timing, uint32_t gen);
    bool runStrategy(UnlockStrategy strategy, uint32_t gen, AuthResult& result);
    bool commandUnlock(const Bytes& command, TelemetryField sentinel, uint32_t gen, AuthResult& result);
    bool wakeSweep(uint32_t gen, AuthResult& result);
    bool challengeFlow(bool modified, uint32_t gen, AuthResult& result);
    bool collectChallenge(const LinkTiming& timing, bool allowRetrigger, uint32_t gen, Bytes& challenge,
                          AuthResult& result);
    bool verifySentinel(TelemetryField field, uint32_t gen);

    LinkSession& session_;
    SubscriptionManager& subscriptions_;
    const LinkConfig& config_;

    CharacteristicInfo firmwareChar_;
    CharacteristicInfo readChar_;
    CharacteristicInfo writeChar_;
    LinkTiming timing_;
    Bytes firmware_;
    std::vector<UnlockStrategy> attempted_;
};

}  // namespace owlink
