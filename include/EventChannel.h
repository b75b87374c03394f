#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "BoardTypes.h"
#include "TelemetryCodec.h"

namespace owlink {

struct StateChange {
    ConnectionState previous = ConnectionState::Disconnected;
    ConnectionState current = ConnectionState::Disconnected;
    LinkError error = LinkError::None;
    std::string message;
    uint64_t timestampMs = 0;
};

class EventChannel {
public:
    using StateListener = std::function<void(const StateChange&)>;
    using TelemetryListener = std::function<void(const TelemetrySnapshot&, TelemetryField)>;
    using CandidateListener = std::function<void(const std::vector<DeviceCandidate>&)>;

    void onState(StateListener listener) { stateListeners_.push_back(std::move(listener)); }
    void onTelemetry(TelemetryListener listener) { telemetryListeners_.push_back(std::move(listener)); }
    void onCandidates(CandidateListener listener) { candidateListeners_.push_back(std::move(listener)); }

    void publishState(const StateChange& change) const {
        for (const auto& listener : stateListeners_) {
            listener(change);
        }
    }

    void publishTelemetry(const TelemetrySnapshot& snapshot, TelemetryField field) const {
        for (const auto& listener : telemetryListeners_) {
            listener(snapshot, field);
        }
    }

    void publishCandidates(const std::vector<DeviceCandidate>& candidates) const {
        for (const auto& listener : candidateListeners_) {
            listener(candidates);
        }
    }

    void clear() {
        stateListeners_.clear();
        telemetryListeners_.clear();
        candidateListeners_.clear();
    }

private:
    std::vector<StateListener> stateListeners_;
    std::vector<TelemetryListener> telemetryListeners_;
    std::vector<CandidateListener> candidateListeners_;
};

}  // namespace owlink
