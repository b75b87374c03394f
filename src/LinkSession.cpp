#include "LinkSession.h"

#include "system/Log.h"

#include <algorithm>

namespace owlink {

LinkSession::LinkSession(BleTransport& transport, Clock& clock, system::TaskScheduler& scheduler,
                         EventChannel& events, uint32_t pollStepMs)
    : transport_(transport),
      clock_(clock),
      scheduler_(scheduler),
      events_(events),
      pollStepMs_(pollStepMs > 0 ? pollStepMs : 1) {}

bool LinkSession::isAllowed(ConnectionState from, ConnectionState to) {
    if (to == ConnectionState::Disconnected) {
        return true;
    }
    switch (from) {
        case ConnectionState::Disconnected:
            return to == ConnectionState::Scanning || to == ConnectionState::Connecting;
        case ConnectionState::Scanning:
            return to == ConnectionState::Connecting || to == ConnectionState::Error;
        case ConnectionState::Connecting:
            return to == ConnectionState::Connected || to == ConnectionState::Error;
        case ConnectionState::Connected:
            return to == ConnectionState::Authenticating || to == ConnectionState::Error;
        case ConnectionState::Authenticating:
            return to == ConnectionState::Authenticated || to == ConnectionState::Error;
        case ConnectionState::Authenticated:
            return to == ConnectionState::Error;
        case ConnectionState::Error:
            return false;
    }
    return false;
}

bool LinkSession::transition(ConnectionState next, LinkError error, const std::string& message) {
    if (next == state_) {
        return true;
    }
    if (!isAllowed(state_, next)) {
        system::logLine("LINK", "rejected transition %s -> %s", toString(state_), toString(next));
        return false;
    }

    if (next == ConnectionState::Error) {
        recordError(error, message);
    }

    StateChange change;
    change.previous = state_;
    change.current = next;
    change.error = (next == ConnectionState::Error || next == ConnectionState::Disconnected) ? lastError_ : LinkError::None;
    change.message = (next == ConnectionState::Error) ? message : std::string();
    change.timestampMs = clock_.nowMs();

    state_ = next;
    system::logLine("LINK", "state %s -> %s", toString(change.previous), toString(change.current));
    events_.publishState(change);
    return true;
}

void LinkSession::pump() {
    transport_.poll();
    scheduler_.service(clock_.nowMs());
}

bool LinkSession::sleepMs(uint32_t ms, uint32_t gen) {
    const uint64_t until = clock_.nowMs() + ms;
    while (true) {
        pump();
        if (!alive(gen)) {
            return false;
        }
        const uint64_t now = clock_.nowMs();
        if (now >= until) {
            return true;
        }
        clock_.delayMs(static_cast<uint32_t>(std::min<uint64_t>(pollStepMs_, until - now)));
    }
}

bool LinkSession::waitUntil(uint32_t timeoutMs, uint32_t gen, const std::function<bool()>& done) {
    const uint64_t start = clock_.nowMs();
    while (true) {
        pump();
        if (!alive(gen)) {
            return false;
        }
        if (done()) {
            return true;
        }
        if (clock_.nowMs() - start >= timeoutMs) {
            return false;
        }
        clock_.delayMs(pollStepMs_);
    }
}

void LinkSession::recordError(LinkError error, const std::string& message) {
    lastError_ = error;
    lastErrorMessage_ = message;
    diagnostics_.record("error", error, message.c_str(), clock_.nowMs());
}

void LinkSession::clearError() {
    lastError_ = LinkError::None;
    lastErrorMessage_.clear();
}

void LinkSession::setDevice(const std::string& id, const std::string& name) {
    deviceId_ = id;
    deviceName_ = name;
}

void LinkSession::setModel(BoardModel model, UnlockProfile profile) {
    model_ = model;
    profile_ = profile;
}

void LinkSession::resetConnectionData() {
    registry_.clear();
    snapshot_.reset();
    deviceId_.clear();
    deviceName_.clear();
    model_ = BoardModel::Unknown;
    profile_ = UnlockProfile::Unknown;
}

}  // namespace owlink
