#include <unity.h>

#include "BoardLink.h"
#include "ChallengeResponse.h"
#include "Config.h"
#include "FakeTransport.h"
#include "LinkSession.h"
#include "PersistentConfig.h"

#include <memory>
#include <string>
#include <vector>

extern "C" void setUp(void) {
    owlink::clearLinkSettings();
}
extern "C" void tearDown(void) {}

using owlink::Advertisement;
using owlink::BoardLink;
using owlink::Bytes;
using owlink::CharHandle;
using owlink::ConnectionState;
using owlink::LinkError;
using owlink::StateChange;
using owlink::test::FakeClock;
using owlink::test::FakeTransport;

namespace {

constexpr const char* kPintId = "00:13:43:0A:0B:0C";

Advertisement advert(const std::string& id, const std::string& name, int rssi) {
    Advertisement a;
    a.id = id;
    a.name = name;
    a.rssi = rssi;
    a.address = id;
    a.serviceIds.push_back(BOARD_SERVICE_UUID);
    return a;
}

constexpr const char* kGtId = "00:13:43:0D:0E:0F";

owlink::DeviceCandidate gt() {
    owlink::DeviceCandidate candidate;
    candidate.id = kGtId;
    candidate.name = "OneWheel GT";
    candidate.rssi = -58;
    return candidate;
}

owlink::DeviceCandidate pint() {
    owlink::DeviceCandidate candidate;
    candidate.id = kPintId;
    candidate.name = "Pint";
    candidate.rssi = -55;
    return candidate;
}

Bytes le16(int16_t value) {
    return {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF)};
}

// Classic Pint that answers every firmware write with a 20-byte challenge.
struct PintRig {
    FakeClock clock;
    FakeTransport transport{clock};
    owlink::LinkConfig config;
    std::unique_ptr<BoardLink> link;
    std::vector<StateChange> states;
    Bytes challenge = owlink::test::makeChallenge(20, 0x31);
    bool answerChallenge = true;

    PintRig() {
        owlink::test::addLegacyBoard(transport);
        transport.readValues[firmware()] = {0x3A, 0x10};
        transport.onWrite = [this](CharHandle handle, const Bytes&) {
            if (handle == firmware() && answerChallenge) {
                transport.notify(readChannel(), challenge);
            }
        };
    }

    CharHandle firmware() const { return transport.handleFor(0xf30a); }
    CharHandle battery() const { return transport.handleFor(0xf303); }
    CharHandle pitch() const { return transport.handleFor(0xf304); }
    CharHandle readChannel() const { return transport.handleFor(0xf30e); }
    CharHandle writeChannel() const { return transport.handleFor(0xf30f); }

    BoardLink& build() {
        link = std::make_unique<BoardLink>(config, transport, clock);
        link->events().onState([this](const StateChange& change) { states.push_back(change); });
        return *link;
    }

    void advance(uint32_t ms) {
        clock.advance(ms);
        link->service();
    }

    size_t count(ConnectionState state) const {
        size_t n = 0;
        for (const auto& change : states) {
            if (change.current == state) {
                ++n;
            }
        }
        return n;
    }
};

}  // namespace

static void test_scan_filters_and_completes() {
    PintRig rig;
    BoardLink& link = rig.build();
    size_t published = 0;
    link.events().onCandidates([&published](const std::vector<owlink::DeviceCandidate>&) { ++published; });

    TEST_ASSERT_TRUE(link.startScan());
    TEST_ASSERT_EQUAL(ConnectionState::Scanning, link.state());
    TEST_ASSERT_FALSE(link.startScan());

    rig.transport.emitScan({advert(kPintId, "Pint", -55), advert("11:22:33:44:55:66", "Keyboard", -40),
                            advert("00:13:43:99:99:99", "XR", -90)});
    link.service();
    TEST_ASSERT_EQUAL_UINT(1, link.candidates().size());
    TEST_ASSERT_EQUAL_STRING(kPintId, link.candidates()[0].id.c_str());
    TEST_ASSERT_EQUAL_UINT(1, published);

    rig.transport.completeScan();
    link.service();
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL_UINT(1, link.candidates().size());
}

static void test_scan_start_failure() {
    PintRig rig;
    rig.transport.scanStartFails = true;
    BoardLink& link = rig.build();

    TEST_ASSERT_FALSE(link.startScan());
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL(LinkError::ScanFailure, link.lastError());
    TEST_ASSERT_EQUAL_UINT(1, rig.count(ConnectionState::Error));
}

static void test_pint_connects_end_to_end() {
    PintRig rig;
    BoardLink& link = rig.build();

    link.startScan();
    rig.transport.emitScan({advert(kPintId, "Pint", -55)});
    link.service();
    TEST_ASSERT_EQUAL_UINT(1, link.candidates().size());

    const uint64_t start = rig.clock.now;
    TEST_ASSERT_TRUE(link.connect(link.candidates()[0]));
    TEST_ASSERT_TRUE(rig.clock.now - start < 45000);
    TEST_ASSERT_FALSE(rig.transport.scanning);

    const ConnectionState expected[] = {ConnectionState::Scanning, ConnectionState::Connecting,
                                        ConnectionState::Connected, ConnectionState::Authenticating,
                                        ConnectionState::Authenticated};
    TEST_ASSERT_EQUAL_UINT(5, rig.states.size());
    for (size_t i = 0; i < rig.states.size(); ++i) {
        TEST_ASSERT_EQUAL(expected[i], rig.states[i].current);
    }

    Bytes response;
    TEST_ASSERT_TRUE(
        owlink::computeResponse(rig.challenge, defaultSecretKey(), owlink::UnlockProfile::Classic, response));
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.writesTo(rig.writeChannel()));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(response.data(), rig.transport.lastWriteTo(rig.writeChannel())->data(),
                                 response.size());

    const owlink::DiagnosticSnapshot diag = link.diagnostics();
    TEST_ASSERT_EQUAL(owlink::BoardModel::Pint, diag.model);
    TEST_ASSERT_EQUAL(owlink::CharacteristicLayout::Legacy, diag.layout);
    TEST_ASSERT_EQUAL_UINT(12, diag.characteristicCount);
    TEST_ASSERT_EQUAL_UINT(10, diag.subscriptionCount);
    TEST_ASSERT_EQUAL_UINT(10, rig.transport.subscriptionCount());
    TEST_ASSERT_TRUE(diag.watchdogActive);
    TEST_ASSERT_TRUE(diag.heartbeatActive);
    TEST_ASSERT_TRUE(diag.keepaliveActive);
    TEST_ASSERT_EQUAL_STRING(kPintId, link.rememberedDeviceId().c_str());
}

static void test_connect_retries_with_backoff() {
    PintRig rig;
    rig.transport.connectFailures = 2;
    BoardLink& link = rig.build();

    const uint64_t start = rig.clock.now;
    TEST_ASSERT_TRUE(link.connect(pint()));
    TEST_ASSERT_EQUAL_UINT32(3, rig.transport.connectCalls);
    TEST_ASSERT_TRUE(rig.clock.now - start >= 1500);
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, link.state());
}

static void test_connect_gives_up() {
    PintRig rig;
    rig.transport.connectFailures = 3;
    BoardLink& link = rig.build();

    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL_UINT32(3, rig.transport.connectCalls);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL(LinkError::ConnectFailure, link.lastError());
    TEST_ASSERT_EQUAL_STRING("Connection failed after 3 attempts", link.lastErrorMessage().c_str());
    TEST_ASSERT_EQUAL_UINT(1, rig.count(ConnectionState::Error));
    TEST_ASSERT_EQUAL_UINT(0, rig.count(ConnectionState::Connected));
}

static void test_newer_board_connect_budget() {
    FakeClock clock;
    FakeTransport transport(clock);
    owlink::test::addExtendedBoard(transport);
    transport.readValues[transport.handleFor(0xf311)] = {0x9A, 0x10};
    transport.readValues[transport.handleFor(0xf303)] = {0x55};
    transport.connectFailures = 4;
    owlink::LinkConfig config;
    BoardLink link(config, transport, clock);

    const uint64_t start = clock.now;
    TEST_ASSERT_TRUE(link.connect(gt()));
    TEST_ASSERT_EQUAL_UINT32(NEWER_CONNECT_ATTEMPTS, transport.connectCalls);
    TEST_ASSERT_EQUAL_UINT32(NEWER_CONNECT_TIMEOUT_MS, transport.lastConnectTimeoutMs);
    // Linear backoff: 800, 1600, 2400, 3200.
    TEST_ASSERT_TRUE(clock.now - start >= 8000);
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, link.state());
    TEST_ASSERT_EQUAL(owlink::BoardModel::GT, link.diagnostics().model);
}

static void test_newer_board_gives_up_after_five_attempts() {
    FakeClock clock;
    FakeTransport transport(clock);
    owlink::test::addExtendedBoard(transport);
    transport.connectFailures = NEWER_CONNECT_ATTEMPTS;
    owlink::LinkConfig config;
    BoardLink link(config, transport, clock);

    TEST_ASSERT_FALSE(link.connect(gt()));
    TEST_ASSERT_EQUAL_UINT32(NEWER_CONNECT_ATTEMPTS, transport.connectCalls);
    TEST_ASSERT_EQUAL_STRING("Connection failed after 5 attempts", link.lastErrorMessage().c_str());
}

static void test_newer_board_watchdog_grace() {
    FakeClock clock;
    FakeTransport transport(clock);
    owlink::test::addExtendedBoard(transport);
    transport.readLatencyMs = 1000;
    // Link drops right after discovery, so every firmware read fails.
    transport.onDiscover = [&transport]() { transport.dropLink(); };
    owlink::LinkConfig config;
    BoardLink link(config, transport, clock);

    uint64_t connectedAt = 0;
    uint64_t errorAt = 0;
    link.events().onState([&](const StateChange& change) {
        if (change.current == ConnectionState::Connected) {
            connectedAt = change.timestampMs;
        } else if (change.current == ConnectionState::Error) {
            errorAt = change.timestampMs;
        }
    });

    TEST_ASSERT_FALSE(link.connect(gt()));
    TEST_ASSERT_EQUAL(LinkError::WatchdogDisconnect, link.lastError());
    TEST_ASSERT_TRUE(errorAt - connectedAt >= NEWER_WATCHDOG_GRACE_MS);
    TEST_ASSERT_TRUE(errorAt - connectedAt < NEWER_WATCHDOG_GRACE_MS + 1000);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
}

static void test_disconnect_from_connected_listener() {
    PintRig rig;
    BoardLink& link = rig.build();
    link.events().onState([&link](const StateChange& change) {
        if (change.current == ConnectionState::Connected) {
            link.disconnect();
        }
    });

    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL(LinkError::None, link.lastError());
    TEST_ASSERT_FALSE(link.liveness().watchdogActive());
    TEST_ASSERT_EQUAL_UINT(0, rig.transport.reads.size());

    rig.advance(CLASSIC_WATCHDOG_GRACE_MS + WATCHDOG_INTERVAL_MS);
    TEST_ASSERT_EQUAL(LinkError::None, link.lastError());
    TEST_ASSERT_EQUAL_UINT(0, link.diagnosticLog().count("error"));
}

static void test_disconnect_from_authenticated_listener() {
    PintRig rig;
    BoardLink& link = rig.build();
    link.events().onState([&link](const StateChange& change) {
        if (change.current == ConnectionState::Authenticated) {
            link.disconnect();
        }
    });

    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_TRUE(link.rememberedDeviceId().empty());
    TEST_ASSERT_FALSE(link.liveness().heartbeatActive());
    TEST_ASSERT_FALSE(link.liveness().keepaliveActive());
}

static void test_transition_table_is_forward_only() {
    using owlink::LinkSession;
    const ConnectionState order[] = {ConnectionState::Disconnected, ConnectionState::Scanning,
                                     ConnectionState::Connecting,   ConnectionState::Connected,
                                     ConnectionState::Authenticating, ConnectionState::Authenticated};
    for (size_t from = 0; from < 6; ++from) {
        for (size_t to = 1; to < 6; ++to) {
            if (LinkSession::isAllowed(order[from], order[to])) {
                TEST_ASSERT_TRUE(to > from);
            }
        }
        TEST_ASSERT_TRUE(LinkSession::isAllowed(order[from], ConnectionState::Disconnected));
    }
    TEST_ASSERT_FALSE(LinkSession::isAllowed(ConnectionState::Error, ConnectionState::Scanning));
    TEST_ASSERT_TRUE(LinkSession::isAllowed(ConnectionState::Error, ConnectionState::Disconnected));

    FakeClock clock;
    FakeTransport transport(clock);
    owlink::system::TaskScheduler scheduler;
    owlink::EventChannel events;
    LinkSession session(transport, clock, scheduler, events, POLL_STEP_MS);
    size_t published = 0;
    events.onState([&published](const StateChange&) { ++published; });

    TEST_ASSERT_TRUE(session.transition(ConnectionState::Connecting));
    TEST_ASSERT_TRUE(session.transition(ConnectionState::Connected));
    TEST_ASSERT_TRUE(session.transition(ConnectionState::Authenticating));
    TEST_ASSERT_TRUE(session.transition(ConnectionState::Authenticated));
    TEST_ASSERT_FALSE(session.transition(ConnectionState::Connecting));
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, session.state());
    TEST_ASSERT_EQUAL_UINT(4, published);
}

static void test_service_not_found() {
    PintRig rig;
    rig.transport.serviceAvailable = false;
    BoardLink& link = rig.build();

    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(LinkError::ServiceNotFound, link.lastError());
    TEST_ASSERT_FALSE(link.liveness().watchdogActive());
    TEST_ASSERT_FALSE(rig.transport.connected);
}

static void test_invalid_challenge_signature() {
    PintRig rig;
    rig.challenge[0] = 'A';
    BoardLink& link = rig.build();

    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(LinkError::InvalidChallengeSignature, link.lastError());
    TEST_ASSERT_EQUAL_UINT(1, link.diagnosticLog().count("strategy"));
    TEST_ASSERT_EQUAL_UINT(0, rig.transport.writesTo(rig.writeChannel()));
}

static void test_challenge_timeout() {
    PintRig rig;
    rig.answerChallenge = false;
    BoardLink& link = rig.build();

    const uint64_t start = rig.clock.now;
    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(LinkError::ChallengeTimeout, link.lastError());
    TEST_ASSERT_TRUE(rig.clock.now - start >= CLASSIC_CHALLENGE_TIMEOUT_MS);
}

static void test_second_connect_ignored() {
    PintRig rig;
    BoardLink& link = rig.build();
    bool nested = true;
    rig.transport.onConnect = [&](const std::string&) { nested = link.connect(std::string("00:13:43:FF:FF:FF")); };

    TEST_ASSERT_TRUE(link.connect(pint()));
    TEST_ASSERT_FALSE(nested);
    TEST_ASSERT_EQUAL_UINT32(1, rig.transport.connectCalls);
    TEST_ASSERT_EQUAL_STRING(kPintId, rig.transport.lastConnectId.c_str());

    rig.transport.onConnect = nullptr;
    TEST_ASSERT_FALSE(link.connect(pint()));
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, link.state());
}

static void test_disconnect_is_idempotent() {
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_TRUE(link.connect(pint()));

    link.disconnect();
    link.disconnect();
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL_UINT(1, rig.count(ConnectionState::Disconnected));
    TEST_ASSERT_EQUAL(LinkError::None, link.lastError());

    const owlink::DiagnosticSnapshot diag = link.diagnostics();
    TEST_ASSERT_FALSE(diag.watchdogActive);
    TEST_ASSERT_FALSE(diag.heartbeatActive);
    TEST_ASSERT_FALSE(diag.keepaliveActive);
    TEST_ASSERT_EQUAL_UINT(0, diag.characteristicCount);
    TEST_ASSERT_EQUAL_UINT(0, diag.subscriptionCount);
    TEST_ASSERT_EQUAL_UINT(0, rig.transport.subscriptionCount());
    TEST_ASSERT_TRUE(diag.deviceId.empty());

    rig.advance(60000);
    TEST_ASSERT_EQUAL_UINT(1, rig.count(ConnectionState::Disconnected));
}

static void test_heartbeat_failure_disconnects() {
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_TRUE(link.connect(pint()));

    rig.transport.writeFails = true;
    rig.advance(HEARTBEAT_INTERVAL_MS);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL(LinkError::HeartbeatFailure, link.lastError());

    const StateChange& error = rig.states[rig.states.size() - 2];
    TEST_ASSERT_EQUAL(ConnectionState::Error, error.current);
    TEST_ASSERT_EQUAL_STRING("Connection lost - heartbeat failed", error.message.c_str());
}

static void test_watchdog_detects_link_loss() {
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_TRUE(link.connect(pint()));

    rig.transport.dropLink();
    rig.advance(WATCHDOG_INTERVAL_MS);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, link.state());
    TEST_ASSERT_EQUAL(LinkError::WatchdogDisconnect, link.lastError());
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.disconnectCalls);
}

static void test_keepalive_failure_keeps_session() {
    PintRig rig;
    rig.config.heartbeatFailureLimit = 3;
    BoardLink& link = rig.build();
    TEST_ASSERT_TRUE(link.connect(pint()));

    rig.transport.writeFails = true;
    rig.advance(CLASSIC_KEEPALIVE_INTERVAL_MS);
    rig.transport.writeFails = false;
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, link.state());
    TEST_ASSERT_EQUAL_UINT(1, link.diagnosticLog().count("keepalive"));
    TEST_ASSERT_EQUAL_UINT32(1, link.liveness().heartbeatFailures());
}

static void test_notifications_update_telemetry() {
    PintRig rig;
    BoardLink& link = rig.build();
    size_t updates = 0;
    link.events().onTelemetry([&updates](const owlink::TelemetrySnapshot&, owlink::TelemetryField) { ++updates; });
    TEST_ASSERT_TRUE(link.connect(pint()));
    updates = 0;

    rig.transport.notify(rig.battery(), {77});
    rig.transport.notify(rig.pitch(), le16(-1234));
    link.service();
    TEST_ASSERT_EQUAL_UINT(2, updates);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 77.0f, static_cast<float>(*link.telemetry().batteryPercent));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -12.34f, static_cast<float>(*link.telemetry().pitch));

    rig.transport.notify(rig.pitch(), {0x01});
    link.service();
    TEST_ASSERT_EQUAL_UINT(2, updates);
    TEST_ASSERT_EQUAL_UINT32(1, link.diagnostics().decodeFailures);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -12.34f, static_cast<float>(*link.telemetry().pitch));
}

static void test_auto_reconnect_to_remembered_board() {
    owlink::storeLastDeviceId(kPintId);
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_EQUAL_STRING(kPintId, link.rememberedDeviceId().c_str());

    link.startScan();
    rig.transport.emitScan({advert(kPintId, "Pint", -60)});
    link.service();
    TEST_ASSERT_EQUAL(ConnectionState::Authenticated, link.state());
    TEST_ASSERT_EQUAL_STRING(kPintId, rig.transport.lastConnectId.c_str());
}

static void test_auto_reconnect_disabled() {
    owlink::storeLastDeviceId(kPintId);
    owlink::storeAutoReconnect(false);
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_FALSE(link.autoReconnect());

    link.startScan();
    rig.transport.emitScan({advert(kPintId, "Pint", -60)});
    link.service();
    TEST_ASSERT_EQUAL(ConnectionState::Scanning, link.state());
    TEST_ASSERT_EQUAL_UINT32(0, rig.transport.connectCalls);
}

static void test_persisted_settings_validated() {
    owlink::storeMinRssi(-120);
    owlink::storeHeartbeatFailureLimit(4);
    PintRig rig;
    BoardLink& link = rig.build();
    TEST_ASSERT_EQUAL_INT(MIN_CANDIDATE_RSSI, link.config().filter.minRssi);
    TEST_ASSERT_EQUAL_UINT32(4, link.config().heartbeatFailureLimit);

    TEST_ASSERT_FALSE(link.setMinRssi(-20));
    TEST_ASSERT_TRUE(link.setMinRssi(-60));
    TEST_ASSERT_FALSE(link.setHeartbeatFailureLimit(0));

    owlink::LinkSettings stored;
    TEST_ASSERT_TRUE(owlink::loadLinkSettings(stored));
    TEST_ASSERT_TRUE(stored.hasMinRssi);
    TEST_ASSERT_EQUAL_INT32(-60, stored.minRssi);

    link.startScan();
    rig.transport.emitScan({advert(kPintId, "Pint", -65)});
    link.service();
    TEST_ASSERT_EQUAL_UINT(0, link.candidates().size());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_scan_filters_and_completes);
    RUN_TEST(test_scan_start_failure);
    RUN_TEST(test_pint_connects_end_to_end);
    RUN_TEST(test_connect_retries_with_backoff);
    RUN_TEST(test_connect_gives_up);
    RUN_TEST(test_newer_board_connect_budget);
    RUN_TEST(test_newer_board_gives_up_after_five_attempts);
    RUN_TEST(test_newer_board_watchdog_grace);
    RUN_TEST(test_disconnect_from_connected_listener);
    RUN_TEST(test_disconnect_from_authenticated_listener);
    RUN_TEST(test_transition_table_is_forward_only);
    RUN_TEST(test_service_not_found);
    RUN_TEST(test_invalid_challenge_signature);
    RUN_TEST(test_challenge_timeout);
    RUN_TEST(test_second_connect_ignored);
    RUN_TEST(test_disconnect_is_idempotent);
    RUN_TEST(test_heartbeat_failure_disconnects);
    RUN_TEST(test_watchdog_detects_link_loss);
    RUN_TEST(test_keepalive_failure_keeps_session);
    RUN_TEST(test_notifications_update_telemetry);
    RUN_TEST(test_auto_reconnect_to_remembered_board);
    RUN_TEST(test_auto_reconnect_disabled);
    RUN_TEST(test_persisted_settings_validated);
    return UNITY_END();
}
