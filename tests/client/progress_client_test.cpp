#include <gtest/gtest.h>
#include "syncwatch/client/progress_client.hpp"
#include "support/fake_transport.hpp"
#include "support/manual_scheduler.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace syncwatch;
using namespace syncwatch::client;
using syncwatch::network::kAbnormalClosure;
using syncwatch::network::kNormalClosure;
using syncwatch::network::TransportKind;
using syncwatch::progress::Phase;
using syncwatch::progress::ProgressSnapshot;
using syncwatch::test_support::FakeTransportFactory;
using syncwatch::test_support::ManualScheduler;
using std::chrono::milliseconds;

namespace {

std::string progress_frame(const std::string& phase, int files_processed = 0, int files_found = 100) {
    return R"({"type":"progress","data":{"source_id":"src-1","phase":")" + phase +
           R"(","files_found":)" + std::to_string(files_found) +
           R"(,"files_processed":)" + std::to_string(files_processed) + "}}";
}

/// Completes fetches only when the test says so
class FakeStatusPoller : public network::StatusPoller {
public:
    void fetch(const std::string& source_id, Callback callback) override {
        requested.push_back(source_id);
        pending.push_back(std::move(callback));
    }

    void complete(network::StatusResult result) {
        auto callback = std::move(pending.front());
        pending.erase(pending.begin());
        callback(std::move(result));
    }

    std::vector<std::string> requested;
    std::vector<Callback> pending;
};

class ProgressClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        credentials = std::make_shared<StaticCredentialProvider>("token-1");
    }

    std::unique_ptr<ProgressClient> make_client(ClientOptions options = {},
                                                TransportKind kind = TransportKind::WebSocket) {
        factory = std::make_unique<FakeTransportFactory>(kind);
        auto client = std::make_unique<ProgressClient>("src-1", factory->factory(), credentials, scheduler, options);

        client->on_snapshot([this](const ProgressSnapshot& s) { snapshots.push_back(s); });
        client->on_error([this](const ClientError& e) { errors.push_back(e); });
        client->on_connection_state_change([this](ConnectionState, ConnectionState current) {
            states.push_back(current);
        });
        return client;
    }

    std::unique_ptr<ProgressClient> connected_client(ClientOptions options = {},
                                                     TransportKind kind = TransportKind::WebSocket) {
        auto client = make_client(options, kind);
        client->connect();
        factory->last().simulate_open();
        return client;
    }

    ManualScheduler scheduler;
    std::unique_ptr<FakeTransportFactory> factory;
    std::shared_ptr<StaticCredentialProvider> credentials;

    std::vector<ProgressSnapshot> snapshots;
    std::vector<ClientError> errors;
    std::vector<ConnectionState> states;
};

} // namespace

TEST_F(ProgressClientTest, ConstructionDoesNotConnect) {
    auto client = make_client();
    EXPECT_EQ(factory->created_count(), 0u);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
    EXPECT_FALSE(client->latest_snapshot().has_value());
}

TEST_F(ProgressClientTest, FullJobDeliversSevenSnapshots) {
    auto client = connected_client();
    const std::vector<std::string> phases = {
        "initializing", "evaluating", "discovering_directories", "discovering_files",
        "processing_files", "saving_metadata", "completed",
    };

    for (const auto& phase : phases) {
        factory->last().simulate_frame(progress_frame(phase));
    }

    ASSERT_EQ(snapshots.size(), 7u);
    for (std::size_t i = 0; i < 6; ++i) {
        EXPECT_TRUE(snapshots[i].is_active()) << phases[i];
    }
    EXPECT_FALSE(snapshots[6].is_active());
    EXPECT_EQ(snapshots[6].phase, Phase::Completed);
    EXPECT_EQ(client->phase(), Phase::Completed);
    EXPECT_EQ(client->phase_tracker().out_of_order_transitions(), 0u);
    EXPECT_TRUE(errors.empty());
}

TEST_F(ProgressClientTest, SnapshotsAreNeitherReorderedNorCoalesced) {
    auto client = connected_client();

    for (int processed = 0; processed <= 50; processed += 5) {
        factory->last().simulate_frame(progress_frame("processing_files", processed));
    }
    // Same payload twice still yields two deliveries
    factory->last().simulate_frame(progress_frame("processing_files", 50));

    ASSERT_EQ(snapshots.size(), 12u);
    for (std::size_t i = 0; i + 1 < 11; ++i) {
        EXPECT_LT(snapshots[i].files_processed, snapshots[i + 1].files_processed);
    }
    EXPECT_EQ(snapshots.back().files_processed, 50u);
    ASSERT_TRUE(client->latest_snapshot().has_value());
    EXPECT_EQ(*client->latest_snapshot(), snapshots.back());
}

TEST_F(ProgressClientTest, ActivityMatchesPhaseForEveryKnownPhase) {
    auto client = connected_client();
    for (const char* phase : {"initializing", "evaluating", "discovering_directories", "discovering_files",
                              "processing_files", "saving_metadata", "completed", "failed"}) {
        factory->last().simulate_frame(progress_frame(phase));
        ASSERT_FALSE(snapshots.empty());
        const auto& s = snapshots.back();
        EXPECT_EQ(s.is_active(), s.phase != Phase::Completed && s.phase != Phase::Failed) << phase;
    }
    EXPECT_EQ(snapshots.size(), 8u);
}

TEST_F(ProgressClientTest, MalformedFrameYieldsOneErrorAndNoSnapshot) {
    auto client = connected_client();
    factory->last().simulate_frame(progress_frame("evaluating", 1));
    snapshots.clear();

    factory->last().simulate_frame("{\"type\": \"progress\", \"data\": {");

    EXPECT_TRUE(snapshots.empty());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::Decode);
    EXPECT_FALSE(errors[0].is_terminal());

    // State untouched and the stream stays open
    ASSERT_TRUE(client->latest_snapshot().has_value());
    EXPECT_EQ(client->latest_snapshot()->files_processed, 1u);
    EXPECT_EQ(client->connection_state(), ConnectionState::Connected);
    EXPECT_FALSE(factory->last().closed_by_owner);
    EXPECT_EQ(scheduler.pending_count(), 1u);  // Keepalive only, no reconnect
}

TEST_F(ProgressClientTest, HeartbeatUsesItsOwnChannel) {
    auto client = connected_client();
    std::vector<events::HeartbeatReceivedEvent> heartbeats;
    client->on_heartbeat([&](const events::HeartbeatReceivedEvent& e) { heartbeats.push_back(e); });

    factory->last().simulate_frame(progress_frame("processing_files", 10));
    factory->last().simulate_frame(R"({"type":"heartbeat","data":{"source_id":"src-1","is_active":true,"timestamp":99}})");

    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_TRUE(heartbeats[0].is_active);
    EXPECT_EQ(heartbeats[0].timestamp, 99);
    EXPECT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(client->latest_snapshot()->files_processed, 10u);
}

TEST_F(ProgressClientTest, ServerErrorIsForwardedWithoutClosing) {
    auto client = connected_client();
    factory->last().simulate_frame(R"({"type":"error","data":{"message":"Failed to serialize progress","error_type":"serialization_error"}})");

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::Server);
    EXPECT_NE(errors[0].message.find("Failed to serialize progress"), std::string::npos);
    EXPECT_EQ(client->connection_state(), ConnectionState::Connected);
    EXPECT_FALSE(factory->last().closed_by_owner);
}

TEST_F(ProgressClientTest, InformationalFramesProduceNothing) {
    auto client = connected_client();
    factory->last().simulate_frame(R"({"type":"connection_confirmed","data":{"source_id":"src-1","timestamp":1}})");
    factory->last().simulate_frame(R"({"type":"connection_closing","data":{"source_id":"src-1","message":"bye"}})");

    EXPECT_TRUE(snapshots.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(ProgressClientTest, ConnectWhileConnectedIsNoOp) {
    auto client = connected_client();
    client->connect();
    client->connect();
    EXPECT_EQ(factory->created_count(), 1u);
}

TEST_F(ProgressClientTest, KeepaliveWhileDisconnectedSendsNothing) {
    auto client = make_client();
    EXPECT_NO_THROW({
        EXPECT_FALSE(client->send_keepalive());
    });

    client->connect();
    EXPECT_FALSE(client->send_keepalive());  // Still connecting
    factory->last().simulate_close(kAbnormalClosure);
    EXPECT_FALSE(client->send_keepalive());

    EXPECT_EQ(factory->total_sent(), 0u);
}

TEST_F(ProgressClientTest, KeepalivePingsWhileConnected) {
    ClientOptions options;
    options.keepalive_interval = milliseconds(30000);
    auto client = connected_client(options);

    scheduler.advance(milliseconds(30000));
    scheduler.advance(milliseconds(30000));
    EXPECT_EQ(factory->last().sent, (std::vector<std::string>{"ping", "ping"}));

    client->disconnect();
    scheduler.advance(milliseconds(120000));
    EXPECT_EQ(factory->total_sent(), 2u);
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(ProgressClientTest, ManualKeepaliveSendsPing) {
    auto client = connected_client();
    EXPECT_TRUE(client->send_keepalive());
    EXPECT_EQ(factory->last().sent, (std::vector<std::string>{"ping"}));
}

TEST_F(ProgressClientTest, KeepaliveDisabledByZeroInterval) {
    ClientOptions options;
    options.keepalive_interval = milliseconds(0);
    auto client = connected_client(options);
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(ProgressClientTest, ReceiveOnlyTransportGetsNoKeepalive) {
    auto client = connected_client({}, TransportKind::EventStream);
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_FALSE(client->send_keepalive());
    EXPECT_EQ(factory->total_sent(), 0u);
}

TEST_F(ProgressClientTest, KeepaliveStopsWhileReconnecting) {
    auto client = connected_client();
    factory->last().simulate_close(kAbnormalClosure);

    // Only the reconnect timer remains
    EXPECT_EQ(scheduler.pending_delays(), (std::vector<milliseconds>{milliseconds(1000)}));
}

TEST_F(ProgressClientTest, MissingTokenYieldsSingleAuthenticationError) {
    credentials->clear();
    auto client = make_client();

    client->connect();

    EXPECT_EQ(factory->created_count(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::Authentication);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
}

TEST_F(ProgressClientTest, ConnectAfterTerminalErrorStartsOver) {
    credentials->clear();
    auto client = make_client();
    client->connect();
    ASSERT_EQ(errors.size(), 1u);

    credentials->set_token("token-2");
    client->connect();

    ASSERT_EQ(factory->created_count(), 1u);
    EXPECT_EQ(factory->last().request.bearer_token, "token-2");
    EXPECT_EQ(client->reconnect_attempts(), 0u);
}

TEST_F(ProgressClientTest, ExhaustedRetriesReportOnceThenManualRetryWorks) {
    auto client = make_client();
    client->connect();
    for (int close = 0; close < 6; ++close) {
        factory->last().simulate_close(kAbnormalClosure);
        scheduler.advance(milliseconds(60000));
    }

    EXPECT_EQ(factory->created_count(), 6u);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.back().kind, ErrorKind::ReconnectExhausted);
    std::size_t exhausted = 0;
    for (const auto& e : errors) {
        exhausted += e.kind == ErrorKind::ReconnectExhausted ? 1 : 0;
    }
    EXPECT_EQ(exhausted, 1u);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);

    client->reconnect();
    EXPECT_EQ(factory->created_count(), 7u);
    EXPECT_EQ(client->reconnect_attempts(), 0u);
    EXPECT_EQ(client->connection_state(), ConnectionState::Connecting);
}

TEST_F(ProgressClientTest, ConnectAfterDisconnectStartsWithFreshRetries) {
    auto client = make_client();
    client->connect();
    for (int close = 0; close < 4; ++close) {
        factory->last().simulate_close(kAbnormalClosure);
        scheduler.advance(milliseconds(60000));
    }
    ASSERT_EQ(client->reconnect_attempts(), 4u);

    client->disconnect();
    client->connect();
    EXPECT_EQ(client->reconnect_attempts(), 0u);

    factory->last().simulate_close(kAbnormalClosure);
    EXPECT_EQ(scheduler.pending_delays(), (std::vector<milliseconds>{milliseconds(1000)}));
}

TEST_F(ProgressClientTest, DroppedConnectionIsVisibleOnErrorChannel) {
    auto client = connected_client();
    factory->last().simulate_close(1001, "server restarting");

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::Transport);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
    EXPECT_EQ(scheduler.pending_count(), 1u);
}

TEST_F(ProgressClientTest, ReconnectReplacesOpenConnection) {
    auto client = connected_client();
    auto& first = factory->last();

    client->reconnect();

    EXPECT_TRUE(first.closed_by_owner);
    EXPECT_EQ(first.owner_close->code, kNormalClosure);
    EXPECT_EQ(factory->created_count(), 2u);
    EXPECT_EQ(client->connection_state(), ConnectionState::Connecting);
}

TEST_F(ProgressClientTest, DisconnectStopsDeliveryAndClearsSnapshot) {
    auto client = connected_client();
    factory->last().simulate_frame(progress_frame("processing_files", 3));
    auto in_flight = factory->last().handlers;

    client->disconnect();

    EXPECT_FALSE(client->latest_snapshot().has_value());
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
    EXPECT_EQ(factory->last().owner_close->code, kNormalClosure);

    in_flight.on_frame(network::RawFrame{std::nullopt, progress_frame("completed")});
    in_flight.on_close(network::CloseInfo{kAbnormalClosure, ""});

    EXPECT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_EQ(factory->created_count(), 1u);
}

TEST_F(ProgressClientTest, FinalSnapshotDeliveredBeforeDisconnect) {
    auto client = connected_client();
    client->on_snapshot([&](const ProgressSnapshot& s) {
        if (s.is_terminal()) {
            client->disconnect();
        }
    });

    factory->last().simulate_frame(progress_frame("completed", 100));

    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].phase, Phase::Completed);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
}

TEST_F(ProgressClientTest, DisconnectOnTerminalKeepsFinalSnapshot) {
    ClientOptions options;
    options.disconnect_on_terminal = true;
    auto client = connected_client(options);

    factory->last().simulate_frame(progress_frame("processing_files", 50));
    EXPECT_EQ(client->connection_state(), ConnectionState::Connected);

    factory->last().simulate_frame(progress_frame("failed", 50));

    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[1].phase, Phase::Failed);
    EXPECT_EQ(client->connection_state(), ConnectionState::Disconnected);
    EXPECT_EQ(factory->last().owner_close->code, kNormalClosure);
    ASSERT_TRUE(client->latest_snapshot().has_value());
    EXPECT_EQ(client->latest_snapshot()->phase, Phase::Failed);
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(ProgressClientTest, StateChangesAreReported) {
    auto client = connected_client();
    factory->last().simulate_close(kAbnormalClosure);
    scheduler.advance(milliseconds(1000));
    factory->last().simulate_open();
    client->disconnect();

    EXPECT_EQ(states, (std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Connected,
        ConnectionState::Disconnected,
        ConnectionState::Connecting, ConnectionState::Connected,
        ConnectionState::Disconnected,
    }));
}

TEST_F(ProgressClientTest, LateSubscriberSeesNoReplay) {
    auto client = connected_client();
    factory->last().simulate_frame(progress_frame("evaluating"));

    std::vector<ProgressSnapshot> late;
    client->on_snapshot([&](const ProgressSnapshot& s) { late.push_back(s); });
    EXPECT_TRUE(late.empty());

    factory->last().simulate_frame(progress_frame("discovering_files"));
    ASSERT_EQ(late.size(), 1u);
    EXPECT_EQ(late[0].phase, Phase::DiscoveringFiles);
}

TEST_F(ProgressClientTest, ThrowingSubscriberDoesNotBreakDelivery) {
    auto client = make_client();
    client->on_snapshot([](const ProgressSnapshot&) { throw std::runtime_error("ui bug"); });
    std::size_t after = 0;
    client->on_snapshot([&](const ProgressSnapshot&) { after++; });

    client->connect();
    factory->last().simulate_open();
    EXPECT_NO_THROW(factory->last().simulate_frame(progress_frame("evaluating")));

    EXPECT_EQ(after, 1u);
    EXPECT_EQ(snapshots.size(), 1u);
}

TEST_F(ProgressClientTest, RefreshDeliversPolledSnapshot) {
    auto client = make_client();
    auto poller = std::make_shared<FakeStatusPoller>();
    client->set_status_poller(poller);

    client->refresh();
    ASSERT_EQ(poller->requested, (std::vector<std::string>{"src-1"}));

    ProgressSnapshot polled;
    polled.source_id = "src-1";
    polled.phase = Phase::SavingMetadata;
    poller->complete(Ok(std::optional<ProgressSnapshot>(polled)));

    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0], polled);
    EXPECT_EQ(client->latest_snapshot(), polled);
}

TEST_F(ProgressClientTest, RefreshWithoutActiveJobIsNotAnError) {
    auto client = make_client();
    auto poller = std::make_shared<FakeStatusPoller>();
    client->set_status_poller(poller);

    client->refresh();
    poller->complete(Ok(std::optional<ProgressSnapshot>{}));

    EXPECT_TRUE(snapshots.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(ProgressClientTest, RefreshFailureGoesToErrorChannel) {
    auto client = make_client();
    auto poller = std::make_shared<FakeStatusPoller>();
    client->set_status_poller(poller);

    client->refresh();
    poller->complete(Err<std::optional<ProgressSnapshot>>(
        ClientError(ErrorKind::Transport, "status endpoint returned HTTP 503")));

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::Transport);
}

TEST_F(ProgressClientTest, RefreshResultAfterDisconnectIsDropped) {
    auto client = make_client();
    auto poller = std::make_shared<FakeStatusPoller>();
    client->set_status_poller(poller);

    client->refresh();
    client->disconnect();
    poller->complete(Ok(std::optional<ProgressSnapshot>(ProgressSnapshot{})));
    EXPECT_TRUE(snapshots.empty());
}

TEST_F(ProgressClientTest, RefreshResultAfterDestructionIsDropped) {
    auto client = make_client();
    auto poller = std::make_shared<FakeStatusPoller>();
    client->set_status_poller(poller);

    client->refresh();
    client.reset();
    EXPECT_NO_THROW(poller->complete(Ok(std::optional<ProgressSnapshot>(ProgressSnapshot{}))));
    EXPECT_TRUE(snapshots.empty());
}

TEST_F(ProgressClientTest, DestructionClosesTransportAndCancelsTimers) {
    auto client = make_client();
    client->connect();
    factory->last().simulate_close(kAbnormalClosure);
    ASSERT_EQ(scheduler.pending_count(), 1u);
    client->connect();
    factory->last().simulate_open();

    client.reset();

    EXPECT_TRUE(factory->last().closed_by_owner);
    EXPECT_EQ(factory->last().owner_close->code, kNormalClosure);
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(ProgressClientTest, ClientsAreIndependent) {
    auto first = connected_client();
    auto& first_transport = factory->last();
    auto first_factory = std::move(factory);

    std::vector<ProgressSnapshot> second_snapshots;
    factory = std::make_unique<FakeTransportFactory>();
    ProgressClient second("src-2", factory->factory(), credentials, scheduler);
    second.on_snapshot([&](const ProgressSnapshot& s) { second_snapshots.push_back(s); });
    second.connect();
    factory->last().simulate_open();

    first_transport.simulate_frame(progress_frame("evaluating"));
    second.disconnect();
    first_transport.simulate_frame(progress_frame("discovering_files"));

    EXPECT_EQ(snapshots.size(), 2u);
    EXPECT_TRUE(second_snapshots.empty());
    EXPECT_EQ(first->connection_state(), ConnectionState::Connected);
    EXPECT_EQ(factory->last().request.source_id, "src-2");
}
