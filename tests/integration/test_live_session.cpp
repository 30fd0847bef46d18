#include <gtest/gtest.h>
#include "common/errors.h"
#include "common/fake_daemon.h"
#include "session/connection_manager.h"
#include "wire/command.h"
#include "wire/schema.h"
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace darwin::client;
using namespace darwin::client::session;
using darwin::client::test_support::FakeDaemon;
using namespace std::chrono_literals;

// Connection manager against a loopback stand-in for the daemon: connect,
// request correlation, read-loop resilience, heartbeat liveness, teardown.

namespace {

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

class LiveSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.connect_timeout_ms = 1000;
        session_.connect_attempts = 1;
        session_.retry_delay_ms = 10;
        session_.request_timeout_ms = 2000;
        session_.heartbeat_interval_ms = 60000;
        session_.heartbeat_timeout_ms = 120000;

        daemon_.setHandler([](const std::string& line) -> std::vector<std::string> {
            if (line == "INFOACCOUNT") return {"INFOACCOUNT;10:00:00;ACC1;1000;0;0;1000;REAL"};
            if (line == "DARWINSTATUS") return {"DARWIN_STATUS;CONN_OK;TRUE;Release 2"};
            return {};
        });
    }

    std::unique_ptr<ConnectionManager> makeManager(bool heartbeat = false) {
        config::EndpointConfig ep{"127.0.0.1", daemon_.port()};
        return std::make_unique<ConnectionManager>("trading", ep, session_, heartbeat);
    }

    FakeDaemon daemon_;
    config::SessionConfig session_;
};

// ---------------------------------------------------------------------------
// Connect and request
// ---------------------------------------------------------------------------

TEST_F(LiveSessionTest, ConnectRequestDisconnect) {
    auto mgr = makeManager();
    std::vector<std::pair<LivenessState, LivenessState>> changes;
    std::mutex changes_mutex;
    mgr->setStateCallback([&](LivenessState from, LivenessState to) {
        std::lock_guard<std::mutex> lock(changes_mutex);
        changes.emplace_back(from, to);
    });

    mgr->connect();
    EXPECT_EQ(mgr->state(), LivenessState::Connected);
    EXPECT_TRUE(mgr->isConnected());
    ASSERT_TRUE(daemon_.waitForClient());

    router::Reply reply = mgr->request(wire::Command::queryAccount());
    ASSERT_EQ(reply.items.size(), 1u);
    EXPECT_EQ(reply.items[0].getString("account_code"), "ACC1");
    EXPECT_EQ(daemon_.receivedCount("INFOACCOUNT"), 1u);

    mgr->disconnect();
    EXPECT_EQ(mgr->state(), LivenessState::Disconnected);

    std::lock_guard<std::mutex> lock(changes_mutex);
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].second, LivenessState::Connecting);
    EXPECT_EQ(changes[1].second, LivenessState::Connected);
    EXPECT_EQ(changes[2].second, LivenessState::Disconnected);
}

TEST_F(LiveSessionTest, ConnectIsIdempotent) {
    auto mgr = makeManager();
    mgr->connect();
    mgr->connect();
    ASSERT_TRUE(daemon_.waitForClient());
    EXPECT_EQ(mgr->metrics().successful_connections, 1u);
    EXPECT_EQ(daemon_.acceptedCount(), 1u);
}

TEST_F(LiveSessionTest, RefusedConnectionCountsEveryAttempt) {
    session_.connect_attempts = 3;
    config::EndpointConfig ep{"127.0.0.1", test_support::unusedPort()};
    ConnectionManager mgr("trading", ep, session_, false);

    EXPECT_THROW(mgr.connect(), ConnectionError);
    EXPECT_EQ(mgr.state(), LivenessState::Disconnected);

    ConnectionMetrics m = mgr.metrics();
    EXPECT_EQ(m.connection_attempts, 3u);
    EXPECT_EQ(m.failed_connections, 3u);
    EXPECT_EQ(m.successful_connections, 0u);
    EXPECT_TRUE(m.last_connect_time.empty());
}

TEST_F(LiveSessionTest, SendingWhileDisconnectedFails) {
    auto mgr = makeManager();
    EXPECT_THROW(mgr->send("INFOACCOUNT"), NotConnectedError);
    EXPECT_THROW(mgr->request(wire::Command::queryAccount()), NotConnectedError);
}

TEST_F(LiveSessionTest, InvalidCommandNeverReachesTheDaemon) {
    auto mgr = makeManager();
    mgr->connect();
    EXPECT_THROW(mgr->request(wire::Command::cancelOrder("")), ValidationError);
    mgr->request(wire::Command::queryAccount());
    EXPECT_EQ(daemon_.received().size(), 1u);
}

TEST_F(LiveSessionTest, SilentDaemonTimesOut) {
    daemon_.silence();
    auto mgr = makeManager();
    mgr->connect();
    EXPECT_THROW(mgr->request(wire::Command::queryAccount(), 100ms), TimeoutError);
    EXPECT_EQ(mgr->router().pendingCount(), 0u);
}

// ---------------------------------------------------------------------------
// Correlation under concurrency
// ---------------------------------------------------------------------------

TEST_F(LiveSessionTest, SameKindRequestsAreSerialized) {
    daemon_.silence();
    auto mgr = makeManager();
    mgr->connect();

    auto first = std::async(std::launch::async, [&] {
        return mgr->request(wire::Command::queryAccount());
    });
    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 1));
    auto second = std::async(std::launch::async, [&] {
        return mgr->request(wire::Command::queryAccount());
    });

    // The second request stays queued until the first is answered.
    ASSERT_TRUE(waitUntil([&] { return mgr->router().pendingCount() == 2; }));
    EXPECT_EQ(daemon_.receivedCount("INFOACCOUNT"), 1u);

    daemon_.push("INFOACCOUNT;10:00:00;FIRST;1;0;0;1;REAL");
    EXPECT_EQ(first.get().items.at(0).getString("account_code"), "FIRST");

    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 2));
    daemon_.push("INFOACCOUNT;10:00:01;SECOND;2;0;0;2;REAL");
    EXPECT_EQ(second.get().items.at(0).getString("account_code"), "SECOND");
}

TEST_F(LiveSessionTest, ListReplyAndInterleavedEvent) {
    daemon_.setHandler([](const std::string& line) -> std::vector<std::string> {
        if (line != "ORDERLIST") return {};
        return {"ORDER;INTC;09:31:00;D1;BUY;50.25;0;100;2000",
                "ORDUPD;INTC;D0;2002;SELL;5;5;49;09:31:01",
                "ORDER;ENI;09:32:00;D2;SELL;14;0;10;2004;4;14;LIMIT",
                "END;ORDERLIST;2"};
    });
    auto mgr = makeManager();
    std::promise<std::string> update;
    mgr->router().subscribe(wire::Tag::ORDUPD, [&](const wire::Record& r) {
        update.set_value(r.getString("order_id"));
    });
    mgr->connect();

    router::Reply reply = mgr->request(wire::Command::queryOrders());
    ASSERT_EQ(reply.items.size(), 2u);
    EXPECT_EQ(reply.items[1].getString("kind"), "LIMIT");
    EXPECT_EQ(reply.terminal->getInt("count"), 2);

    auto fut = update.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "D0");
}

// ---------------------------------------------------------------------------
// Read-loop resilience
// ---------------------------------------------------------------------------

TEST_F(LiveSessionTest, MalformedAndUnknownLinesAreSkipped) {
    daemon_.setHandler([](const std::string& line) -> std::vector<std::string> {
        if (line != "INFOACCOUNT") return {};
        return {"INFOACCOUNT;not-a-time;ACC;x;0;0;1;REAL",
                "NEWSFLASH;ENI;halted",
                "",
                "INFOACCOUNT;10:00:00;GOOD;1000;0;0;1000;REAL"};
    });
    auto mgr = makeManager();
    mgr->connect();

    router::Reply reply = mgr->request(wire::Command::queryAccount());
    EXPECT_EQ(reply.items.at(0).getString("account_code"), "GOOD");
    EXPECT_TRUE(mgr->isConnected());
}

TEST_F(LiveSessionTest, DaemonDropCancelsPendingRequests) {
    daemon_.silence();
    auto mgr = makeManager();
    mgr->connect();

    auto pending = std::async(std::launch::async, [&] {
        return mgr->request(wire::Command::queryAccount(), 5000ms);
    });
    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 1));
    daemon_.dropClient();

    EXPECT_THROW(pending.get(), TransportError);
    ASSERT_TRUE(waitUntil([&] { return mgr->state() == LivenessState::Disconnected; }));
}

TEST_F(LiveSessionTest, DisconnectCancelsPendingRequests) {
    daemon_.silence();
    auto mgr = makeManager();
    mgr->connect();

    auto pending = std::async(std::launch::async, [&] {
        return mgr->request(wire::Command::queryAccount(), 5000ms);
    });
    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 1));
    mgr->disconnect();

    EXPECT_THROW(pending.get(), TransportError);
}

TEST_F(LiveSessionTest, ReconnectAfterDrop) {
    auto mgr = makeManager();
    mgr->connect();
    daemon_.dropClient();
    ASSERT_TRUE(waitUntil([&] { return mgr->state() == LivenessState::Disconnected; }));

    mgr->connect();
    EXPECT_EQ(mgr->request(wire::Command::queryAccount()).items.size(), 1u);
    EXPECT_EQ(mgr->metrics().successful_connections, 2u);
}

// ---------------------------------------------------------------------------
// Heartbeat
// ---------------------------------------------------------------------------

TEST_F(LiveSessionTest, HeartbeatKeepsSessionConnected) {
    session_.heartbeat_interval_ms = 50;
    session_.heartbeat_timeout_ms = 400;
    auto mgr = makeManager(true);
    mgr->connect();

    ASSERT_TRUE(daemon_.waitForReceived("DARWINSTATUS", 3));
    EXPECT_EQ(mgr->state(), LivenessState::Connected);
    EXPECT_TRUE(mgr->lastHeartbeat().has_value());
    EXPECT_FALSE(mgr->metrics().last_status_check.empty());
}

TEST_F(LiveSessionTest, SilenceDegradesAndStatusRecovers) {
    session_.heartbeat_interval_ms = 50;
    session_.heartbeat_timeout_ms = 100;
    daemon_.silence();
    auto mgr = makeManager(true);
    mgr->connect();

    ASSERT_TRUE(waitUntil([&] { return mgr->state() == LivenessState::Degraded; }));
    EXPECT_TRUE(mgr->isConnected());

    // Requests still go out while degraded.
    auto pending = std::async(std::launch::async, [&] {
        return mgr->request(wire::Command::queryAccount());
    });
    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 1));
    daemon_.push("INFOACCOUNT;10:00:00;ACC1;1000;0;0;1000;REAL");
    EXPECT_EQ(pending.get().items.size(), 1u);

    daemon_.setHandler([](const std::string& line) -> std::vector<std::string> {
        if (line == "DARWINSTATUS") return {"DARWIN_STATUS;CONN_OK;TRUE;"};
        return {};
    });
    daemon_.push("DARWIN_STATUS;CONN_OK;TRUE;");
    ASSERT_TRUE(waitUntil([&] { return mgr->state() == LivenessState::Connected; }));

    ConnectionMetrics m = mgr->metrics();
    ASSERT_GE(m.recent_transitions.size(), 4u);
    const LivenessTransition& degraded = m.recent_transitions[2];
    EXPECT_EQ(degraded.from, LivenessState::Connected);
    EXPECT_EQ(degraded.to, LivenessState::Degraded);
    EXPECT_EQ(m.recent_transitions[3].to, LivenessState::Connected);
}

TEST_F(LiveSessionTest, TransitionHistoryIsBounded) {
    auto mgr = makeManager();
    for (int i = 0; i < 5; ++i) {
        mgr->connect();
        mgr->disconnect();
    }
    ConnectionMetrics m = mgr->metrics();
    EXPECT_EQ(m.recent_transitions.size(), ConnectionManager::kMaxTransitionHistory);
    EXPECT_EQ(m.recent_transitions.front().to, LivenessState::Connected);
    EXPECT_EQ(m.recent_transitions.back().to, LivenessState::Disconnected);
}
