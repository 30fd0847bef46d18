#include <gtest/gtest.h>
#include "client/session_guard.h"
#include "client/trading_client.h"
#include "common/errors.h"
#include "common/fake_daemon.h"
#include "config/client_config.h"
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace darwin::client;
using darwin::client::test_support::FakeDaemon;
using namespace std::chrono_literals;

// Trading facade in live mode, with the daemon played by a loopback server
// that answers each verb the way the trading socket does.

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> tradingDaemon(const std::string& line) {
    if (line == "INFOACCOUNT") return {"INFOACCOUNT;10:00:00;DW123;25000.5;120;-30;25090.5;REAL"};
    if (line == "INFOAVAILABILITY") return {"AVAILABILITY;10:00:00;25000.5;50000;24000"};
    if (line == "DARWINSTATUS") return {"DARWIN_STATUS;CONN_OK;TRUE;Release 2.5"};
    if (line == "INFOSTOCKS") {
        return {"STOCK;ENI;10:00:00;200;50;0;14.1;12.5;14.3",
                "STOCK;INTC;10:00:00;10;0;10;30;0;31",
                "END;INFOSTOCKS;2"};
    }
    if (line == "GETPOSITION ENI") return {"STOCK;ENI;10:00:00;200;50;0;14.1;12.5;14.3"};
    if (line == "GETPOSITION FCA") return {"ERR;GETPOSITION;1018"};
    if (line == "ORDERLISTPENDING") return {"ERR;ORDERLISTPENDING;1019"};
    if (line == "ORDERLIST ENI") {
        return {"ORDER;ENI;09:30:00;D7;BUY;14;0;100;2000;0;0;LIMIT", "END;ORDERLIST;1"};
    }
    if (startsWith(line, "ACQAZ ")) {
        // ACQAZ <ref>,<symbol>,<qty>,<price>
        auto args = line.substr(6);
        auto ref = args.substr(0, args.find(','));
        return {"TRADOK;ENI;D100;2000;BUY;100;14.2;0;0;100;" + ref + ";" + line};
    }
    if (startsWith(line, "ACQMARKET ")) return {"TRADERR;ENI;D101;1007;insufficient liquidity"};
    if (startsWith(line, "VENAZ ")) return {"TRADCONFIRM;ENI;D102;10;15;Price far from market, confirm?"};
    if (line == "CONFORD D102") return {"TRADOK;ENI;D102;2000;CONFIRM;10;15;0;0;10;;CONFORD D102"};
    if (line == "REVORD D100") return {"TRADOK;ENI;D100;2003;CANCEL;100;14.2;0;0;0;;REVORD D100"};
    if (line == "REVORD D999") return {"ERR;REVORD;1020"};
    if (line == "REVALL ENI") {
        return {"TRADOK;ENI;D1;2003;CANCEL;5;14;0;0;0;;REVALL ENI",
                "TRADOK;ENI;D2;2003;CANCEL;5;14;0;0;0;;REVALL ENI",
                "END;REVALL;2"};
    }
    if (line == "MODORD D100,14.1") {
        return {"TRADOK;ENI;D100;2000;MODIFY;100;14.1;0;0;100;;MODORD D100,14.1"};
    }
    return {};
}

} // namespace

class LiveTradingClientTest : public ::testing::Test {
protected:
    LiveTradingClientTest() {
        daemon_.setHandler(&tradingDaemon);
        config_.trading.port = daemon_.port();
        config_.session.connect_attempts = 1;
        config_.session.request_timeout_ms = 2000;
        config_.session.heartbeat_interval_ms = 60000;
        config_.session.heartbeat_timeout_ms = 120000;
        client_ = std::make_unique<TradingClient>(config_);
    }

    FakeDaemon daemon_;
    config::ClientConfig config_;
    std::unique_ptr<TradingClient> client_;
};

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

TEST_F(LiveTradingClientTest, AccountAndAvailability) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session) << session.result().error;
    EXPECT_EQ(client_->mode(), SessionMode::Live);

    auto account = client_->getAccountInfo();
    ASSERT_TRUE(account.success) << account.error;
    EXPECT_EQ(account.data.account_code, "DW123");
    EXPECT_EQ(account.data.liquidity, Decimal::parse("25000.5"));
    EXPECT_EQ(account.data.open_pnl, Decimal::parse("-30"));
    EXPECT_EQ(account.data.environment, "REAL");
    EXPECT_EQ(account.data.time, Timestamp::fromTimeOfDay(10, 0, 0));

    auto avail = client_->getAvailability();
    ASSERT_TRUE(avail.success);
    EXPECT_EQ(avail.data.buying_power, Decimal::parse("24000"));
}

TEST_F(LiveTradingClientTest, PortfolioAndPositions) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto portfolio = client_->getPortfolio();
    ASSERT_TRUE(portfolio.success) << portfolio.error;
    ASSERT_EQ(portfolio.data.size(), 2u);
    EXPECT_EQ(portfolio.data[0].symbol, "ENI");
    EXPECT_EQ(portfolio.data[0].quantity_darwin, 50);
    EXPECT_EQ(portfolio.data[0].last_price, Decimal::parse("14.3"));
    EXPECT_EQ(portfolio.data[1].quantity_negotiation, 10);

    auto eni = client_->getPosition("ENI");
    ASSERT_TRUE(eni.success);
    ASSERT_TRUE(eni.data.has_value());
    EXPECT_EQ(eni.data->avg_price, Decimal::parse("14.1"));

    auto none = client_->getPosition("FCA");
    ASSERT_TRUE(none.success);
    EXPECT_FALSE(none.data.has_value());
}

TEST_F(LiveTradingClientTest, OrderLists) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto orders = client_->getOrdersForSymbol("ENI");
    ASSERT_TRUE(orders.success) << orders.error;
    ASSERT_EQ(orders.data.size(), 1u);
    EXPECT_EQ(orders.data[0].order_id, "D7");
    EXPECT_EQ(orders.data[0].status, OrderStatus::Pending);

    auto pending = client_->getPendingOrders();
    ASSERT_TRUE(pending.success);
    EXPECT_TRUE(pending.data.empty());
}

TEST_F(LiveTradingClientTest, StatusCarriesSessionMetrics) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto status = client_->getDarwinStatus();
    ASSERT_TRUE(status.success);
    EXPECT_TRUE(status.data.isConnected());
    EXPECT_EQ(status.data.release, "Release 2.5");
    EXPECT_EQ(status.data.mode, SessionMode::Live);
    EXPECT_EQ(status.data.metrics.successful_connections, 1u);
}

// ---------------------------------------------------------------------------
// Orders
// ---------------------------------------------------------------------------

TEST_F(LiveTradingClientTest, LimitOrderRoundTrip) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    wire::OrderRequest r;
    r.order_id = "MY1";
    r.symbol = "ENI";
    r.quantity = 100;
    r.price = Decimal::parse("14.2");
    auto placed = client_->placeOrder(r);
    ASSERT_TRUE(placed.success) << placed.error;
    EXPECT_TRUE(placed.data.accepted);
    EXPECT_EQ(placed.data.order_id, "D100");
    EXPECT_EQ(placed.data.reference, "MY1");
    EXPECT_EQ(daemon_.receivedCount("ACQAZ MY1,ENI,100,14.2"), 1u);

    auto modified = client_->modifyOrder("D100", Decimal::parse("14.1"));
    ASSERT_TRUE(modified.success);
    EXPECT_EQ(modified.data.price, Decimal::parse("14.1"));

    auto cancelled = client_->cancelOrder("D100");
    ASSERT_TRUE(cancelled.success);
    EXPECT_EQ(cancelled.data.status, OrderStatus::Cancelled);
}

TEST_F(LiveTradingClientTest, RejectionIsASuccessfulCall) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto result = client_->placeMarketOrder("ENI", Side::Buy, 100000);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.data.accepted);
    EXPECT_EQ(result.data.error_code, 1007);
    EXPECT_EQ(result.data.message, "insufficient liquidity");
}

TEST_F(LiveTradingClientTest, ConfirmationIsSentAutomatically) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto result = client_->placeLimitOrder("ENI", Side::Sell, 10, Decimal::parse("15"));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.data.accepted);
    EXPECT_EQ(result.data.operation, "CONFIRM");
    EXPECT_EQ(daemon_.receivedCount("CONFORD D102"), 1u);
}

TEST_F(LiveTradingClientTest, UnknownOrderAndCancelAll) {
    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);

    auto missing = client_->cancelOrder("D999");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error_kind, ErrorKind::OrderNotFound);

    auto all = client_->cancelAllOrders("ENI");
    ASSERT_TRUE(all.success) << all.error;
    ASSERT_EQ(all.data.size(), 2u);
    EXPECT_EQ(all.data[1].order_id, "D2");
}

TEST_F(LiveTradingClientTest, UnansweredRequestTimesOut) {
    config_.session.request_timeout_ms = 100;
    TradingClient client(config_);
    ASSERT_TRUE(client.connect().success);
    daemon_.silence();
    auto result = client.getAvailability();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
}

TEST_F(LiveTradingClientTest, PerCallTimeoutOverridesSessionDefault) {
    config_.session.request_timeout_ms = 5000;
    TradingClient client(config_);
    ASSERT_TRUE(client.connect().success);
    daemon_.silence();

    auto start = std::chrono::steady_clock::now();
    auto result = client.getAvailability(150ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2500ms);
}

// ---------------------------------------------------------------------------
// Session lifecycle and events
// ---------------------------------------------------------------------------

TEST_F(LiveTradingClientTest, ConnectFailureIsAResult) {
    config::ClientConfig config = config_;
    config.trading.port = test_support::unusedPort();
    config.session.connect_attempts = 2;
    config.session.retry_delay_ms = 10;
    TradingClient client(config);

    SessionGuard<TradingClient> session(client);
    EXPECT_FALSE(session.connected());
    EXPECT_EQ(session.result().error_kind, ErrorKind::Connection);
    EXPECT_EQ(client.connectionMetrics().failed_connections, 2u);

    auto account = client.getAccountInfo();
    EXPECT_EQ(account.error_kind, ErrorKind::NotConnected);
}

TEST_F(LiveTradingClientTest, PushedEventsReachHandlers) {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> seen;
    client_->onOrderUpdate([&](const OrderUpdate& u) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back("update " + u.order_id);
        cv.notify_all();
    });
    client_->onExecution([&](const Execution& e) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back("exec " + std::to_string(e.executed_quantity));
        cv.notify_all();
    });
    client_->onPortfolioUpdate([&](const PortfolioPosition& p) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back("stock " + p.symbol);
        cv.notify_all();
    });

    SessionGuard<TradingClient> session(*client_);
    ASSERT_TRUE(session);
    ASSERT_TRUE(daemon_.waitForClient());

    daemon_.push("ORDUPD;ENI;D100;2004;BUY;100;40;14.2;10:01:00");
    daemon_.push("EXEC;ENI;D100;BUY;40;14.2;40;60;10:01:00");
    daemon_.push("STOCK;ENI;10:01:00;240;90;0;14.13;12.5;14.2");

    std::unique_lock<std::mutex> lock(m);
    ASSERT_TRUE(cv.wait_for(lock, 3s, [&] { return seen.size() == 3; }));
    EXPECT_EQ(seen, (std::vector<std::string>{"update D100", "exec 40", "stock ENI"}));
}

TEST_F(LiveTradingClientTest, DisconnectFailsInFlightCall) {
    daemon_.silence();
    config_.session.request_timeout_ms = 5000;
    TradingClient client(config_);
    ASSERT_TRUE(client.connect().success);

    auto pending = std::async(std::launch::async, [&] { return client.getAccountInfo(); });
    ASSERT_TRUE(daemon_.waitForReceived("INFOACCOUNT", 1));
    client.disconnect();

    auto result = pending.get();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Transport);
    EXPECT_FALSE(client.isConnected());
}
