#include <gtest/gtest.h>
#include "client/historical_client.h"
#include "client/session_guard.h"
#include "common/fake_daemon.h"
#include "config/client_config.h"
#include <chrono>
#include <string>
#include <vector>

using namespace darwin::client;
using darwin::client::test_support::FakeDaemon;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> historicalDaemon(const std::string& line) {
    if (line == "DDAY ENI 3") {
        return {"CANDLE;ENI;2024-03-01 00:00:00;14;13.5;14.5;14.2;1000",
                "CANDLE;ENI;2024-03-04 00:00:00;14.2;14;14.6;14.4;1200",
                "CANDLE;ENI;2024-03-05 00:00:00;14.4;14.1;14.5;14.3;900",
                "END;DDAY;3"};
    }
    if (line == "CANDLE ENI 1 300") {
        return {"CANDLE;ENI;2024-03-05 09:00:00;14.4;14.3;14.45;14.35;100",
                "CANDLE;ENI;2024-03-05 09:05:00;14.35;14.3;14.4;14.32;80",
                "END;CANDLE;2"};
    }
    if (line == "TBT ENI 1") {
        return {"TBT;ENI;2024-03-01 09:00:01;14.25;500",
                "TBT;ENI;2024-03-01 09:00:02;14.26;100",
                "END;TBT;2"};
    }
    if (line == "CANDLEDATE ENI 3600 20240301 20240302 FALSE") {
        return {"CANDLE;ENI;2024-03-01 09:00:00;14;13.9;14.1;14.05;5000", "END;CANDLEDATE;1"};
    }
    if (line == "DDAY XYZ 3") return {"END;DDAY;0"};
    if (line == "DDAY BAD 3") return {"ERR;DDAY;1500"};
    return {};
}

} // namespace

class HistoricalClientTest : public ::testing::Test {
protected:
    HistoricalClientTest() {
        daemon_.setHandler(&historicalDaemon);
        session_.connect_attempts = 1;
        session_.request_timeout_ms = 2000;
        client_ = std::make_unique<HistoricalClient>(
            config::EndpointConfig{"127.0.0.1", daemon_.port()}, session_);
    }

    FakeDaemon daemon_;
    config::SessionConfig session_;
    std::unique_ptr<HistoricalClient> client_;
};

TEST_F(HistoricalClientTest, DailyCandles) {
    SessionGuard<HistoricalClient> session(*client_);
    ASSERT_TRUE(session) << session.result().error;

    auto result = client_->dailyCandles("ENI", 3);
    ASSERT_TRUE(result.success) << result.error;
    const CandleSeries& candles = result.data;
    ASSERT_EQ(candles.size(), 3u);

    Candle first = candles.at(0);
    EXPECT_EQ(first.time, Timestamp::fromDateTime(2024, 3, 1, 0, 0, 0));
    EXPECT_EQ(first.open, Decimal::parse("14"));
    EXPECT_EQ(first.low, Decimal::parse("13.5"));
    EXPECT_EQ(first.high, Decimal::parse("14.5"));
    EXPECT_EQ(first.close, Decimal::parse("14.2"));
    EXPECT_EQ(first.volume, 1000);

    // The series can be walked more than once.
    Quantity volume = 0;
    for (const Candle& c : candles) volume += c.volume;
    for (const Candle& c : candles) volume += c.volume;
    EXPECT_EQ(volume, 2 * 3100);
    EXPECT_EQ(candles.toVector().back().close, Decimal::parse("14.3"));
}

TEST_F(HistoricalClientTest, IntradayCandlesAndTicks) {
    SessionGuard<HistoricalClient> session(*client_);
    ASSERT_TRUE(session);

    auto intraday = client_->intradayCandles("ENI", 1, 300);
    ASSERT_TRUE(intraday.success) << intraday.error;
    EXPECT_EQ(intraday.data.size(), 2u);

    auto ticks = client_->ticks("ENI", 1);
    ASSERT_TRUE(ticks.success) << ticks.error;
    std::vector<Tick> all = ticks.data.toVector();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].price, Decimal::parse("14.25"));
    EXPECT_EQ(all[0].size, 500);
    EXPECT_LT(all[0].time, all[1].time);
}

TEST_F(HistoricalClientTest, CandleRangeEncodesDates) {
    SessionGuard<HistoricalClient> session(*client_);
    ASSERT_TRUE(session);

    auto result = client_->candleRange("ENI", Timestamp::fromDate(2024, 3, 1),
                                       Timestamp::fromDate(2024, 3, 2), 3600, false);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.data.size(), 1u);
    EXPECT_EQ(daemon_.receivedCount("CANDLEDATE ENI 3600 20240301 20240302 FALSE"), 1u);
}

TEST_F(HistoricalClientTest, EmptyAndFailedQueries) {
    SessionGuard<HistoricalClient> session(*client_);
    ASSERT_TRUE(session);

    auto empty = client_->dailyCandles("XYZ", 3);
    ASSERT_TRUE(empty.success);
    EXPECT_TRUE(empty.data.empty());
    EXPECT_EQ(empty.data.begin(), empty.data.end());

    auto failed = client_->dailyCandles("BAD", 3);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error_kind, ErrorKind::Remote);

    auto invalid = client_->candleRange("ENI", Timestamp::fromDate(2024, 3, 2),
                                        Timestamp::fromDate(2024, 3, 1), 60, false);
    EXPECT_EQ(invalid.error_kind, ErrorKind::Validation);
    EXPECT_EQ(client_->ticks("ENI", 0).error_kind, ErrorKind::Validation);
}

TEST_F(HistoricalClientTest, PerCallTimeout) {
    SessionGuard<HistoricalClient> session(*client_);
    ASSERT_TRUE(session);

    // The daemon never answers this request; the fixture default is 2000 ms.
    auto start = std::chrono::steady_clock::now();
    auto result = client_->dailyCandles("SILENT", 3, 100ms);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
}

TEST_F(HistoricalClientTest, NoHeartbeatOnTheHistoricalSocket) {
    session_.heartbeat_interval_ms = 20;
    session_.heartbeat_timeout_ms = 40;
    HistoricalClient client(config::EndpointConfig{"127.0.0.1", daemon_.port()}, session_);
    ASSERT_TRUE(client.connect().success);
    ASSERT_TRUE(client.dailyCandles("ENI", 3).success);
    EXPECT_EQ(daemon_.receivedCount("DARWINSTATUS"), 0u);
    EXPECT_EQ(client.connectionMetrics().state, LivenessState::Connected);
}

TEST_F(HistoricalClientTest, RequiresAConnection) {
    auto result = client_->dailyCandles("ENI", 3);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NotConnected);
    EXPECT_FALSE(client_->isConnected());
}
