#include <gtest/gtest.h>
#include "config/config_loader.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace darwin::client::config;

TEST(ConfigLoaderTest, DefaultsWhenFileIsMissing) {
    ClientConfig config = loadConfig("/nonexistent/darwin_client.yaml");
    EXPECT_EQ(config.trading.host, "127.0.0.1");
    EXPECT_EQ(config.trading.port, 10002);
    EXPECT_EQ(config.historical.port, 10003);
    EXPECT_FALSE(config.simulation.enabled);
    EXPECT_TRUE(config.session.auto_confirm);
    EXPECT_NO_THROW(validateConfig(config));
}

TEST(ConfigLoaderTest, ParsesEverySection) {
    ClientConfig config = parseConfig(R"(
trading:
  host: 10.0.0.5
  port: 12002
historical:
  port: 12003
session:
  connect_timeout_ms: 1500
  connect_attempts: 5
  retry_delay_ms: 250
  request_timeout_ms: 800
  heartbeat_interval_ms: 1000
  heartbeat_timeout_ms: 4000
  auto_confirm: false
simulation:
  enabled: true
  account_code: PAPER1
  initial_liquidity: "25000.50"
logging:
  level: debug
  file: /tmp/darwin.log
)");

    EXPECT_EQ(config.trading.host, "10.0.0.5");
    EXPECT_EQ(config.trading.port, 12002);
    EXPECT_EQ(config.historical.host, "127.0.0.1");
    EXPECT_EQ(config.historical.port, 12003);
    EXPECT_EQ(config.session.connect_timeout_ms, 1500u);
    EXPECT_EQ(config.session.connect_attempts, 5);
    EXPECT_EQ(config.session.retry_delay_ms, 250u);
    EXPECT_EQ(config.session.request_timeout_ms, 800u);
    EXPECT_EQ(config.session.heartbeat_interval_ms, 1000u);
    EXPECT_EQ(config.session.heartbeat_timeout_ms, 4000u);
    EXPECT_FALSE(config.session.auto_confirm);
    EXPECT_TRUE(config.simulation.enabled);
    EXPECT_EQ(config.simulation.account_code, "PAPER1");
    EXPECT_EQ(config.simulation.initial_liquidity, "25000.50");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "/tmp/darwin.log");
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    const std::string path = "darwin_client_test_config.yaml";
    {
        std::ofstream out(path);
        out << "simulation:\n  enabled: true\n";
    }
    ClientConfig config = loadConfig(path);
    std::remove(path.c_str());
    EXPECT_TRUE(config.simulation.enabled);
    EXPECT_EQ(config.simulation.initial_liquidity, "10000");
}

TEST(ConfigLoaderTest, RejectsInconsistentValues) {
    EXPECT_THROW(parseConfig("trading:\n  port: 0\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("historical:\n  host: \"\"\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("session:\n  connect_attempts: 0\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("session:\n  request_timeout_ms: 0\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("session:\n  heartbeat_interval_ms: 5000\n  heartbeat_timeout_ms: 5000\n"),
                 ConfigValidationError);
    EXPECT_THROW(parseConfig("simulation:\n  initial_liquidity: lots\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("simulation:\n  initial_liquidity: \"-1\"\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("simulation:\n  account_code: \"\"\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("logging:\n  level: verbose\n"), ConfigValidationError);
}

TEST(ConfigLoaderTest, ValidateCatchesProgrammaticMistakes) {
    ClientConfig config;
    config.session.heartbeat_timeout_ms = config.session.heartbeat_interval_ms - 1;
    EXPECT_THROW(validateConfig(config), ConfigValidationError);
}
