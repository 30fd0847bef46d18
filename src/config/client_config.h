#pragma once
#include <string>
#include <cstdint>

namespace darwin::client::config {

struct EndpointConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
};

struct SessionConfig {
    uint32_t connect_timeout_ms = 3000;
    int connect_attempts = 3;
    uint32_t retry_delay_ms = 500;
    uint32_t request_timeout_ms = 3000;
    uint32_t heartbeat_interval_ms = 5000;
    uint32_t heartbeat_timeout_ms = 10000; // no status reply for this long => Degraded
    bool auto_confirm = true;              // answer TRADCONFIRM with CONFORD
};

struct SimulationConfig {
    bool enabled = false;
    std::string account_code = "SIM1234";
    std::string initial_liquidity = "10000"; // decimal text, parsed without rounding
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                        // empty => console only
};

struct ClientConfig {
    EndpointConfig trading{"127.0.0.1", 10002};
    EndpointConfig historical{"127.0.0.1", 10003};
    SessionConfig session;
    SimulationConfig simulation;
    LoggingConfig logging;
};

} // namespace darwin::client::config
