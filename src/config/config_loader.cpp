#include "config/config_loader.h"
#include "common/types.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <set>

namespace darwin::client::config {

namespace {

EndpointConfig parseEndpoint(const YAML::Node& node, EndpointConfig ep) {
    if (!node || !node.IsMap()) return ep;
    if (node["host"]) ep.host = node["host"].as<std::string>();
    if (node["port"]) ep.port = node["port"].as<uint16_t>();
    return ep;
}

SessionConfig parseSession(const YAML::Node& node) {
    SessionConfig sess;
    if (!node || !node.IsMap()) return sess;
    if (node["connect_timeout_ms"])    sess.connect_timeout_ms = node["connect_timeout_ms"].as<uint32_t>();
    if (node["connect_attempts"])      sess.connect_attempts = node["connect_attempts"].as<int>();
    if (node["retry_delay_ms"])        sess.retry_delay_ms = node["retry_delay_ms"].as<uint32_t>();
    if (node["request_timeout_ms"])    sess.request_timeout_ms = node["request_timeout_ms"].as<uint32_t>();
    if (node["heartbeat_interval_ms"]) sess.heartbeat_interval_ms = node["heartbeat_interval_ms"].as<uint32_t>();
    if (node["heartbeat_timeout_ms"])  sess.heartbeat_timeout_ms = node["heartbeat_timeout_ms"].as<uint32_t>();
    if (node["auto_confirm"])          sess.auto_confirm = node["auto_confirm"].as<bool>();
    return sess;
}

SimulationConfig parseSimulation(const YAML::Node& node) {
    SimulationConfig sim;
    if (!node || !node.IsMap()) return sim;
    if (node["enabled"])           sim.enabled = node["enabled"].as<bool>();
    if (node["account_code"])      sim.account_code = node["account_code"].as<std::string>();
    if (node["initial_liquidity"]) sim.initial_liquidity = node["initial_liquidity"].as<std::string>();
    return sim;
}

LoggingConfig parseLogging(const YAML::Node& node) {
    LoggingConfig log;
    if (!node || !node.IsMap()) return log;
    if (node["level"]) log.level = node["level"].as<std::string>();
    if (node["file"])  log.file = node["file"].as<std::string>();
    return log;
}

ClientConfig fromRoot(const YAML::Node& root) {
    ClientConfig config;
    if (!root || !root.IsMap()) return config;

    config.trading = parseEndpoint(root["trading"], config.trading);
    config.historical = parseEndpoint(root["historical"], config.historical);

    if (root["session"]) {
        config.session = parseSession(root["session"]);
    }

    if (root["simulation"]) {
        config.simulation = parseSimulation(root["simulation"]);
    }

    if (root["logging"]) {
        config.logging = parseLogging(root["logging"]);
    }

    return config;
}

} // anonymous namespace

void validateConfig(const ClientConfig& config) {
    // Validate endpoints
    if (config.trading.host.empty() || config.historical.host.empty()) {
        throw ConfigValidationError("Endpoint host cannot be empty");
    }
    if (config.trading.port == 0) {
        throw ConfigValidationError("trading.port must be non-zero");
    }
    if (config.historical.port == 0) {
        throw ConfigValidationError("historical.port must be non-zero");
    }

    // Validate session timing
    const auto& s = config.session;
    if (s.connect_timeout_ms == 0) {
        throw ConfigValidationError("connect_timeout_ms must be positive");
    }
    if (s.connect_attempts < 1) {
        throw ConfigValidationError("connect_attempts must be at least 1");
    }
    if (s.request_timeout_ms == 0) {
        throw ConfigValidationError("request_timeout_ms must be positive");
    }
    if (s.heartbeat_interval_ms == 0) {
        throw ConfigValidationError("heartbeat_interval_ms must be positive");
    }
    if (s.heartbeat_timeout_ms <= s.heartbeat_interval_ms) {
        throw ConfigValidationError("heartbeat_timeout_ms must be greater than heartbeat_interval_ms");
    }

    // Validate simulation ledger seed
    if (config.simulation.account_code.empty()) {
        throw ConfigValidationError("simulation.account_code cannot be empty");
    }
    Decimal liquidity;
    if (!Decimal::tryParse(config.simulation.initial_liquidity, liquidity)) {
        throw ConfigValidationError("simulation.initial_liquidity is not a decimal: " +
                                    config.simulation.initial_liquidity);
    }
    if (liquidity.isNegative()) {
        throw ConfigValidationError("simulation.initial_liquidity cannot be negative");
    }

    // Validate log level
    static const std::set<std::string> valid_levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (valid_levels.find(config.logging.level) == valid_levels.end()) {
        throw ConfigValidationError("Invalid log_level: " + config.logging.level +
                                    ". Must be one of: trace, debug, info, warn, error, critical, off");
    }
}

ClientConfig parseConfig(const std::string& yaml_text) {
    ClientConfig config = fromRoot(YAML::Load(yaml_text));
    validateConfig(config);
    return config;
}

ClientConfig loadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return ClientConfig{};
    }

    ClientConfig config = fromRoot(YAML::LoadFile(path));
    validateConfig(config);
    return config;
}

} // namespace darwin::client::config
