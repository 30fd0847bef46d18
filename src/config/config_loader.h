#pragma once
#include "client_config.h"
#include <string>
#include <stdexcept>

namespace darwin::client::config {

class ConfigValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Load client configuration from a YAML file.
// If the file does not exist, returns the default configuration
// (trading on 127.0.0.1:10002, historical on 127.0.0.1:10003, live mode).
ClientConfig loadConfig(const std::string& path);

// Parse configuration from YAML text. Used by loadConfig and tests.
ClientConfig parseConfig(const std::string& yaml_text);

// Validate a ClientConfig, throwing ConfigValidationError on problems.
void validateConfig(const ClientConfig& config);

} // namespace darwin::client::config
