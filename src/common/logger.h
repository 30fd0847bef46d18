#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Logger categories matching client subsystems
// ---------------------------------------------------------------------------
namespace LogCategory {
    inline constexpr const char* WIRE    = "WIRE";
    inline constexpr const char* NETWORK = "NETWORK";
    inline constexpr const char* ROUTER  = "ROUTER";
    inline constexpr const char* SIM     = "SIM";
    inline constexpr const char* CLIENT  = "CLIENT";
} // namespace LogCategory

namespace config { struct LoggingConfig; }

// ---------------------------------------------------------------------------
// Get or create a named logger with standard formatting. Loggers created
// after configureLogging() pick up its level and optional file sink.
// ---------------------------------------------------------------------------
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Apply level and file sink to every logger, existing and future. Calling
// it again replaces the file rather than adding one; an empty file name
// closes it. Throws ConfigValidationError on an unknown level name.
void configureLogging(const config::LoggingConfig& logging);

} // namespace darwin::client
