#pragma once

#include "../common/clock.h"
#include "../common/logger.h"
#include "../common/types.h"
#include "../config/client_config.h"
#include "../network/io_thread.h"
#include "../network/line_connection.h"
#include "../router/response_router.h"
#include "../wire/command.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace darwin::client::session {

struct LivenessTransition {
    LivenessState from;
    LivenessState to;
    std::string at;            // local wall-clock time of the change
    double seconds_in_from;    // how long the previous state lasted
};

struct ConnectionMetrics {
    LivenessState state = LivenessState::Disconnected;
    uint64_t connection_attempts = 0;
    uint64_t successful_connections = 0;
    uint64_t failed_connections = 0;
    std::string last_connect_time;  // empty until the first success
    std::string last_status_check;  // empty until the first heartbeat
    std::vector<LivenessTransition> recent_transitions; // oldest first
    double uptime_percent = 0.0;    // Connected or Degraded over time observed
};

// ---------------------------------------------------------------------------
// Owns the socket to one daemon endpoint.
//
// State machine:
//   Disconnected -> Connecting -> Connected <-> Degraded
//   Connecting | Connected | Degraded -> Disconnected
//
// A background io thread runs the read loop (decode, then route) and, when
// enabled, the heartbeat: a DARWINSTATUS query every heartbeat interval.
// No status record for heartbeat_timeout_ms moves Connected to Degraded;
// the next status record moves it back.
// ---------------------------------------------------------------------------
class ConnectionManager {
public:
    using StateCallback = std::function<void(LivenessState from, LivenessState to)>;

    static constexpr size_t kMaxTransitionHistory = 10;

    ConnectionManager(std::string name, config::EndpointConfig endpoint,
                      config::SessionConfig session, bool heartbeat);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Connect to the configured endpoint, trying connect_attempts times.
    // Idempotent when already connected. Throws ConnectionError.
    void connect();

    // Same, against an explicit target.
    void connect(const std::string& host, uint16_t port, uint32_t timeout_ms);

    // Queue one encoded line. Throws NotConnectedError unless Connected or
    // Degraded.
    void send(const std::string& line);

    // Encode, send and wait for the correlated reply.
    // Throws ValidationError before any I/O, then NotConnectedError,
    // TimeoutError or TransportError.
    router::Reply request(const wire::Command& command, CallTimeout timeout = std::nullopt);

    // Close the socket and cancel every pending call. Always safe.
    void disconnect();

    LivenessState state() const;
    bool isConnected() const;
    std::optional<Clock::SystemClock::time_point> lastHeartbeat() const;
    ConnectionMetrics metrics() const;

    void setStateCallback(StateCallback cb);

    router::ResponseRouter& router() { return router_; }
    const config::EndpointConfig& endpoint() const { return endpoint_; }

private:
    void onLine(uint64_t generation, const std::string& line);
    void onConnectionLost(uint64_t generation, const boost::system::error_code& ec);
    void scheduleHeartbeat(uint64_t generation);
    void onHeartbeatTimer(uint64_t generation);
    void noteStatusRecord();

    // Close the current connection if it is still `generation`.
    void teardown(uint64_t generation, const std::string& reason);

    // Caller holds mutex_. Returns false for an invalid transition.
    bool transitionLocked(LivenessState to);
    void notifyState(LivenessState from, LivenessState to);

    static bool isValidTransition(LivenessState from, LivenessState to);

    std::string name_;
    config::EndpointConfig endpoint_;
    config::SessionConfig session_;
    bool heartbeat_;

    network::IoThread io_;
    boost::asio::steady_timer heartbeat_timer_;
    router::ResponseRouter router_;

    mutable std::mutex mutex_;
    LivenessState state_ = LivenessState::Disconnected;
    network::LineConnection::Ptr connection_;
    uint64_t generation_ = 0;
    std::optional<Clock::SystemClock::time_point> last_heartbeat_;
    Clock::SteadyClock::time_point last_status_steady_;
    StateCallback state_callback_;

    // Metrics
    Clock::SteadyClock::time_point created_at_;
    Clock::SteadyClock::time_point state_since_;
    std::chrono::milliseconds up_time_{0};
    uint64_t attempts_ = 0;
    uint64_t successes_ = 0;
    uint64_t failures_ = 0;
    std::string last_connect_time_;
    std::string last_status_check_;
    std::deque<LivenessTransition> transitions_;

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> wire_logger_;
};

} // namespace darwin::client::session
