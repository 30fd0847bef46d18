#include "session/connection_manager.h"

#include "common/errors.h"
#include "wire/codec.h"
#include <algorithm>
#include <thread>

namespace darwin::client::session {

ConnectionManager::ConnectionManager(std::string name, config::EndpointConfig endpoint,
                                     config::SessionConfig session, bool heartbeat)
    : name_(std::move(name))
    , endpoint_(std::move(endpoint))
    , session_(session)
    , heartbeat_(heartbeat)
    , io_(name_)
    , heartbeat_timer_(io_.context())
    , created_at_(Clock::SteadyClock::now())
    , state_since_(created_at_)
    , logger_(getLogger(LogCategory::NETWORK))
    , wire_logger_(getLogger(LogCategory::WIRE)) {}

ConnectionManager::~ConnectionManager() {
    disconnect();
    io_.stop();
}

// ---------------------------------------------------------------------------
// Connect / disconnect
// ---------------------------------------------------------------------------

void ConnectionManager::connect() {
    connect(endpoint_.host, endpoint_.port, session_.connect_timeout_ms);
}

void ConnectionManager::connect(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LivenessState::Connected || state_ == LivenessState::Degraded) {
            logger_->debug("{}: already connected", name_);
            return;
        }
        if (state_ == LivenessState::Connecting) {
            throw ConnectionError(name_ + ": connect already in progress");
        }
        transitionLocked(LivenessState::Connecting);
    }
    notifyState(LivenessState::Disconnected, LivenessState::Connecting);

    io_.start();

    const std::string target = host + ":" + std::to_string(port);
    const int attempts = std::max(1, session_.connect_attempts);
    network::LineConnection::Ptr conn;
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++attempts_;
        }
        try {
            conn = network::LineConnection::connect(io_.context(), host, port, timeout_ms);
            break;
        } catch (const ConnectionError& e) {
            last_error = e.what();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++failures_;
            }
            logger_->warn("{}: connect attempt {}/{} failed: {}", name_, attempt, attempts,
                          last_error);
            if (attempt < attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(session_.retry_delay_ms));
            }
        }
    }

    if (!conn) {
        LivenessState from;
        bool changed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            from = state_;
            changed = transitionLocked(LivenessState::Disconnected);
        }
        if (changed) notifyState(from, LivenessState::Disconnected);
        throw ConnectionError(name_ + ": could not connect to " + target + " after " +
                              std::to_string(attempts) + " attempt(s): " + last_error);
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LivenessState::Connecting) {
            // disconnect() ran while we were connecting.
            conn->close();
            throw ConnectionError(name_ + ": connect to " + target + " aborted by disconnect");
        }
        connection_ = conn;
        generation = ++generation_;
        ++successes_;
        last_connect_time_ = Clock::formatLocal(Clock::SystemClock::now());
        last_heartbeat_ = Clock::SystemClock::now();
        last_status_steady_ = Clock::SteadyClock::now();
        router_.open();
        transitionLocked(LivenessState::Connected);
    }
    notifyState(LivenessState::Connecting, LivenessState::Connected);

    conn->start(
        [this, generation](const std::string& line) { onLine(generation, line); },
        [this, generation](const boost::system::error_code& ec) {
            onConnectionLost(generation, ec);
        });

    if (heartbeat_ && session_.heartbeat_interval_ms > 0) {
        scheduleHeartbeat(generation);
    }
}

void ConnectionManager::disconnect() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
    }
    teardown(generation, "session disconnected");
}

void ConnectionManager::teardown(uint64_t generation, const std::string& reason) {
    network::LineConnection::Ptr conn;
    LivenessState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ == LivenessState::Disconnected) {
            return;
        }
        from = state_;
        conn = std::move(connection_);
        ++generation_;
        router_.close(reason);
        transitionLocked(LivenessState::Disconnected);
    }

    if (io_.running()) {
        boost::asio::post(io_.context(), [this] { heartbeat_timer_.cancel(); });
    }
    if (conn) conn->close();
    notifyState(from, LivenessState::Disconnected);
}

void ConnectionManager::onConnectionLost(uint64_t generation, const boost::system::error_code& ec) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
    }
    logger_->warn("{}: connection lost: {}", name_, ec.message());
    teardown(generation, "connection lost: " + ec.message());
}

// ---------------------------------------------------------------------------
// Send / request
// ---------------------------------------------------------------------------

void ConnectionManager::send(const std::string& line) {
    network::LineConnection::Ptr conn;
    LivenessState st;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        st = state_;
        conn = connection_;
    }
    if (!conn || (st != LivenessState::Connected && st != LivenessState::Degraded)) {
        throw NotConnectedError(name_ + ": not connected (" + toString(st) + ")");
    }
    if (st == LivenessState::Degraded) {
        logger_->warn("{}: sending while degraded: {}", name_, line);
    }
    conn->send(line);
}

router::Reply ConnectionManager::request(const wire::Command& command, CallTimeout timeout) {
    std::string line = wire::encode(command);
    auto expect = router::Expectation::forVerb(wire::commandSchema(command));
    return router_.call(expect, [&] { send(line); },
                        timeout.value_or(std::chrono::milliseconds(session_.request_timeout_ms)));
}

// ---------------------------------------------------------------------------
// Read loop
// ---------------------------------------------------------------------------

void ConnectionManager::onLine(uint64_t generation, const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
    }

    std::optional<wire::DecodeResult> result;
    try {
        result = wire::decode(line);
    } catch (const ParseError& e) {
        wire_logger_->warn("{}: skipping malformed line '{}': {}", name_, line, e.what());
        return;
    }

    if (auto* unknown = std::get_if<wire::UnknownRecordKind>(&*result)) {
        wire_logger_->debug("{}: skipping unknown record kind '{}'", name_, unknown->tag);
        return;
    }

    const wire::Record& record = std::get<wire::Record>(*result);
    if (record.kind() == wire::Tag::DARWIN_STATUS) {
        noteStatusRecord();
    }
    router_.dispatch(record);
}

// ---------------------------------------------------------------------------
// Heartbeat
// ---------------------------------------------------------------------------

void ConnectionManager::scheduleHeartbeat(uint64_t generation) {
    boost::asio::post(io_.context(), [this, generation] {
        heartbeat_timer_.expires_after(std::chrono::milliseconds(session_.heartbeat_interval_ms));
        heartbeat_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
            if (!ec) onHeartbeatTimer(generation);
        });
    });
}

void ConnectionManager::onHeartbeatTimer(uint64_t generation) {
    network::LineConnection::Ptr conn;
    bool degraded = false;
    int64_t silent_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !connection_) return;
        conn = connection_;
        last_status_check_ = Clock::formatLocal(Clock::SystemClock::now());
        silent_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::SteadyClock::now() - last_status_steady_).count();
        if (state_ == LivenessState::Connected &&
            silent_ms > static_cast<int64_t>(session_.heartbeat_timeout_ms)) {
            degraded = transitionLocked(LivenessState::Degraded);
        }
    }
    if (degraded) {
        logger_->warn("{}: no status reply for {} ms, session degraded", name_, silent_ms);
        notifyState(LivenessState::Connected, LivenessState::Degraded);
    }

    conn->send(wire::encode(wire::Command::queryStatus()));
    scheduleHeartbeat(generation);
}

void ConnectionManager::noteStatusRecord() {
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_heartbeat_ = Clock::SystemClock::now();
        last_status_steady_ = Clock::SteadyClock::now();
        if (state_ == LivenessState::Degraded) {
            recovered = transitionLocked(LivenessState::Connected);
        }
    }
    if (recovered) {
        logger_->info("{}: status reply received, session recovered", name_);
        notifyState(LivenessState::Degraded, LivenessState::Connected);
    }
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

bool ConnectionManager::isValidTransition(LivenessState from, LivenessState to) {
    switch (from) {
        case LivenessState::Disconnected:
            return to == LivenessState::Connecting;
        case LivenessState::Connecting:
            return to == LivenessState::Connected || to == LivenessState::Disconnected;
        case LivenessState::Connected:
            return to == LivenessState::Degraded || to == LivenessState::Disconnected;
        case LivenessState::Degraded:
            return to == LivenessState::Connected || to == LivenessState::Disconnected;
    }
    return false;
}

bool ConnectionManager::transitionLocked(LivenessState to) {
    if (state_ == to) return false;
    if (!isValidTransition(state_, to)) {
        logger_->error("{}: invalid state transition {} -> {}", name_, toString(state_),
                       toString(to));
        return false;
    }

    auto now = Clock::SteadyClock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - state_since_);
    if (state_ == LivenessState::Connected || state_ == LivenessState::Degraded) {
        up_time_ += elapsed;
    }

    transitions_.push_back(LivenessTransition{
        state_, to, Clock::formatLocal(Clock::SystemClock::now()),
        static_cast<double>(elapsed.count()) / 1000.0});
    if (transitions_.size() > kMaxTransitionHistory) {
        transitions_.pop_front();
    }

    logger_->info("{}: {} -> {}", name_, toString(state_), toString(to));
    state_ = to;
    state_since_ = now;
    return true;
}

void ConnectionManager::notifyState(LivenessState from, LivenessState to) {
    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = state_callback_;
    }
    if (cb) cb(from, to);
}

void ConnectionManager::setStateCallback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_callback_ = std::move(cb);
}

LivenessState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionManager::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == LivenessState::Connected || state_ == LivenessState::Degraded;
}

std::optional<Clock::SystemClock::time_point> ConnectionManager::lastHeartbeat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_heartbeat_;
}

ConnectionMetrics ConnectionManager::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionMetrics m;
    m.state = state_;
    m.connection_attempts = attempts_;
    m.successful_connections = successes_;
    m.failed_connections = failures_;
    m.last_connect_time = last_connect_time_;
    m.last_status_check = last_status_check_;
    m.recent_transitions.assign(transitions_.begin(), transitions_.end());

    auto now = Clock::SteadyClock::now();
    auto up = up_time_;
    if (state_ == LivenessState::Connected || state_ == LivenessState::Degraded) {
        up += std::chrono::duration_cast<std::chrono::milliseconds>(now - state_since_);
    }
    auto observed = std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at_);
    if (observed.count() > 0) {
        m.uptime_percent = 100.0 * static_cast<double>(up.count()) /
                           static_cast<double>(observed.count());
    }
    return m;
}

} // namespace darwin::client::session
