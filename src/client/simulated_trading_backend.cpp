#include "client/simulated_trading_backend.h"

#include "common/errors.h"

namespace darwin::client {

SimulatedTradingBackend::SimulatedTradingBackend(std::string account_code,
                                                 Decimal initial_liquidity)
    : engine_(std::move(account_code), initial_liquidity) {
    engine_.setEventSink([this](const wire::Record& record) { events_.dispatch(record); });
}

void SimulatedTradingBackend::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_) return;
        connected_ = true;
        ++connects_;
        last_connect_time_ = Clock::formatLocal(Clock::SystemClock::now());
        transitions_.push_back({LivenessState::Disconnected, LivenessState::Connected,
                                last_connect_time_, 0.0});
        if (transitions_.size() > session::ConnectionManager::kMaxTransitionHistory) {
            transitions_.erase(transitions_.begin());
        }
    }
    engine_.reset();
}

void SimulatedTradingBackend::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return;
    connected_ = false;
    transitions_.push_back({LivenessState::Connected, LivenessState::Disconnected,
                            Clock::formatLocal(Clock::SystemClock::now()), 0.0});
    if (transitions_.size() > session::ConnectionManager::kMaxTransitionHistory) {
        transitions_.erase(transitions_.begin());
    }
}

LivenessState SimulatedTradingBackend::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ ? LivenessState::Connected : LivenessState::Disconnected;
}

session::ConnectionMetrics SimulatedTradingBackend::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    session::ConnectionMetrics m;
    m.state = connected_ ? LivenessState::Connected : LivenessState::Disconnected;
    m.connection_attempts = connects_;
    m.successful_connections = connects_;
    m.last_connect_time = last_connect_time_;
    m.recent_transitions = transitions_;
    m.uptime_percent = connected_ ? 100.0 : 0.0;
    return m;
}

void SimulatedTradingBackend::requireConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        throw NotConnectedError("simulated session is not connected");
    }
}

router::Reply SimulatedTradingBackend::placeOrder(const wire::Command& command, CallTimeout) {
    requireConnected();
    return engine_.execute(command);
}

router::Reply SimulatedTradingBackend::cancelOrder(const wire::Command& command, CallTimeout) {
    requireConnected();
    return engine_.execute(command);
}

router::Reply SimulatedTradingBackend::queryAccountInfo(CallTimeout) {
    requireConnected();
    return engine_.execute(wire::Command::queryAccount());
}

router::Reply SimulatedTradingBackend::queryPortfolio(CallTimeout) {
    requireConnected();
    return engine_.execute(wire::Command::queryPortfolio());
}

router::Reply SimulatedTradingBackend::queryOrders(const wire::Command& command, CallTimeout) {
    requireConnected();
    return engine_.execute(command);
}

router::Reply SimulatedTradingBackend::execute(const wire::Command& command, CallTimeout) {
    requireConnected();
    return engine_.execute(command);
}

router::SubscriptionId SimulatedTradingBackend::subscribe(const std::string& kind,
                                                          router::Subscriber fn) {
    return events_.subscribe(kind, std::move(fn));
}

bool SimulatedTradingBackend::unsubscribe(router::SubscriptionId id) {
    return events_.unsubscribe(id);
}

} // namespace darwin::client
