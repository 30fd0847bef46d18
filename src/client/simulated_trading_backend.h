#pragma once

#include "trading_backend.h"
#include "../sim/simulation_engine.h"
#include <mutex>
#include <string>

namespace darwin::client {

// Trading backend answered in-process by a SimulationEngine. Events the
// engine emits are fanned out through a router, as a live read loop would.
class SimulatedTradingBackend : public TradingBackend {
public:
    SimulatedTradingBackend(std::string account_code, Decimal initial_liquidity);

    SessionMode mode() const override { return SessionMode::Simulation; }

    // Starts a fresh simulated session: the engine is reset on every
    // transition to connected.
    void connect() override;
    void disconnect() override;
    LivenessState state() const override;
    session::ConnectionMetrics metrics() const override;

    router::Reply placeOrder(const wire::Command& command, CallTimeout timeout) override;
    router::Reply cancelOrder(const wire::Command& command, CallTimeout timeout) override;
    router::Reply queryAccountInfo(CallTimeout timeout) override;
    router::Reply queryPortfolio(CallTimeout timeout) override;
    router::Reply queryOrders(const wire::Command& command, CallTimeout timeout) override;
    router::Reply execute(const wire::Command& command, CallTimeout timeout) override;

    router::SubscriptionId subscribe(const std::string& kind, router::Subscriber fn) override;
    bool unsubscribe(router::SubscriptionId id) override;

    sim::SimulationEngine& engine() { return engine_; }

private:
    // Throws NotConnectedError unless connected.
    void requireConnected() const;

    sim::SimulationEngine engine_;
    router::ResponseRouter events_;

    mutable std::mutex mutex_;
    bool connected_ = false;
    uint64_t connects_ = 0;
    std::string last_connect_time_;
    std::vector<session::LivenessTransition> transitions_;
};

} // namespace darwin::client
