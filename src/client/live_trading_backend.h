#pragma once

#include "trading_backend.h"
#include "../config/client_config.h"

namespace darwin::client {

// Trading backend over the daemon's trading socket.
class LiveTradingBackend : public TradingBackend {
public:
    LiveTradingBackend(const config::EndpointConfig& endpoint, const config::SessionConfig& session);

    SessionMode mode() const override { return SessionMode::Live; }

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

    session::ConnectionManager& connection() { return connection_; }

private:
    session::ConnectionManager connection_;
};

} // namespace darwin::client
