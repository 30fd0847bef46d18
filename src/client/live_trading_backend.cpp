#include "client/live_trading_backend.h"

namespace darwin::client {

LiveTradingBackend::LiveTradingBackend(const config::EndpointConfig& endpoint,
                                       const config::SessionConfig& session)
    : connection_("trading", endpoint, session, /*heartbeat=*/true) {}

void LiveTradingBackend::connect() { connection_.connect(); }

void LiveTradingBackend::disconnect() { connection_.disconnect(); }

LivenessState LiveTradingBackend::state() const { return connection_.state(); }

session::ConnectionMetrics LiveTradingBackend::metrics() const { return connection_.metrics(); }

router::Reply LiveTradingBackend::placeOrder(const wire::Command& command, CallTimeout timeout) {
    return connection_.request(command, timeout);
}

router::Reply LiveTradingBackend::cancelOrder(const wire::Command& command, CallTimeout timeout) {
    return connection_.request(command, timeout);
}

router::Reply LiveTradingBackend::queryAccountInfo(CallTimeout timeout) {
    return connection_.request(wire::Command::queryAccount(), timeout);
}

router::Reply LiveTradingBackend::queryPortfolio(CallTimeout timeout) {
    return connection_.request(wire::Command::queryPortfolio(), timeout);
}

router::Reply LiveTradingBackend::queryOrders(const wire::Command& command, CallTimeout timeout) {
    return connection_.request(command, timeout);
}

router::Reply LiveTradingBackend::execute(const wire::Command& command, CallTimeout timeout) {
    return connection_.request(command, timeout);
}

router::SubscriptionId LiveTradingBackend::subscribe(const std::string& kind,
                                                     router::Subscriber fn) {
    return connection_.router().subscribe(kind, std::move(fn));
}

bool LiveTradingBackend::unsubscribe(router::SubscriptionId id) {
    return connection_.router().unsubscribe(id);
}

} // namespace darwin::client
