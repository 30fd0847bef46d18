#pragma once

#include "../common/types.h"
#include "../router/response_router.h"
#include "../session/connection_manager.h"
#include "../wire/command.h"

namespace darwin::client {

// ---------------------------------------------------------------------------
// Capability set behind the trading facade. Live and simulated variants
// answer with the same Reply shapes, so the facade converts records the
// same way on both paths. Chosen at construction, never mixed.
//
// Every operation throws the ClientError taxonomy; the facade converts.
// The timeout bounds the wait for a live reply; simulated calls answer
// immediately and ignore it.
// ---------------------------------------------------------------------------
class TradingBackend {
public:
    virtual ~TradingBackend() = default;

    virtual SessionMode mode() const = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual LivenessState state() const = 0;
    virtual session::ConnectionMetrics metrics() const = 0;

    virtual router::Reply placeOrder(const wire::Command& command, CallTimeout timeout) = 0;
    virtual router::Reply cancelOrder(const wire::Command& command, CallTimeout timeout) = 0;
    virtual router::Reply queryAccountInfo(CallTimeout timeout) = 0;
    virtual router::Reply queryPortfolio(CallTimeout timeout) = 0;
    virtual router::Reply queryOrders(const wire::Command& command, CallTimeout timeout) = 0;

    // Remaining trading vocabulary: cancel-all, modify, confirm,
    // availability, position, pending orders, status.
    virtual router::Reply execute(const wire::Command& command, CallTimeout timeout) = 0;

    // Asynchronous records (ORDUPD, EXEC, unsolicited STOCK / DARWIN_STATUS).
    virtual router::SubscriptionId subscribe(const std::string& kind, router::Subscriber fn) = 0;
    virtual bool unsubscribe(router::SubscriptionId id) = 0;
};

} // namespace darwin::client
