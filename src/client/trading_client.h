#pragma once

#include "domain.h"
#include "trading_backend.h"
#include "../common/logger.h"
#include "../common/result.h"
#include "../config/client_config.h"
#include "../wire/command.h"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace darwin::client {

namespace sim { class SimulationEngine; }

// ---------------------------------------------------------------------------
// Trading facade over one session, live or simulated.
//
// Every operation returns a Result: transport, protocol and validation
// failures come back as success == false; a business rejection by the
// daemon (TRADERR) is a successful call whose OrderAck has accepted ==
// false. Nothing here throws ClientError.
//
// Synchronous calls block the calling thread for at most their timeout,
// which defaults to session.request_timeout_ms. Event callbacks run on the
// session's read thread (or the thread that triggered a simulated fill) and
// must not make blocking calls on this client.
// ---------------------------------------------------------------------------
class TradingClient {
public:
    using OrderUpdateHandler = std::function<void(const OrderUpdate&)>;
    using ExecutionHandler = std::function<void(const Execution&)>;
    using PortfolioHandler = std::function<void(const PortfolioPosition&)>;

    // Mode from simulation.enabled. Throws ConfigValidationError.
    explicit TradingClient(const config::ClientConfig& config);
    TradingClient(const config::ClientConfig& config, SessionMode mode);

    // Injected backend, for tests and custom transports.
    explicit TradingClient(std::unique_ptr<TradingBackend> backend,
                           config::SessionConfig session = {});

    // Disconnects.
    ~TradingClient();

    TradingClient(const TradingClient&) = delete;
    TradingClient& operator=(const TradingClient&) = delete;

    Result<Empty> connect();
    Result<Empty> disconnect();

    SessionMode mode() const { return backend_->mode(); }
    LivenessState state() const { return backend_->state(); }
    bool isConnected() const;

    // --- Orders ---

    // An empty order_id is filled in with a generated ORD<epoch-ms>-<seq>.
    Result<OrderAck> placeOrder(wire::OrderRequest request, CallTimeout timeout = std::nullopt);
    Result<OrderAck> placeMarketOrder(const Symbol& symbol, Side side, Quantity quantity,
                                      CallTimeout timeout = std::nullopt);
    Result<OrderAck> placeLimitOrder(const Symbol& symbol, Side side, Quantity quantity,
                                     Decimal price, CallTimeout timeout = std::nullopt);
    Result<OrderAck> placeStopOrder(const Symbol& symbol, Side side, Quantity quantity,
                                    Decimal stop_price, CallTimeout timeout = std::nullopt);
    Result<OrderAck> placeTrailingStopOrder(const Symbol& symbol, Side side, Quantity quantity,
                                            Decimal stop_price, Decimal trail,
                                            CallTimeout timeout = std::nullopt);
    Result<OrderAck> placeIcebergOrder(const Symbol& symbol, Side side, Quantity quantity,
                                       Decimal price, Quantity visible_quantity,
                                       CallTimeout timeout = std::nullopt);

    Result<OrderAck> cancelOrder(const OrderId& order_id, CallTimeout timeout = std::nullopt);
    Result<std::vector<OrderAck>> cancelAllOrders(const Symbol& symbol,
                                                  CallTimeout timeout = std::nullopt);
    Result<OrderAck> modifyOrder(const OrderId& order_id, Decimal price,
                                 std::optional<Decimal> signal_price = std::nullopt,
                                 CallTimeout timeout = std::nullopt);
    Result<OrderAck> confirmOrder(const OrderId& order_id, CallTimeout timeout = std::nullopt);

    // --- Queries ---

    Result<AccountSnapshot> getAccountInfo(CallTimeout timeout = std::nullopt);
    Result<Availability> getAvailability(CallTimeout timeout = std::nullopt);
    Result<std::vector<PortfolioPosition>> getPortfolio(CallTimeout timeout = std::nullopt);
    Result<std::optional<PortfolioPosition>> getPosition(const Symbol& symbol,
                                                         CallTimeout timeout = std::nullopt);
    Result<std::vector<OrderInfo>> getOrders(CallTimeout timeout = std::nullopt);
    Result<std::vector<OrderInfo>> getOrdersForSymbol(const Symbol& symbol,
                                                      CallTimeout timeout = std::nullopt);
    Result<std::vector<OrderInfo>> getPendingOrders(CallTimeout timeout = std::nullopt);
    Result<DarwinStatus> getDarwinStatus(CallTimeout timeout = std::nullopt);

    session::ConnectionMetrics connectionMetrics() const { return backend_->metrics(); }

    // --- Events ---

    router::SubscriptionId onOrderUpdate(OrderUpdateHandler handler);
    router::SubscriptionId onExecution(ExecutionHandler handler);
    router::SubscriptionId onPortfolioUpdate(PortfolioHandler handler);
    router::SubscriptionId subscribe(const std::string& kind, router::Subscriber fn);
    bool unsubscribe(router::SubscriptionId id);

    // --- Simulation only; fail with ValidationError in live mode ---

    // Price defaults to the order's limit price, quantity to the remainder.
    Result<OrderInfo> simulateOrderExecution(const OrderId& order_id,
                                             std::optional<Decimal> executed_price = std::nullopt,
                                             std::optional<Quantity> executed_quantity = std::nullopt);
    // Adds quantity to the position in symbol, or opens it. A positive
    // quantity replaces the average price with avg_price; gain is reset.
    Result<Empty> addSimulatedPosition(const Symbol& symbol, Quantity quantity, Decimal avg_price);
    // success with data == false when no position was held.
    Result<bool> removeSimulatedPosition(const Symbol& symbol);
    Result<AccountSnapshot> updateSimulatedAccount(std::optional<Decimal> liquidity,
                                                   std::optional<Decimal> equity = std::nullopt);

    TradingBackend& backend() { return *backend_; }

private:
    template <typename T, typename Fn>
    Result<T> guarded(const char* operation, Fn&& fn);

    OrderId nextOrderId();
    OrderAck submitOrderCommand(const wire::Command& command, bool allow_confirm,
                                CallTimeout timeout);

    // Engine of a connected simulated session. Throws ValidationError in
    // live mode, NotConnectedError when disconnected.
    sim::SimulationEngine& simEngine();

    std::vector<OrderInfo> orderList(const wire::Command& command, CallTimeout timeout);

    std::unique_ptr<TradingBackend> backend_;
    config::SessionConfig session_;
    std::atomic<uint64_t> order_seq_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace darwin::client
