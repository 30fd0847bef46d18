#pragma once
#include "order.h"
#include "position_ledger.h"
#include "../common/logger.h"
#include "../router/response_router.h"
#include "../wire/command.h"
#include "../wire/record.h"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace darwin::client::sim {

// ---------------------------------------------------------------------------
// In-process stand-in for the daemon.
//
// Accepts the trading command vocabulary and answers with the records a
// live daemon would send: TRADOK / TRADERR for order operations, INFOACCOUNT,
// AVAILABILITY, STOCK and ORDER lists (END-terminated, or ERR 1018 / 1019
// when empty), DARWIN_STATUS. Fills only happen through
// simulateOrderExecution(), which emits ORDUPD then EXEC to the event sink.
//
// Every public operation is serialized on one mutex. Events are queued
// under that mutex and delivered outside it, in the order they were
// produced, so a sink may call back into the engine.
// ---------------------------------------------------------------------------
class SimulationEngine {
public:
    using EventSink = std::function<void(const wire::Record&)>;

    SimulationEngine(std::string account_code, Decimal initial_liquidity);

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    void setEventSink(EventSink sink);

    // Drop all orders and positions and restore the initial account.
    void reset();

    // Answer any trading command with the reply a live session would
    // receive. Throws ValidationError, OrderNotFoundError, InvalidStateError.
    router::Reply execute(const wire::Command& command);

    // Accept a validated PlaceOrder command: TRADOK with status pending, or
    // TRADERR 1007 when a priced buy exceeds the available liquidity.
    wire::Record placeOrder(const wire::Command& command);

    // Fill some or all of an order. Quantity defaults to the remaining
    // quantity, price to the order's limit price (required for market
    // orders). Throws OrderNotFoundError, InvalidStateError for a filled,
    // cancelled or rejected order, ValidationError for a bad quantity or
    // price. Returns the order after the fill.
    Order simulateOrderExecution(const OrderId& order_id,
                                 std::optional<Decimal> executed_price = std::nullopt,
                                 std::optional<Quantity> executed_quantity = std::nullopt);

    // Cancel the unfilled remainder. Throws OrderNotFoundError,
    // InvalidStateError when the order is already terminal.
    wire::Record cancelOrder(const OrderId& order_id);

    // Cancel every open order of a symbol; one TRADOK each.
    std::vector<wire::Record> cancelAll(const Symbol& symbol);

    // Reprice an open, priced order.
    wire::Record modifyOrder(const OrderId& order_id, Decimal price,
                             std::optional<Decimal> signal_price = std::nullopt);

    // Query records, same shapes as the daemon's.
    wire::Record accountRecord() const;
    wire::Record availabilityRecord() const;
    wire::Record statusRecord() const;
    std::vector<wire::Record> portfolioRecords() const;
    std::optional<wire::Record> positionRecord(const Symbol& symbol) const;
    std::vector<wire::Record> orderRecords(const Symbol& symbol = {}, bool pending_only = false) const;

    // Scaffolding for tests and strategy development.
    void addPosition(const Symbol& symbol, Quantity quantity, Decimal avg_price,
                     Decimal gain = Decimal{});
    bool removePosition(const Symbol& symbol);
    void updateAccount(std::optional<Decimal> liquidity, std::optional<Decimal> equity);

    // Direct state inspection.
    std::optional<Order> order(const OrderId& order_id) const;
    std::optional<Position> position(const Symbol& symbol) const;
    std::vector<Order> orders() const;
    Decimal liquidity() const;
    Decimal equity() const;
    const std::string& accountCode() const { return account_code_; }

private:
    // Callers hold mutex_.
    Order& findOrderLocked(const OrderId& order_id);
    wire::Record placeOrderLocked(const wire::Command& command);
    wire::Record cancelOrderLocked(Order& order, const std::string& command_line);
    wire::Record orderUpdateLocked(const Order& order) const;
    wire::Record orderRecordLocked(const Order& order) const;
    wire::Record stockRecordLocked(const Position& pos) const;
    Decimal equityLocked() const;
    void queueEvent(wire::Record record);

    // Deliver queued events; call without holding mutex_.
    void drainEvents();

    std::string account_code_;
    Decimal initial_liquidity_;

    mutable std::mutex mutex_;
    std::map<OrderId, Order> orders_;
    std::vector<OrderId> order_sequence_;   // insertion order for listings
    PositionLedger ledger_;
    Decimal liquidity_;
    Decimal realized_gain_;
    std::optional<Decimal> equity_override_;
    uint64_t next_order_id_ = 1;

    EventSink sink_;
    std::deque<wire::Record> outbox_;
    bool draining_ = false;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace darwin::client::sim
