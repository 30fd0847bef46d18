#pragma once

#include "record.h"
#include "../common/types.h"
#include <map>
#include <optional>
#include <string>

namespace darwin::client::wire {

enum class CommandKind : uint8_t {
    PlaceOrder,
    CancelOrder,
    CancelAll,
    ModifyOrder,
    ConfirmOrder,
    QueryAccount,
    QueryAvailability,
    QueryPortfolio,
    QueryPosition,
    QueryOrders,
    QueryPendingOrders,
    QueryStatus,
    DailyCandles,
    IntradayCandles,
    CandleRange,
    Ticks
};

const char* toString(CommandKind kind);

// Parameters of a new order. price is required for every kind but market,
// trail only for trailing-stop, visible_quantity only for iceberg.
struct OrderRequest {
    OrderId order_id;
    Symbol symbol;
    Side side = Side::Buy;
    OrderKind kind = OrderKind::Limit;
    Quantity quantity = 0;
    std::optional<Decimal> price;
    std::optional<Decimal> trail;
    std::optional<Quantity> visible_quantity;
};

// ---------------------------------------------------------------------------
// An outbound intent: kind plus named, typed parameters.
// Side and order kind travel as their text names ("BUY", "LIMIT").
// ---------------------------------------------------------------------------
struct Command {
    CommandKind kind = CommandKind::QueryStatus;
    std::map<std::string, FieldValue> params;

    bool has(const std::string& name) const { return params.count(name) != 0; }

    // Typed parameter access; throw ValidationError when missing or mistyped.
    const std::string& str(const std::string& name) const;
    int64_t integer(const std::string& name) const;
    Decimal decimal(const std::string& name) const;
    Timestamp timestamp(const std::string& name) const;

    // Order fields, for PlaceOrder commands.
    Side side() const;
    OrderKind orderKind() const;

    bool operator==(const Command& o) const { return kind == o.kind && params == o.params; }
    bool operator!=(const Command& o) const { return !(*this == o); }

    // Builders
    static Command placeOrder(const OrderRequest& request);
    static Command cancelOrder(const OrderId& order_id);
    static Command cancelAll(const Symbol& symbol);
    static Command modifyOrder(const OrderId& order_id, Decimal price,
                               std::optional<Decimal> signal_price = std::nullopt);
    static Command confirmOrder(const OrderId& order_id);
    static Command queryAccount();
    static Command queryAvailability();
    static Command queryPortfolio();
    static Command queryPosition(const Symbol& symbol);
    static Command queryOrders(const Symbol& symbol = {});
    static Command queryPendingOrders();
    static Command queryStatus();
    static Command dailyCandles(const Symbol& symbol, int64_t days);
    static Command intradayCandles(const Symbol& symbol, int64_t days, int64_t period_seconds);
    static Command candleRange(const Symbol& symbol, Timestamp from, Timestamp to,
                               int64_t period_seconds, bool include_after_hours);
    static Command ticks(const Symbol& symbol, int64_t days);
};

// Check parameter presence, types and ranges. Throws ValidationError.
void validateCommand(const Command& command);

} // namespace darwin::client::wire
