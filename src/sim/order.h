#pragma once
#include "../common/clock.h"
#include "../common/types.h"
#include <optional>
#include <string>

namespace darwin::client::sim {

struct Order {
    OrderId order_id;
    OrderId client_order_id;   // id the caller put on the command
    Symbol symbol;
    Side side = Side::Buy;
    OrderKind kind = OrderKind::Limit;
    Quantity quantity = 0;
    std::optional<Decimal> price;          // limit or trigger price
    std::optional<Decimal> trail;
    std::optional<Quantity> visible_quantity;
    Decimal signal_price;
    OrderStatus status = OrderStatus::Pending;
    Quantity filled_quantity = 0;
    Decimal avg_fill_price;
    Timestamp created;
    Timestamp updated;

    Quantity remainingQty() const { return quantity - filled_quantity; }
    bool isFullyFilled() const { return filled_quantity >= quantity; }
};

} // namespace darwin::client::sim
