#pragma once

#include "../common/clock.h"
#include "../common/types.h"
#include "../session/connection_manager.h"
#include <string>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Typed payloads returned by the facades. Each is a projection of one
// record kind; nothing here is cached beyond the call that produced it.
// ---------------------------------------------------------------------------

struct AccountSnapshot {
    Timestamp time;
    std::string account_code;
    Decimal liquidity;
    Decimal gain;
    Decimal open_pnl;
    Decimal equity;
    std::string environment;
};

struct Availability {
    Timestamp time;
    Decimal liquidity;
    Decimal margin_liquidity;
    Decimal buying_power;
};

struct PortfolioPosition {
    Symbol symbol;
    Timestamp time;
    Quantity quantity = 0;             // held in portfolio
    Quantity quantity_darwin = 0;      // acquired today through the platform
    Quantity quantity_negotiation = 0; // in open orders
    Decimal avg_price;
    Decimal gain;
    Decimal last_price;
};

struct OrderInfo {
    Symbol symbol;
    Timestamp time;
    OrderId order_id;
    Side side = Side::Buy;
    Decimal price;
    Decimal signal_price;
    Quantity quantity = 0;
    OrderStatus status = OrderStatus::Pending;
    Quantity filled_quantity = 0;
    Decimal avg_price;
    std::string kind;

    Quantity remainingQty() const { return quantity - filled_quantity; }
};

// Answer to an order operation. accepted == false is a business rejection
// by the daemon (TRADERR or an ERR code), not a failed call.
struct OrderAck {
    bool accepted = false;
    bool confirmation_required = false; // TRADCONFIRM left unanswered
    OrderId order_id;
    Symbol symbol;
    OrderStatus status = OrderStatus::Pending;
    std::string operation;
    Quantity quantity = 0;
    Decimal price;
    Decimal executed_price;
    Quantity executed_quantity = 0;
    Quantity remaining_quantity = 0;
    std::string reference;
    int64_t error_code = 0;
    std::string message;   // rejection reason or confirmation prompt
};

struct DarwinStatus {
    std::string connection_status;   // "CONN_OK", ...
    bool trading_enabled = false;
    std::string release;
    SessionMode mode = SessionMode::Live;
    session::ConnectionMetrics metrics;

    bool isConnected() const { return connection_status == "CONN_OK"; }
};

// ORDUPD event.
struct OrderUpdate {
    Symbol symbol;
    OrderId order_id;
    OrderStatus status = OrderStatus::Pending;
    Side side = Side::Buy;
    Quantity quantity = 0;
    Quantity filled_quantity = 0;
    Decimal avg_price;
    Timestamp time;
};

// EXEC event.
struct Execution {
    Symbol symbol;
    OrderId order_id;
    Side side = Side::Buy;
    Quantity executed_quantity = 0;
    Decimal executed_price;
    Quantity filled_quantity = 0;
    Quantity remaining_quantity = 0;
    Timestamp time;
};

struct Candle {
    Timestamp time;
    Decimal open;
    Decimal high;
    Decimal low;
    Decimal close;
    Quantity volume = 0;
};

struct Tick {
    Timestamp time;
    Decimal price;
    Quantity size = 0;
};

} // namespace darwin::client
