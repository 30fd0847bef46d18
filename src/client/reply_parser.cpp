#include "client/reply_parser.h"

#include "common/errors.h"
#include "wire/schema.h"

namespace darwin::client {

namespace {

void expectKind(const wire::Record& record, const char* tag) {
    if (record.kind() != tag) {
        throw ParseError(std::string("expected ") + tag + " record, got " + record.kind());
    }
}

Side sideField(const wire::Record& record, const char* name) {
    Side side;
    if (!parseSide(record.getString(name), side)) {
        throw ParseError(record.kind() + ": unknown side '" + record.getString(name) + "'");
    }
    return side;
}

OrderStatus statusField(const wire::Record& record) {
    OrderStatus status;
    if (!orderStatusFromCode(record.getInt("status_code"), status)) {
        throw ParseError(record.kind() + ": unknown order status code " +
                         std::to_string(record.getInt("status_code")));
    }
    return status;
}

} // anonymous namespace

AccountSnapshot toAccountSnapshot(const wire::Record& record) {
    expectKind(record, wire::Tag::INFOACCOUNT);
    AccountSnapshot a;
    a.time = record.getTimestamp("time");
    a.account_code = record.getString("account_code");
    a.liquidity = record.getDecimal("liquidity");
    a.gain = record.getDecimal("gain");
    a.open_pnl = record.getDecimal("open_pnl");
    a.equity = record.getDecimal("equity");
    a.environment = record.getString("environment");
    return a;
}

Availability toAvailability(const wire::Record& record) {
    expectKind(record, wire::Tag::AVAILABILITY);
    Availability a;
    a.time = record.getTimestamp("time");
    a.liquidity = record.getDecimal("liquidity");
    a.margin_liquidity = record.getDecimal("margin_liquidity");
    a.buying_power = record.getDecimal("buying_power");
    return a;
}

PortfolioPosition toPortfolioPosition(const wire::Record& record) {
    expectKind(record, wire::Tag::STOCK);
    PortfolioPosition p;
    p.symbol = record.getString("symbol");
    p.time = record.getTimestamp("time");
    p.quantity = record.getInt("quantity_portfolio");
    p.quantity_darwin = record.getInt("quantity_darwin");
    p.quantity_negotiation = record.getInt("quantity_negotiation");
    p.avg_price = record.getDecimal("avg_price");
    p.gain = record.getDecimal("gain");
    p.last_price = record.getDecimal("last_price");
    return p;
}

OrderInfo toOrderInfo(const wire::Record& record) {
    expectKind(record, wire::Tag::ORDER);
    OrderInfo o;
    o.symbol = record.getString("symbol");
    o.time = record.getTimestamp("time");
    o.order_id = record.getString("order_id");
    o.side = sideField(record, "side");
    o.price = record.getDecimal("price");
    o.signal_price = record.getDecimal("signal_price");
    o.quantity = record.getInt("quantity");
    o.status = statusField(record);
    o.filled_quantity = record.getInt("filled_quantity");
    o.avg_price = record.getDecimal("avg_price");
    o.kind = record.getString("kind");
    return o;
}

OrderInfo toOrderInfo(const sim::Order& order) {
    OrderInfo o;
    o.symbol = order.symbol;
    o.time = order.updated;
    o.order_id = order.order_id;
    o.side = order.side;
    o.price = order.price.value_or(Decimal{});
    o.signal_price = order.signal_price;
    o.quantity = order.quantity;
    o.status = order.status;
    o.filled_quantity = order.filled_quantity;
    o.avg_price = order.avg_fill_price;
    o.kind = toString(order.kind);
    return o;
}

OrderUpdate toOrderUpdate(const wire::Record& record) {
    expectKind(record, wire::Tag::ORDUPD);
    OrderUpdate u;
    u.symbol = record.getString("symbol");
    u.order_id = record.getString("order_id");
    u.status = statusField(record);
    u.side = sideField(record, "side");
    u.quantity = record.getInt("quantity");
    u.filled_quantity = record.getInt("filled_quantity");
    u.avg_price = record.getDecimal("avg_price");
    u.time = record.getTimestamp("time");
    return u;
}

Execution toExecution(const wire::Record& record) {
    expectKind(record, wire::Tag::EXEC);
    Execution e;
    e.symbol = record.getString("symbol");
    e.order_id = record.getString("order_id");
    e.side = sideField(record, "side");
    e.executed_quantity = record.getInt("executed_quantity");
    e.executed_price = record.getDecimal("executed_price");
    e.filled_quantity = record.getInt("filled_quantity");
    e.remaining_quantity = record.getInt("remaining_quantity");
    e.time = record.getTimestamp("time");
    return e;
}

Candle toCandle(const wire::Record& record) {
    expectKind(record, wire::Tag::CANDLE);
    Candle c;
    c.time = record.getTimestamp("datetime");
    c.open = record.getDecimal("open");
    c.high = record.getDecimal("high");
    c.low = record.getDecimal("low");
    c.close = record.getDecimal("close");
    c.volume = record.getInt("volume");
    return c;
}

Tick toTick(const wire::Record& record) {
    expectKind(record, wire::Tag::TBT);
    Tick t;
    t.time = record.getTimestamp("datetime");
    t.price = record.getDecimal("price");
    t.size = record.getInt("quantity");
    return t;
}

OrderAck toOrderAck(const wire::Record& record) {
    OrderAck ack;
    ack.symbol = record.getString("symbol");
    ack.order_id = record.getString("order_id");

    if (record.kind() == wire::Tag::TRADOK) {
        ack.accepted = true;
        ack.status = statusField(record);
        ack.operation = record.getString("operation");
        ack.quantity = record.getInt("quantity");
        ack.price = record.getDecimal("price");
        ack.executed_price = record.getDecimal("executed_price");
        ack.executed_quantity = record.getInt("executed_quantity");
        ack.remaining_quantity = record.getInt("remaining_quantity");
        ack.reference = record.getString("reference");
    } else if (record.kind() == wire::Tag::TRADERR) {
        ack.accepted = false;
        ack.status = OrderStatus::Rejected;
        ack.error_code = record.getInt("error_code");
        ack.message = record.getString("message");
        if (ack.message.empty()) {
            ack.message = wire::DaemonError::describe(ack.error_code);
        }
    } else if (record.kind() == wire::Tag::TRADCONFIRM) {
        ack.accepted = true;
        ack.confirmation_required = true;
        ack.quantity = record.getInt("quantity");
        ack.price = record.getDecimal("price");
        ack.remaining_quantity = ack.quantity;
        ack.message = record.getString("message");
    } else {
        throw ParseError("expected an order reply, got " + record.kind());
    }
    return ack;
}

DarwinStatus toDarwinStatus(const wire::Record& record) {
    expectKind(record, wire::Tag::DARWIN_STATUS);
    DarwinStatus s;
    s.connection_status = record.getString("connection_status");
    s.trading_enabled = record.getString("trading_enabled") == "TRUE";
    s.release = record.getString("release");
    return s;
}

} // namespace darwin::client
