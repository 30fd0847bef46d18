#include "wire/command.h"
#include "common/errors.h"

namespace darwin::client::wire {

const char* toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::PlaceOrder:         return "PlaceOrder";
        case CommandKind::CancelOrder:        return "CancelOrder";
        case CommandKind::CancelAll:          return "CancelAll";
        case CommandKind::ModifyOrder:        return "ModifyOrder";
        case CommandKind::ConfirmOrder:       return "ConfirmOrder";
        case CommandKind::QueryAccount:       return "QueryAccount";
        case CommandKind::QueryAvailability:  return "QueryAvailability";
        case CommandKind::QueryPortfolio:     return "QueryPortfolio";
        case CommandKind::QueryPosition:      return "QueryPosition";
        case CommandKind::QueryOrders:        return "QueryOrders";
        case CommandKind::QueryPendingOrders: return "QueryPendingOrders";
        case CommandKind::QueryStatus:        return "QueryStatus";
        case CommandKind::DailyCandles:       return "DailyCandles";
        case CommandKind::IntradayCandles:    return "IntradayCandles";
        case CommandKind::CandleRange:        return "CandleRange";
        case CommandKind::Ticks:              return "Ticks";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Parameter access
// ---------------------------------------------------------------------------

namespace {

template <typename T>
const T& param(const Command& cmd, const std::string& name, const char* type_name) {
    auto it = cmd.params.find(name);
    if (it == cmd.params.end()) {
        throw ValidationError(std::string(toString(cmd.kind)) + ": missing parameter '" +
                              name + "'");
    }
    if (!std::holds_alternative<T>(it->second)) {
        throw ValidationError(std::string(toString(cmd.kind)) + ": parameter '" + name +
                              "' must be " + type_name);
    }
    return std::get<T>(it->second);
}

} // anonymous namespace

const std::string& Command::str(const std::string& name) const {
    return param<std::string>(*this, name, "a string");
}

int64_t Command::integer(const std::string& name) const {
    return param<int64_t>(*this, name, "an integer");
}

Decimal Command::decimal(const std::string& name) const {
    return param<Decimal>(*this, name, "a decimal");
}

Timestamp Command::timestamp(const std::string& name) const {
    return param<Timestamp>(*this, name, "a timestamp");
}

Side Command::side() const {
    Side s;
    if (!parseSide(str("side"), s)) {
        throw ValidationError("side must be BUY or SELL, got '" + str("side") + "'");
    }
    return s;
}

OrderKind Command::orderKind() const {
    OrderKind k;
    if (!parseOrderKind(str("kind"), k)) {
        throw ValidationError("unsupported order kind '" + str("kind") + "'");
    }
    return k;
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

Command Command::placeOrder(const OrderRequest& request) {
    Command c;
    c.kind = CommandKind::PlaceOrder;
    c.params["order_id"] = request.order_id;
    c.params["symbol"] = request.symbol;
    c.params["side"] = std::string(toString(request.side));
    c.params["kind"] = std::string(toString(request.kind));
    c.params["quantity"] = int64_t{request.quantity};
    if (request.price) c.params["price"] = *request.price;
    if (request.trail) c.params["trail"] = *request.trail;
    if (request.visible_quantity) c.params["visible_quantity"] = int64_t{*request.visible_quantity};
    return c;
}

Command Command::cancelOrder(const OrderId& order_id) {
    Command c;
    c.kind = CommandKind::CancelOrder;
    c.params["order_id"] = order_id;
    return c;
}

Command Command::cancelAll(const Symbol& symbol) {
    Command c;
    c.kind = CommandKind::CancelAll;
    c.params["symbol"] = symbol;
    return c;
}

Command Command::modifyOrder(const OrderId& order_id, Decimal price,
                             std::optional<Decimal> signal_price) {
    Command c;
    c.kind = CommandKind::ModifyOrder;
    c.params["order_id"] = order_id;
    c.params["price"] = price;
    if (signal_price) c.params["signal_price"] = *signal_price;
    return c;
}

Command Command::confirmOrder(const OrderId& order_id) {
    Command c;
    c.kind = CommandKind::ConfirmOrder;
    c.params["order_id"] = order_id;
    return c;
}

Command Command::queryAccount()       { return Command{CommandKind::QueryAccount, {}}; }
Command Command::queryAvailability()  { return Command{CommandKind::QueryAvailability, {}}; }
Command Command::queryPortfolio()     { return Command{CommandKind::QueryPortfolio, {}}; }
Command Command::queryPendingOrders() { return Command{CommandKind::QueryPendingOrders, {}}; }
Command Command::queryStatus()        { return Command{CommandKind::QueryStatus, {}}; }

Command Command::queryPosition(const Symbol& symbol) {
    Command c;
    c.kind = CommandKind::QueryPosition;
    c.params["symbol"] = symbol;
    return c;
}

Command Command::queryOrders(const Symbol& symbol) {
    Command c;
    c.kind = CommandKind::QueryOrders;
    if (!symbol.empty()) c.params["symbol"] = symbol;
    return c;
}

Command Command::dailyCandles(const Symbol& symbol, int64_t days) {
    Command c;
    c.kind = CommandKind::DailyCandles;
    c.params["symbol"] = symbol;
    c.params["days"] = days;
    return c;
}

Command Command::intradayCandles(const Symbol& symbol, int64_t days, int64_t period_seconds) {
    Command c;
    c.kind = CommandKind::IntradayCandles;
    c.params["symbol"] = symbol;
    c.params["days"] = days;
    c.params["period"] = period_seconds;
    return c;
}

Command Command::candleRange(const Symbol& symbol, Timestamp from, Timestamp to,
                             int64_t period_seconds, bool include_after_hours) {
    Command c;
    c.kind = CommandKind::CandleRange;
    c.params["symbol"] = symbol;
    c.params["period"] = period_seconds;
    c.params["from"] = from;
    c.params["to"] = to;
    c.params["after_hours"] = std::string(include_after_hours ? "TRUE" : "FALSE");
    return c;
}

Command Command::ticks(const Symbol& symbol, int64_t days) {
    Command c;
    c.kind = CommandKind::Ticks;
    c.params["symbol"] = symbol;
    c.params["days"] = days;
    return c;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

namespace {

// Identifiers travel unquoted between delimiters.
void requireToken(const Command& cmd, const std::string& name) {
    const std::string& value = cmd.str(name);
    if (value.empty()) {
        throw ValidationError(name + " cannot be empty");
    }
    if (value.find_first_of(";, \r\n") != std::string::npos) {
        throw ValidationError(name + " contains a delimiter character: '" + value + "'");
    }
}

void requirePositiveInt(const Command& cmd, const std::string& name) {
    if (cmd.integer(name) <= 0) {
        throw ValidationError(name + " must be a positive integer, got " +
                              std::to_string(cmd.integer(name)));
    }
}

void requirePositiveDecimal(const Command& cmd, const std::string& name) {
    if (!cmd.decimal(name).isPositive()) {
        throw ValidationError(name + " must be positive, got " + cmd.decimal(name).toString());
    }
}

void validatePlaceOrder(const Command& cmd) {
    requireToken(cmd, "order_id");
    requireToken(cmd, "symbol");
    cmd.side();
    OrderKind kind = cmd.orderKind();
    requirePositiveInt(cmd, "quantity");

    if (requiresPrice(kind)) {
        if (!cmd.has("price")) {
            throw ValidationError(std::string("price is required for ") + toString(kind) + " orders");
        }
        requirePositiveDecimal(cmd, "price");
    } else if (cmd.has("price")) {
        throw ValidationError("market orders do not take a price");
    }

    if (kind == OrderKind::TrailingStop) {
        requirePositiveDecimal(cmd, "trail");
    } else if (cmd.has("trail")) {
        throw ValidationError("trail applies to trailing-stop orders only");
    }

    if (kind == OrderKind::Iceberg) {
        requirePositiveInt(cmd, "visible_quantity");
        if (cmd.integer("visible_quantity") > cmd.integer("quantity")) {
            throw ValidationError("visible_quantity cannot exceed quantity");
        }
    } else if (cmd.has("visible_quantity")) {
        throw ValidationError("visible_quantity applies to iceberg orders only");
    }
}

void validateCandleRange(const Command& cmd) {
    requireToken(cmd, "symbol");
    requirePositiveInt(cmd, "period");
    Timestamp from = cmd.timestamp("from");
    Timestamp to = cmd.timestamp("to");
    if (from.format != Timestamp::Format::Date || to.format != Timestamp::Format::Date) {
        throw ValidationError("candle range bounds must be dates");
    }
    if (to < from) {
        throw ValidationError("candle range 'from' is after 'to'");
    }
    const std::string& ah = cmd.str("after_hours");
    if (ah != "TRUE" && ah != "FALSE") {
        throw ValidationError("after_hours must be TRUE or FALSE");
    }
}

} // anonymous namespace

void validateCommand(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::PlaceOrder:
            validatePlaceOrder(cmd);
            break;
        case CommandKind::CancelOrder:
        case CommandKind::ConfirmOrder:
            requireToken(cmd, "order_id");
            break;
        case CommandKind::CancelAll:
        case CommandKind::QueryPosition:
            requireToken(cmd, "symbol");
            break;
        case CommandKind::ModifyOrder:
            requireToken(cmd, "order_id");
            requirePositiveDecimal(cmd, "price");
            if (cmd.has("signal_price")) requirePositiveDecimal(cmd, "signal_price");
            break;
        case CommandKind::QueryOrders:
            if (cmd.has("symbol")) requireToken(cmd, "symbol");
            break;
        case CommandKind::QueryAccount:
        case CommandKind::QueryAvailability:
        case CommandKind::QueryPortfolio:
        case CommandKind::QueryPendingOrders:
        case CommandKind::QueryStatus:
            break;
        case CommandKind::DailyCandles:
        case CommandKind::Ticks:
            requireToken(cmd, "symbol");
            requirePositiveInt(cmd, "days");
            break;
        case CommandKind::IntradayCandles:
            requireToken(cmd, "symbol");
            requirePositiveInt(cmd, "days");
            requirePositiveInt(cmd, "period");
            break;
        case CommandKind::CandleRange:
            validateCandleRange(cmd);
            break;
    }
}

} // namespace darwin::client::wire
