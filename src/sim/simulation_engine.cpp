#include "sim/simulation_engine.h"

#include "common/errors.h"
#include "wire/codec.h"
#include "wire/schema.h"

namespace darwin::client::sim {

namespace {

constexpr const char* kEnvironment = "SIM";
constexpr const char* kRelease = "Release 2.5.1 build SIMULATION";
constexpr const char* kNoCommand = "N/A";

int64_t code(OrderStatus status) { return static_cast<int64_t>(status); }

Decimal priceOrZero(const Order& order) { return order.price.value_or(Decimal{}); }

wire::Record endRecord(const char* verb, size_t count) {
    return wire::Record::make(wire::Tag::END, {std::string(verb), static_cast<int64_t>(count)});
}

wire::Record errRecord(int64_t error_code) {
    return wire::Record::make(wire::Tag::ERR, {std::string(kNoCommand), error_code});
}

router::Reply listReply(std::vector<wire::Record> items, const char* verb, int64_t empty_code) {
    router::Reply reply;
    if (items.empty()) {
        reply.terminal = errRecord(empty_code);
        return reply;
    }
    size_t count = items.size();
    reply.items = std::move(items);
    reply.terminal = endRecord(verb, count);
    return reply;
}

router::Reply single(wire::Record record) {
    router::Reply reply;
    reply.items.push_back(std::move(record));
    return reply;
}

} // anonymous namespace

SimulationEngine::SimulationEngine(std::string account_code, Decimal initial_liquidity)
    : account_code_(std::move(account_code))
    , initial_liquidity_(initial_liquidity)
    , liquidity_(initial_liquidity)
    , logger_(getLogger(LogCategory::SIM)) {
    logger_->warn("SIMULATION MODE: orders are virtual, nothing reaches the market "
                  "(account {}, liquidity {})", account_code_, liquidity_.toString());
}

void SimulationEngine::setEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void SimulationEngine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    orders_.clear();
    order_sequence_.clear();
    ledger_.clear();
    liquidity_ = initial_liquidity_;
    realized_gain_ = Decimal{};
    equity_override_.reset();
    next_order_id_ = 1;
    outbox_.clear();
    logger_->info("Simulation state reset");
}

// ---------------------------------------------------------------------------
// Command dispatch
// ---------------------------------------------------------------------------

router::Reply SimulationEngine::execute(const wire::Command& command) {
    wire::validateCommand(command);

    switch (command.kind) {
        case wire::CommandKind::PlaceOrder:
            return single(placeOrder(command));
        case wire::CommandKind::CancelOrder:
            return single(cancelOrder(command.str("order_id")));
        case wire::CommandKind::CancelAll: {
            router::Reply reply;
            reply.items = cancelAll(command.str("symbol"));
            reply.terminal = endRecord("REVALL", reply.items.size());
            return reply;
        }
        case wire::CommandKind::ModifyOrder: {
            std::optional<Decimal> signal;
            if (command.has("signal_price")) signal = command.decimal("signal_price");
            return single(modifyOrder(command.str("order_id"), command.decimal("price"), signal));
        }
        case wire::CommandKind::ConfirmOrder: {
            std::lock_guard<std::mutex> lock(mutex_);
            Order& o = findOrderLocked(command.str("order_id"));
            return single(wire::Record::make(wire::Tag::TRADOK, {
                o.symbol, o.order_id, code(o.status), std::string("CONFIRM"),
                o.quantity, priceOrZero(o), o.avg_fill_price, o.filled_quantity,
                o.remainingQty(), o.client_order_id, wire::encode(command)}));
        }
        case wire::CommandKind::QueryAccount:
            return single(accountRecord());
        case wire::CommandKind::QueryAvailability:
            return single(availabilityRecord());
        case wire::CommandKind::QueryStatus:
            return single(statusRecord());
        case wire::CommandKind::QueryPortfolio:
            return listReply(portfolioRecords(), "INFOSTOCKS", wire::DaemonError::NO_POSITIONS);
        case wire::CommandKind::QueryPosition: {
            auto rec = positionRecord(command.str("symbol"));
            if (!rec) {
                router::Reply reply;
                reply.terminal = errRecord(wire::DaemonError::NO_POSITIONS);
                return reply;
            }
            return single(std::move(*rec));
        }
        case wire::CommandKind::QueryOrders: {
            Symbol symbol = command.has("symbol") ? command.str("symbol") : Symbol{};
            return listReply(orderRecords(symbol), "ORDERLIST", wire::DaemonError::NO_ORDERS);
        }
        case wire::CommandKind::QueryPendingOrders:
            return listReply(orderRecords({}, true), "ORDERLISTPENDING",
                             wire::DaemonError::NO_ORDERS);
        case wire::CommandKind::DailyCandles:
        case wire::CommandKind::IntradayCandles:
        case wire::CommandKind::CandleRange:
        case wire::CommandKind::Ticks:
            break;
    }
    throw ValidationError(std::string(wire::toString(command.kind)) +
                          " is not available in simulation mode");
}

// ---------------------------------------------------------------------------
// Order lifecycle
// ---------------------------------------------------------------------------

wire::Record SimulationEngine::placeOrder(const wire::Command& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    return placeOrderLocked(command);
}

wire::Record SimulationEngine::placeOrderLocked(const wire::Command& command) {
    if (command.kind != wire::CommandKind::PlaceOrder) {
        throw ValidationError(std::string("expected PlaceOrder, got ") +
                              wire::toString(command.kind));
    }
    std::string line = wire::encode(command); // validates

    Order o;
    o.order_id = "SIM" + std::to_string(next_order_id_++);
    o.client_order_id = command.str("order_id");
    o.symbol = command.str("symbol");
    o.side = command.side();
    o.kind = command.orderKind();
    o.quantity = command.integer("quantity");
    if (command.has("price")) o.price = command.decimal("price");
    if (command.has("trail")) o.trail = command.decimal("trail");
    if (command.has("visible_quantity")) o.visible_quantity = command.integer("visible_quantity");
    o.created = Clock::localTimeOfDay();
    o.updated = o.created;

    // A notional past the fixed-point range is more than any account holds.
    Decimal notional;
    if (o.side == Side::Buy && o.price &&
        (!o.price->tryMultiply(o.quantity, notional) || notional > liquidity_)) {
        o.status = OrderStatus::Rejected;
        logger_->warn("Rejected {}: {} x {} {} exceeds liquidity {}", o.order_id, o.quantity,
                      o.symbol, o.price->toString(), liquidity_.toString());
        order_sequence_.push_back(o.order_id);
        auto rejected = wire::Record::make(wire::Tag::TRADERR, {
            o.symbol, o.order_id, wire::DaemonError::INSUFFICIENT_LIQUIDITY,
            std::string(wire::DaemonError::describe(wire::DaemonError::INSUFFICIENT_LIQUIDITY))});
        orders_.emplace(o.order_id, std::move(o));
        return rejected;
    }

    logger_->info("Accepted {} {} {} {} x {} @ {}", o.order_id, toString(o.side), toString(o.kind),
                  o.quantity, o.symbol, o.price ? o.price->toString() : std::string("MKT"));

    auto accepted = wire::Record::make(wire::Tag::TRADOK, {
        o.symbol, o.order_id, code(o.status), std::string(toString(o.side)),
        o.quantity, priceOrZero(o), Decimal{}, int64_t{0}, o.quantity,
        o.client_order_id, line});
    order_sequence_.push_back(o.order_id);
    orders_.emplace(o.order_id, std::move(o));
    return accepted;
}

Order SimulationEngine::simulateOrderExecution(const OrderId& order_id,
                                               std::optional<Decimal> executed_price,
                                               std::optional<Quantity> executed_quantity) {
    Order snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Order& o = findOrderLocked(order_id);
        if (isTerminal(o.status)) {
            throw InvalidStateError("cannot execute order " + order_id + ": it is " +
                                    toString(o.status));
        }

        const Quantity qty = executed_quantity.value_or(o.remainingQty());
        if (qty <= 0) {
            throw ValidationError("executed quantity must be positive, got " + std::to_string(qty));
        }
        if (qty > o.remainingQty()) {
            throw ValidationError("executed quantity " + std::to_string(qty) +
                                  " exceeds remaining " + std::to_string(o.remainingQty()) +
                                  " of order " + order_id);
        }

        Decimal price;
        if (executed_price) {
            price = *executed_price;
        } else if (o.price) {
            price = *o.price;
        } else {
            throw ValidationError("market order " + order_id + " needs an execution price");
        }
        if (!price.isPositive()) {
            throw ValidationError("execution price must be positive, got " + price.toString());
        }

        // Everything is computed before any state changes, so a fill that
        // overflows the fixed-point range leaves order, ledger and cash as
        // they were.
        const Quantity prior = o.filled_quantity;
        Decimal notional, prior_notional, total_notional, liquidity;
        if (!price.tryMultiply(qty, notional) ||
            !o.avg_fill_price.tryMultiply(prior, prior_notional) ||
            !prior_notional.tryAdd(notional, total_notional) ||
            !liquidity_.tryAdd(o.side == Side::Buy ? -notional : notional, liquidity)) {
            throw ValidationError("execution of " + std::to_string(qty) + " @ " +
                                  price.toString() + " on order " + order_id +
                                  " exceeds the fixed-point range");
        }
        Decimal realized;
        try {
            realized = ledger_.applyFill(o.symbol, o.side, qty, price);
        } catch (const std::overflow_error& e) {
            throw ValidationError("position " + o.symbol + " would exceed the fixed-point range: " +
                                  e.what());
        }

        o.avg_fill_price = total_notional.divideBy(prior + qty);
        o.filled_quantity += qty;
        o.status = o.isFullyFilled() ? OrderStatus::Filled : OrderStatus::PartiallyFilled;
        o.updated = Clock::localTimeOfDay();
        realized_gain_ += realized;
        liquidity_ = liquidity;
        equity_override_.reset();

        logger_->info("Executed {} {} x {} @ {} ({} / {}, {})", o.order_id, toString(o.side),
                      qty, price.toString(), o.filled_quantity, o.quantity, toString(o.status));

        queueEvent(orderUpdateLocked(o));
        queueEvent(wire::Record::make(wire::Tag::EXEC, {
            o.symbol, o.order_id, std::string(toString(o.side)), qty, price,
            o.filled_quantity, o.remainingQty(), o.updated}));
        snapshot = o;
    }
    drainEvents();
    return snapshot;
}

wire::Record SimulationEngine::cancelOrder(const OrderId& order_id) {
    std::optional<wire::Record> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Order& o = findOrderLocked(order_id);
        if (isTerminal(o.status)) {
            throw InvalidStateError("cannot cancel order " + order_id + ": it is " +
                                    toString(o.status));
        }
        reply = cancelOrderLocked(o, wire::encode(wire::Command::cancelOrder(order_id)));
    }
    drainEvents();
    return std::move(*reply);
}

std::vector<wire::Record> SimulationEngine::cancelAll(const Symbol& symbol) {
    std::vector<wire::Record> replies;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string line = wire::encode(wire::Command::cancelAll(symbol));
        for (const auto& id : order_sequence_) {
            Order& o = orders_.at(id);
            if (o.symbol == symbol && !isTerminal(o.status)) {
                replies.push_back(cancelOrderLocked(o, line));
            }
        }
    }
    drainEvents();
    return replies;
}

wire::Record SimulationEngine::cancelOrderLocked(Order& o, const std::string& command_line) {
    o.status = OrderStatus::Cancelled;
    o.updated = Clock::localTimeOfDay();
    logger_->info("Cancelled {} ({} of {} filled)", o.order_id, o.filled_quantity, o.quantity);
    queueEvent(orderUpdateLocked(o));
    return wire::Record::make(wire::Tag::TRADOK, {
        o.symbol, o.order_id, code(o.status), std::string("CANCEL"), o.quantity,
        priceOrZero(o), o.avg_fill_price, o.filled_quantity, int64_t{0},
        o.client_order_id, command_line});
}

wire::Record SimulationEngine::modifyOrder(const OrderId& order_id, Decimal price,
                                           std::optional<Decimal> signal_price) {
    std::optional<wire::Record> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string line = wire::encode(wire::Command::modifyOrder(order_id, price, signal_price));
        Order& o = findOrderLocked(order_id);
        if (isTerminal(o.status)) {
            throw InvalidStateError("cannot modify order " + order_id + ": it is " +
                                    toString(o.status));
        }
        if (!o.price) {
            throw InvalidStateError("cannot reprice market order " + order_id);
        }
        o.price = price;
        if (signal_price) o.signal_price = *signal_price;
        o.updated = Clock::localTimeOfDay();
        logger_->info("Modified {} price {}", o.order_id, price.toString());
        queueEvent(orderUpdateLocked(o));
        reply = wire::Record::make(wire::Tag::TRADOK, {
            o.symbol, o.order_id, code(o.status), std::string("MODIFY"), o.quantity,
            priceOrZero(o), o.avg_fill_price, o.filled_quantity, o.remainingQty(),
            o.client_order_id, line});
    }
    drainEvents();
    return std::move(*reply);
}

Order& SimulationEngine::findOrderLocked(const OrderId& order_id) {
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw OrderNotFoundError("order " + order_id + " not found");
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

wire::Record SimulationEngine::orderUpdateLocked(const Order& o) const {
    return wire::Record::make(wire::Tag::ORDUPD, {
        o.symbol, o.order_id, code(o.status), std::string(toString(o.side)), o.quantity,
        o.filled_quantity, o.avg_fill_price, o.updated});
}

wire::Record SimulationEngine::orderRecordLocked(const Order& o) const {
    return wire::Record::make(wire::Tag::ORDER, {
        o.symbol, o.created, o.order_id, std::string(toString(o.side)), priceOrZero(o),
        o.signal_price, o.quantity, code(o.status), o.filled_quantity, o.avg_fill_price,
        std::string(toString(o.kind))});
}

wire::Record SimulationEngine::stockRecordLocked(const Position& pos) const {
    return wire::Record::make(wire::Tag::STOCK, {
        pos.symbol, Clock::localTimeOfDay(), pos.quantity, int64_t{0}, int64_t{0},
        pos.avg_price, pos.gain, pos.last_price});
}

Decimal SimulationEngine::equityLocked() const {
    if (equity_override_) return *equity_override_;
    Decimal market_value;
    try {
        market_value = ledger_.marketValue();
    } catch (const std::overflow_error& e) {
        throw InvalidStateError(std::string("simulated equity: ") + e.what());
    }
    Decimal equity;
    if (!liquidity_.tryAdd(market_value, equity)) {
        throw InvalidStateError("simulated equity exceeds the fixed-point range");
    }
    return equity;
}

wire::Record SimulationEngine::accountRecord() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Decimal open_pnl;
    for (const auto& pos : ledger_.all()) {
        Decimal pnl;
        if (!(pos.last_price - pos.avg_price).tryMultiply(pos.quantity, pnl) ||
            !open_pnl.tryAdd(pnl, open_pnl)) {
            throw InvalidStateError("open P&L of " + pos.symbol +
                                    " exceeds the fixed-point range");
        }
    }
    return wire::Record::make(wire::Tag::INFOACCOUNT, {
        Clock::localTimeOfDay(), account_code_, liquidity_, realized_gain_, open_pnl,
        equityLocked(), std::string(kEnvironment)});
}

wire::Record SimulationEngine::availabilityRecord() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wire::Record::make(wire::Tag::AVAILABILITY, {
        Clock::localTimeOfDay(), liquidity_, liquidity_, liquidity_});
}

wire::Record SimulationEngine::statusRecord() const {
    return wire::Record::make(wire::Tag::DARWIN_STATUS, {
        std::string("CONN_OK"), std::string("TRUE"), std::string(kRelease)});
}

std::vector<wire::Record> SimulationEngine::portfolioRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<wire::Record> out;
    for (const auto& pos : ledger_.all()) {
        out.push_back(stockRecordLocked(pos));
    }
    return out;
}

std::optional<wire::Record> SimulationEngine::positionRecord(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Position* pos = ledger_.find(symbol);
    if (!pos) return std::nullopt;
    return stockRecordLocked(*pos);
}

std::vector<wire::Record> SimulationEngine::orderRecords(const Symbol& symbol,
                                                         bool pending_only) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<wire::Record> out;
    for (const auto& id : order_sequence_) {
        const Order& o = orders_.at(id);
        if (!symbol.empty() && o.symbol != symbol) continue;
        if (pending_only && isTerminal(o.status)) continue;
        out.push_back(orderRecordLocked(o));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Scaffolding and inspection
// ---------------------------------------------------------------------------

void SimulationEngine::addPosition(const Symbol& symbol, Quantity quantity, Decimal avg_price,
                                   Decimal gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    ledger_.adjust(symbol, quantity, avg_price, gain);
    logger_->info("Adjusted simulated position {} by {}", symbol, quantity);
}

bool SimulationEngine::removePosition(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = ledger_.remove(symbol);
    if (removed) logger_->info("Removed simulated position {}", symbol);
    return removed;
}

void SimulationEngine::updateAccount(std::optional<Decimal> liquidity,
                                     std::optional<Decimal> equity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (liquidity) liquidity_ = *liquidity;
    if (equity) equity_override_ = *equity;
    logger_->info("Simulated account: liquidity={} equity={}", liquidity_.toString(),
                  equity_override_ ? equity_override_->toString() : std::string("derived"));
}

std::optional<Order> SimulationEngine::order(const OrderId& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

std::optional<Position> SimulationEngine::position(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Position* pos = ledger_.find(symbol);
    if (!pos) return std::nullopt;
    return *pos;
}

std::vector<Order> SimulationEngine::orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Order> out;
    for (const auto& id : order_sequence_) out.push_back(orders_.at(id));
    return out;
}

Decimal SimulationEngine::liquidity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liquidity_;
}

Decimal SimulationEngine::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equityLocked();
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void SimulationEngine::queueEvent(wire::Record record) {
    outbox_.push_back(std::move(record));
}

void SimulationEngine::drainEvents() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (draining_) return; // the active drainer delivers ours too
    draining_ = true;
    while (!outbox_.empty()) {
        wire::Record record = std::move(outbox_.front());
        outbox_.pop_front();
        EventSink sink = sink_;
        lock.unlock();
        if (sink) {
            try {
                sink(record);
            } catch (const std::exception& e) {
                logger_->error("Event sink threw on {}: {}", record.kind(), e.what());
            }
        }
        lock.lock();
    }
    draining_ = false;
}

} // namespace darwin::client::sim
