#include "client/trading_client.h"

#include "client/live_trading_backend.h"
#include "client/reply_parser.h"
#include "client/simulated_trading_backend.h"
#include "common/clock.h"
#include "common/errors.h"
#include "config/config_loader.h"
#include "wire/schema.h"

namespace darwin::client {

namespace {

std::unique_ptr<TradingBackend> makeBackend(const config::ClientConfig& config, SessionMode mode) {
    config::validateConfig(config);
    if (mode == SessionMode::Simulation) {
        return std::make_unique<SimulatedTradingBackend>(
            config.simulation.account_code,
            Decimal::parse(config.simulation.initial_liquidity));
    }
    return std::make_unique<LiveTradingBackend>(config.trading, config.session);
}

std::string errorText(const char* verb, int64_t code) {
    return std::string(verb) + " answered ERR " + std::to_string(code) + " (" +
           wire::DaemonError::describe(code) + ")";
}

// The one record of a single-record reply.
const wire::Record& singleItem(const router::Reply& reply, const char* verb) {
    if (reply.isError()) {
        throw RemoteError(errorText(verb, reply.errorCode()));
    }
    if (reply.items.empty()) {
        throw ParseError(std::string(verb) + " reply carried no record");
    }
    return reply.items.front();
}

// Items of a list reply. The daemon reports an empty list as ERR 1018 or
// 1019; any other error code fails the call.
const std::vector<wire::Record>& listItems(const router::Reply& reply, const char* verb) {
    static const std::vector<wire::Record> kEmpty;
    if (reply.isError()) {
        int64_t code = reply.errorCode();
        if (code == wire::DaemonError::NO_POSITIONS || code == wire::DaemonError::NO_ORDERS) {
            return kEmpty;
        }
        throw RemoteError(errorText(verb, code));
    }
    return reply.items;
}

// Order operations: TRADOK / TRADERR / TRADCONFIRM, or ERR.
OrderAck orderAck(const router::Reply& reply, const wire::Command& command) {
    if (reply.isError()) {
        int64_t code = reply.errorCode();
        if (code == wire::DaemonError::ORDER_NOT_FOUND) {
            std::string id = command.has("order_id") ? command.str("order_id") : std::string{};
            throw OrderNotFoundError("order " + id + " not found");
        }
        OrderAck ack;
        ack.accepted = false;
        ack.status = OrderStatus::Rejected;
        ack.error_code = code;
        ack.message = wire::DaemonError::describe(code);
        if (command.has("order_id")) ack.order_id = command.str("order_id");
        if (command.has("symbol")) ack.symbol = command.str("symbol");
        return ack;
    }
    if (reply.items.empty()) {
        throw ParseError(std::string(wire::toString(command.kind)) + " reply carried no record");
    }
    return toOrderAck(reply.items.front());
}

} // namespace

TradingClient::TradingClient(const config::ClientConfig& config)
    : TradingClient(config, config.simulation.enabled ? SessionMode::Simulation
                                                      : SessionMode::Live) {}

TradingClient::TradingClient(const config::ClientConfig& config, SessionMode mode)
    : backend_(makeBackend(config, mode))
    , session_(config.session)
    , logger_(getLogger(LogCategory::CLIENT)) {
    logger_->info("Trading client created in {} mode", toString(mode));
}

TradingClient::TradingClient(std::unique_ptr<TradingBackend> backend,
                             config::SessionConfig session)
    : backend_(std::move(backend))
    , session_(session)
    , logger_(getLogger(LogCategory::CLIENT)) {}

TradingClient::~TradingClient() {
    disconnect();
}

template <typename T, typename Fn>
Result<T> TradingClient::guarded(const char* operation, Fn&& fn) {
    try {
        return Result<T>::ok(fn());
    } catch (const ClientError& e) {
        logger_->warn("{} failed: {} ({})", operation, e.what(), toString(e.kind()));
        return Result<T>::fail(e);
    }
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Result<Empty> TradingClient::connect() {
    return guarded<Empty>("connect", [&] {
        backend_->connect();
        return Empty{};
    });
}

Result<Empty> TradingClient::disconnect() {
    return guarded<Empty>("disconnect", [&] {
        backend_->disconnect();
        return Empty{};
    });
}

bool TradingClient::isConnected() const {
    LivenessState s = backend_->state();
    return s == LivenessState::Connected || s == LivenessState::Degraded;
}

// ---------------------------------------------------------------------------
// Orders
// ---------------------------------------------------------------------------

OrderId TradingClient::nextOrderId() {
    return "ORD" + std::to_string(Clock::epochMillis()) + "-" + std::to_string(++order_seq_);
}

OrderAck TradingClient::submitOrderCommand(const wire::Command& command, bool allow_confirm,
                                           CallTimeout timeout) {
    router::Reply reply;
    if (command.kind == wire::CommandKind::PlaceOrder) {
        reply = backend_->placeOrder(command, timeout);
    } else if (command.kind == wire::CommandKind::CancelOrder) {
        reply = backend_->cancelOrder(command, timeout);
    } else {
        reply = backend_->execute(command, timeout);
    }
    OrderAck ack = orderAck(reply, command);

    if (ack.confirmation_required && allow_confirm && session_.auto_confirm) {
        logger_->info("Confirming order {}: {}", ack.order_id, ack.message);
        return submitOrderCommand(wire::Command::confirmOrder(ack.order_id), false, timeout);
    }
    if (!ack.accepted) {
        logger_->warn("{} rejected: {} {}", wire::toString(command.kind), ack.error_code,
                      ack.message);
    }
    return ack;
}

Result<OrderAck> TradingClient::placeOrder(wire::OrderRequest request, CallTimeout timeout) {
    return guarded<OrderAck>("placeOrder", [&] {
        if (request.order_id.empty()) request.order_id = nextOrderId();
        wire::Command command = wire::Command::placeOrder(request);
        wire::validateCommand(command);
        logger_->info("Placing {} {} {} x{} ({})", toString(request.side),
                      toString(request.kind), request.symbol, request.quantity,
                      request.order_id);
        return submitOrderCommand(command, true, timeout);
    });
}

Result<OrderAck> TradingClient::placeMarketOrder(const Symbol& symbol, Side side,
                                                 Quantity quantity, CallTimeout timeout) {
    wire::OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.kind = OrderKind::Market;
    r.quantity = quantity;
    return placeOrder(std::move(r), timeout);
}

Result<OrderAck> TradingClient::placeLimitOrder(const Symbol& symbol, Side side,
                                                Quantity quantity, Decimal price,
                                                CallTimeout timeout) {
    wire::OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.kind = OrderKind::Limit;
    r.quantity = quantity;
    r.price = price;
    return placeOrder(std::move(r), timeout);
}

Result<OrderAck> TradingClient::placeStopOrder(const Symbol& symbol, Side side,
                                               Quantity quantity, Decimal stop_price,
                                               CallTimeout timeout) {
    wire::OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.kind = OrderKind::Stop;
    r.quantity = quantity;
    r.price = stop_price;
    return placeOrder(std::move(r), timeout);
}

Result<OrderAck> TradingClient::placeTrailingStopOrder(const Symbol& symbol, Side side,
                                                       Quantity quantity, Decimal stop_price,
                                                       Decimal trail, CallTimeout timeout) {
    wire::OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.kind = OrderKind::TrailingStop;
    r.quantity = quantity;
    r.price = stop_price;
    r.trail = trail;
    return placeOrder(std::move(r), timeout);
}

Result<OrderAck> TradingClient::placeIcebergOrder(const Symbol& symbol, Side side,
                                                  Quantity quantity, Decimal price,
                                                  Quantity visible_quantity,
                                                  CallTimeout timeout) {
    wire::OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.kind = OrderKind::Iceberg;
    r.quantity = quantity;
    r.price = price;
    r.visible_quantity = visible_quantity;
    return placeOrder(std::move(r), timeout);
}

Result<OrderAck> TradingClient::cancelOrder(const OrderId& order_id, CallTimeout timeout) {
    return guarded<OrderAck>("cancelOrder", [&] {
        wire::Command command = wire::Command::cancelOrder(order_id);
        wire::validateCommand(command);
        return submitOrderCommand(command, false, timeout);
    });
}

Result<std::vector<OrderAck>> TradingClient::cancelAllOrders(const Symbol& symbol,
                                                            CallTimeout timeout) {
    return guarded<std::vector<OrderAck>>("cancelAllOrders", [&] {
        wire::Command command = wire::Command::cancelAll(symbol);
        wire::validateCommand(command);
        router::Reply reply = backend_->execute(command, timeout);
        std::vector<OrderAck> acks;
        for (const auto& record : listItems(reply, "REVALL")) {
            acks.push_back(toOrderAck(record));
        }
        logger_->info("Cancelled {} orders for {}", acks.size(), symbol);
        return acks;
    });
}

Result<OrderAck> TradingClient::modifyOrder(const OrderId& order_id, Decimal price,
                                            std::optional<Decimal> signal_price,
                                            CallTimeout timeout) {
    return guarded<OrderAck>("modifyOrder", [&] {
        wire::Command command = wire::Command::modifyOrder(order_id, price, signal_price);
        wire::validateCommand(command);
        return submitOrderCommand(command, false, timeout);
    });
}

Result<OrderAck> TradingClient::confirmOrder(const OrderId& order_id, CallTimeout timeout) {
    return guarded<OrderAck>("confirmOrder", [&] {
        wire::Command command = wire::Command::confirmOrder(order_id);
        wire::validateCommand(command);
        return submitOrderCommand(command, false, timeout);
    });
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<AccountSnapshot> TradingClient::getAccountInfo(CallTimeout timeout) {
    return guarded<AccountSnapshot>("getAccountInfo", [&] {
        return toAccountSnapshot(singleItem(backend_->queryAccountInfo(timeout), "INFOACCOUNT"));
    });
}

Result<Availability> TradingClient::getAvailability(CallTimeout timeout) {
    return guarded<Availability>("getAvailability", [&] {
        return toAvailability(singleItem(
            backend_->execute(wire::Command::queryAvailability(), timeout), "INFOAVAILABILITY"));
    });
}

Result<std::vector<PortfolioPosition>> TradingClient::getPortfolio(CallTimeout timeout) {
    return guarded<std::vector<PortfolioPosition>>("getPortfolio", [&] {
        router::Reply reply = backend_->queryPortfolio(timeout);
        std::vector<PortfolioPosition> out;
        for (const auto& record : listItems(reply, "INFOSTOCKS")) {
            out.push_back(toPortfolioPosition(record));
        }
        return out;
    });
}

Result<std::optional<PortfolioPosition>> TradingClient::getPosition(const Symbol& symbol,
                                                                    CallTimeout timeout) {
    return guarded<std::optional<PortfolioPosition>>("getPosition", [&] {
        wire::Command command = wire::Command::queryPosition(symbol);
        wire::validateCommand(command);
        router::Reply reply = backend_->execute(command, timeout);
        const auto& items = listItems(reply, "GETPOSITION");
        std::optional<PortfolioPosition> out;
        if (!items.empty()) out = toPortfolioPosition(items.front());
        return out;
    });
}

std::vector<OrderInfo> TradingClient::orderList(const wire::Command& command,
                                                CallTimeout timeout) {
    wire::validateCommand(command);
    router::Reply reply = command.kind == wire::CommandKind::QueryOrders
                              ? backend_->queryOrders(command, timeout)
                              : backend_->execute(command, timeout);
    std::vector<OrderInfo> out;
    for (const auto& record : listItems(reply, wire::toString(command.kind))) {
        out.push_back(toOrderInfo(record));
    }
    return out;
}

Result<std::vector<OrderInfo>> TradingClient::getOrders(CallTimeout timeout) {
    return guarded<std::vector<OrderInfo>>("getOrders", [&] {
        return orderList(wire::Command::queryOrders(), timeout);
    });
}

Result<std::vector<OrderInfo>> TradingClient::getOrdersForSymbol(const Symbol& symbol,
                                                                 CallTimeout timeout) {
    return guarded<std::vector<OrderInfo>>("getOrdersForSymbol", [&] {
        if (symbol.empty()) throw ValidationError("symbol must not be empty");
        return orderList(wire::Command::queryOrders(symbol), timeout);
    });
}

Result<std::vector<OrderInfo>> TradingClient::getPendingOrders(CallTimeout timeout) {
    return guarded<std::vector<OrderInfo>>("getPendingOrders", [&] {
        return orderList(wire::Command::queryPendingOrders(), timeout);
    });
}

Result<DarwinStatus> TradingClient::getDarwinStatus(CallTimeout timeout) {
    return guarded<DarwinStatus>("getDarwinStatus", [&] {
        DarwinStatus status = toDarwinStatus(
            singleItem(backend_->execute(wire::Command::queryStatus(), timeout), "DARWINSTATUS"));
        status.mode = backend_->mode();
        status.metrics = backend_->metrics();
        return status;
    });
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

router::SubscriptionId TradingClient::onOrderUpdate(OrderUpdateHandler handler) {
    return backend_->subscribe(wire::Tag::ORDUPD,
        [handler = std::move(handler)](const wire::Record& record) {
            handler(toOrderUpdate(record));
        });
}

router::SubscriptionId TradingClient::onExecution(ExecutionHandler handler) {
    return backend_->subscribe(wire::Tag::EXEC,
        [handler = std::move(handler)](const wire::Record& record) {
            handler(toExecution(record));
        });
}

router::SubscriptionId TradingClient::onPortfolioUpdate(PortfolioHandler handler) {
    return backend_->subscribe(wire::Tag::STOCK,
        [handler = std::move(handler)](const wire::Record& record) {
            handler(toPortfolioPosition(record));
        });
}

router::SubscriptionId TradingClient::subscribe(const std::string& kind, router::Subscriber fn) {
    return backend_->subscribe(kind, std::move(fn));
}

bool TradingClient::unsubscribe(router::SubscriptionId id) {
    return backend_->unsubscribe(id);
}

// ---------------------------------------------------------------------------
// Simulation scaffolding
// ---------------------------------------------------------------------------

sim::SimulationEngine& TradingClient::simEngine() {
    auto* simulated = dynamic_cast<SimulatedTradingBackend*>(backend_.get());
    if (!simulated) {
        throw ValidationError("only available in simulation mode");
    }
    if (!isConnected()) {
        throw NotConnectedError("simulated session is not connected");
    }
    return simulated->engine();
}

Result<OrderInfo> TradingClient::simulateOrderExecution(const OrderId& order_id,
                                                        std::optional<Decimal> executed_price,
                                                        std::optional<Quantity> executed_quantity) {
    return guarded<OrderInfo>("simulateOrderExecution", [&] {
        return toOrderInfo(simEngine().simulateOrderExecution(order_id, executed_price,
                                                              executed_quantity));
    });
}

Result<Empty> TradingClient::addSimulatedPosition(const Symbol& symbol, Quantity quantity,
                                                  Decimal avg_price) {
    return guarded<Empty>("addSimulatedPosition", [&] {
        if (symbol.empty()) throw ValidationError("symbol must not be empty");
        if (quantity == 0) throw ValidationError("quantity must not be zero");
        if (avg_price.isNegative()) throw ValidationError("average price must not be negative");
        simEngine().addPosition(symbol, quantity, avg_price);
        return Empty{};
    });
}

Result<bool> TradingClient::removeSimulatedPosition(const Symbol& symbol) {
    return guarded<bool>("removeSimulatedPosition", [&] {
        return simEngine().removePosition(symbol);
    });
}

Result<AccountSnapshot> TradingClient::updateSimulatedAccount(std::optional<Decimal> liquidity,
                                                              std::optional<Decimal> equity) {
    return guarded<AccountSnapshot>("updateSimulatedAccount", [&] {
        if (liquidity && liquidity->isNegative()) {
            throw ValidationError("liquidity must not be negative");
        }
        sim::SimulationEngine& engine = simEngine();
        engine.updateAccount(liquidity, equity);
        return toAccountSnapshot(engine.accountRecord());
    });
}

} // namespace darwin::client
