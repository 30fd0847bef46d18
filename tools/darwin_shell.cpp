// darwin_shell - Interactive client for the Darwin trading daemon
// Usage: darwin_shell [--config FILE] [--sim] [--log-level LEVEL] [--script]

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "client/historical_client.h"
#include "client/session_guard.h"
#include "client/trading_client.h"
#include "common/logger.h"
#include "config/config_loader.h"

using namespace darwin::client;

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------
static std::atomic<bool> g_running{true};
static std::mutex g_io_mutex;

static void signalHandler(int) { g_running = false; }

// Thread-safe print; event callbacks print from the session thread.
template <typename... Args>
static void tprint(Args&&... args) {
    std::lock_guard<std::mutex> lk(g_io_mutex);
    (std::cout << ... << std::forward<Args>(args));
    std::cout << std::flush;
}

// ---------------------------------------------------------------------------
// Command-line argument parsing
// ---------------------------------------------------------------------------
struct AppArgs {
    std::string config_path = "config/client_config.yaml";
    std::string log_level;   // empty => use config value
    bool simulation = false;
    bool script = false;     // no prompt, stop at end of input
};

static AppArgs parseArgs(int argc, char* argv[]) {
    AppArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (a == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (a == "--sim") {
            args.simulation = true;
        } else if (a == "--script") {
            args.script = true;
        } else if (a == "--help" || a == "-h") {
            std::cout << "Usage: darwin_shell [--config FILE] [--sim] "
                         "[--log-level LEVEL] [--script]\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            std::exit(1);
        }
    }
    return args;
}

static void printHelp() {
    tprint("Commands:\n"
           "  buy SYMBOL QTY [PRICE]        market order, or limit when PRICE is given\n"
           "  sell SYMBOL QTY [PRICE]\n"
           "  stop buy|sell SYMBOL QTY PRICE\n"
           "  cancel ORDER_ID | cancelall SYMBOL\n"
           "  modify ORDER_ID PRICE\n"
           "  account | avail | portfolio | orders [SYMBOL] | pending | status | metrics\n"
           "  fill ORDER_ID [PRICE [QTY]]   simulation only\n"
           "  candles SYMBOL DAYS | ticks SYMBOL DAYS\n"
           "  quit\n");
}

template <typename T>
static bool reportFailure(const Result<T>& r) {
    if (!r.success) {
        tprint("  ERROR [", toString(r.error_kind), "] ", r.error, "\n");
        return true;
    }
    return false;
}

static void printAck(const Result<OrderAck>& r) {
    if (reportFailure(r)) return;
    const OrderAck& a = r.data;
    if (a.accepted) {
        tprint("  OK ", a.order_id, " ", a.symbol, " ", toString(a.status), " qty=", a.quantity,
               " price=", a.price.toString(), a.reference.empty() ? "" : " ref=", a.reference,
               "\n");
    } else {
        tprint("  REJECTED ", a.order_id, " code=", a.error_code, " ", a.message, "\n");
    }
}

static void printOrders(const Result<std::vector<OrderInfo>>& r) {
    if (reportFailure(r)) return;
    if (r.data.empty()) tprint("  (no orders)\n");
    for (const auto& o : r.data) {
        tprint("  ", o.order_id, " ", o.symbol, " ", toString(o.side), " ", o.quantity, " @ ",
               o.price.toString(), " ", toString(o.status), " filled=", o.filled_quantity, "\n");
    }
}

static bool parseSideToken(const std::string& text, Side& side) {
    if (!parseSide(text, side)) {
        tprint("  side must be buy or sell\n");
        return false;
    }
    return true;
}

static bool parseDecimalToken(const std::string& text, Decimal& out) {
    if (!Decimal::tryParse(text, out)) {
        tprint("  not a decimal: ", text, "\n");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Dispatch one input line. Returns false on quit.
// ---------------------------------------------------------------------------
static bool handleLine(const std::string& line, TradingClient& trading,
                       HistoricalClient* historical) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) return true;

    if (cmd == "quit" || cmd == "exit") return false;

    if (cmd == "help") {
        printHelp();
    } else if (cmd == "buy" || cmd == "sell") {
        std::string symbol, price_text;
        Quantity qty = 0;
        if (!(in >> symbol >> qty)) { tprint("  usage: ", cmd, " SYMBOL QTY [PRICE]\n"); return true; }
        Side side = cmd == "buy" ? Side::Buy : Side::Sell;
        if (in >> price_text) {
            Decimal price;
            if (!parseDecimalToken(price_text, price)) return true;
            printAck(trading.placeLimitOrder(symbol, side, qty, price));
        } else {
            printAck(trading.placeMarketOrder(symbol, side, qty));
        }
    } else if (cmd == "stop") {
        std::string side_text, symbol, price_text;
        Quantity qty = 0;
        if (!(in >> side_text >> symbol >> qty >> price_text)) {
            tprint("  usage: stop buy|sell SYMBOL QTY PRICE\n");
            return true;
        }
        Side side;
        Decimal price;
        if (!parseSideToken(side_text, side) || !parseDecimalToken(price_text, price)) return true;
        printAck(trading.placeStopOrder(symbol, side, qty, price));
    } else if (cmd == "cancel") {
        std::string id;
        if (!(in >> id)) { tprint("  usage: cancel ORDER_ID\n"); return true; }
        printAck(trading.cancelOrder(id));
    } else if (cmd == "cancelall") {
        std::string symbol;
        if (!(in >> symbol)) { tprint("  usage: cancelall SYMBOL\n"); return true; }
        auto r = trading.cancelAllOrders(symbol);
        if (!reportFailure(r)) tprint("  cancelled ", r.data.size(), " orders\n");
    } else if (cmd == "modify") {
        std::string id, price_text;
        Decimal price;
        if (!(in >> id >> price_text)) { tprint("  usage: modify ORDER_ID PRICE\n"); return true; }
        if (!parseDecimalToken(price_text, price)) return true;
        printAck(trading.modifyOrder(id, price));
    } else if (cmd == "account") {
        auto r = trading.getAccountInfo();
        if (!reportFailure(r)) {
            tprint("  ", r.data.account_code, " liquidity=", r.data.liquidity.toString(),
                   " equity=", r.data.equity.toString(), " gain=", r.data.gain.toString(),
                   " env=", r.data.environment, "\n");
        }
    } else if (cmd == "avail") {
        auto r = trading.getAvailability();
        if (!reportFailure(r)) {
            tprint("  liquidity=", r.data.liquidity.toString(),
                   " buying_power=", r.data.buying_power.toString(), "\n");
        }
    } else if (cmd == "portfolio") {
        auto r = trading.getPortfolio();
        if (!reportFailure(r)) {
            if (r.data.empty()) tprint("  (no positions)\n");
            for (const auto& p : r.data) {
                tprint("  ", p.symbol, " qty=", p.quantity, " avg=", p.avg_price.toString(),
                       " gain=", p.gain.toString(), "\n");
            }
        }
    } else if (cmd == "orders") {
        std::string symbol;
        printOrders(in >> symbol ? trading.getOrdersForSymbol(symbol) : trading.getOrders());
    } else if (cmd == "pending") {
        printOrders(trading.getPendingOrders());
    } else if (cmd == "status") {
        auto r = trading.getDarwinStatus();
        if (!reportFailure(r)) {
            tprint("  ", r.data.connection_status, " trading=", r.data.trading_enabled ? "on" : "off",
                   " release=", r.data.release, " mode=", toString(r.data.mode), "\n");
        }
    } else if (cmd == "metrics") {
        auto m = trading.connectionMetrics();
        tprint("  state=", toString(m.state), " attempts=", m.connection_attempts,
               " ok=", m.successful_connections, " failed=", m.failed_connections,
               " uptime=", m.uptime_percent, "%\n");
    } else if (cmd == "fill") {
        std::string id, price_text;
        Quantity qty = 0;
        if (!(in >> id)) { tprint("  usage: fill ORDER_ID [PRICE [QTY]]\n"); return true; }
        std::optional<Decimal> price;
        std::optional<Quantity> quantity;
        if (in >> price_text) {
            Decimal p;
            if (!parseDecimalToken(price_text, p)) return true;
            price = p;
            if (in >> qty) quantity = qty;
        }
        auto r = trading.simulateOrderExecution(id, price, quantity);
        if (!reportFailure(r)) {
            tprint("  ", r.data.order_id, " ", toString(r.data.status), " filled=",
                   r.data.filled_quantity, " avg=", r.data.avg_price.toString(), "\n");
        }
    } else if (cmd == "candles" || cmd == "ticks") {
        if (!historical) { tprint("  historical data is not available in simulation mode\n"); return true; }
        std::string symbol;
        int64_t days = 0;
        if (!(in >> symbol >> days)) { tprint("  usage: ", cmd, " SYMBOL DAYS\n"); return true; }
        if (cmd == "candles") {
            auto r = historical->dailyCandles(symbol, days);
            if (!reportFailure(r)) {
                for (const Candle& c : r.data) {
                    tprint("  ", c.time.toString(), " O=", c.open.toString(), " H=", c.high.toString(),
                           " L=", c.low.toString(), " C=", c.close.toString(), " V=", c.volume, "\n");
                }
            }
        } else {
            auto r = historical->ticks(symbol, days);
            if (!reportFailure(r)) {
                for (const Tick& t : r.data) {
                    tprint("  ", t.time.toString(), " ", t.price.toString(), " x", t.size, "\n");
                }
            }
        }
    } else {
        tprint("  unknown command: ", cmd, " (try help)\n");
    }
    return true;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    AppArgs args = parseArgs(argc, argv);

    config::ClientConfig cfg;
    try {
        cfg = config::loadConfig(args.config_path);
        if (args.simulation) cfg.simulation.enabled = true;
        if (!args.log_level.empty()) cfg.logging.level = args.log_level;
        configureLogging(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    TradingClient trading(cfg);
    trading.onOrderUpdate([](const OrderUpdate& u) {
        tprint("[EVENT] ORDUPD ", u.order_id, " ", u.symbol, " ", toString(u.status),
               " filled=", u.filled_quantity, "/", u.quantity, "\n");
    });
    trading.onExecution([](const Execution& e) {
        tprint("[EVENT] EXEC ", e.order_id, " ", e.symbol, " ", e.executed_quantity, " @ ",
               e.executed_price.toString(), " remaining=", e.remaining_quantity, "\n");
    });

    SessionGuard<TradingClient> session(trading);
    if (!session) {
        std::cerr << "Cannot connect: " << session.result().error << "\n";
        return 1;
    }
    tprint("Connected (", toString(trading.mode()), " mode). Type help for commands.\n");

    std::unique_ptr<HistoricalClient> historical;
    std::unique_ptr<SessionGuard<HistoricalClient>> historical_session;
    if (!cfg.simulation.enabled) {
        historical = std::make_unique<HistoricalClient>(cfg);
        historical_session = std::make_unique<SessionGuard<HistoricalClient>>(*historical);
        if (!*historical_session) {
            tprint("Historical socket unavailable: ", historical_session->result().error, "\n");
            historical_session.reset();
            historical.reset();
        }
    }

    std::string line;
    while (g_running) {
        if (!args.script) tprint("darwin> ");
        if (!std::getline(std::cin, line)) break;
        if (!handleLine(line, trading, historical.get())) break;
    }

    tprint("Disconnecting\n");
    return 0;
}
