#include "client/historical_client.h"

#include "client/reply_parser.h"
#include "common/errors.h"
#include "config/config_loader.h"
#include "wire/command.h"
#include "wire/schema.h"

namespace darwin::client {

namespace {

const config::ClientConfig& validated(const config::ClientConfig& config) {
    config::validateConfig(config);
    return config;
}

template <typename T, typename Fn>
Result<T> guarded(spdlog::logger& logger, const char* operation, Fn&& fn) {
    try {
        return Result<T>::ok(fn());
    } catch (const ClientError& e) {
        logger.warn("{} failed: {} ({})", operation, e.what(), toString(e.kind()));
        return Result<T>::fail(e);
    }
}

} // namespace

HistoricalClient::HistoricalClient(const config::ClientConfig& config)
    : HistoricalClient(validated(config).historical, config.session) {}

HistoricalClient::HistoricalClient(const config::EndpointConfig& endpoint,
                                   const config::SessionConfig& session)
    : connection_("historical", endpoint, session, /*heartbeat=*/false)
    , logger_(getLogger(LogCategory::CLIENT)) {}

HistoricalClient::~HistoricalClient() {
    disconnect();
}

Result<Empty> HistoricalClient::connect() {
    return guarded<Empty>(*logger_, "connect", [&] {
        connection_.connect();
        return Empty{};
    });
}

Result<Empty> HistoricalClient::disconnect() {
    return guarded<Empty>(*logger_, "disconnect", [&] {
        connection_.disconnect();
        return Empty{};
    });
}

std::vector<wire::Record> HistoricalClient::fetch(const wire::Command& command,
                                                  CallTimeout timeout) {
    wire::validateCommand(command);
    router::Reply reply = connection_.request(command, timeout);
    if (reply.isError()) {
        int64_t code = reply.errorCode();
        throw RemoteError(std::string(wire::toString(command.kind)) + " answered ERR " +
                          std::to_string(code) + " (" + wire::DaemonError::describe(code) + ")");
    }
    logger_->debug("{} returned {} records", wire::toString(command.kind), reply.items.size());
    return std::move(reply.items);
}

Result<CandleSeries> HistoricalClient::dailyCandles(const Symbol& symbol, int64_t days,
                                                    CallTimeout timeout) {
    return guarded<CandleSeries>(*logger_, "dailyCandles", [&] {
        return CandleSeries(fetch(wire::Command::dailyCandles(symbol, days), timeout), &toCandle);
    });
}

Result<CandleSeries> HistoricalClient::intradayCandles(const Symbol& symbol, int64_t days,
                                                       int64_t period_seconds,
                                                       CallTimeout timeout) {
    return guarded<CandleSeries>(*logger_, "intradayCandles", [&] {
        return CandleSeries(
            fetch(wire::Command::intradayCandles(symbol, days, period_seconds), timeout),
            &toCandle);
    });
}

Result<TickSeries> HistoricalClient::ticks(const Symbol& symbol, int64_t days,
                                           CallTimeout timeout) {
    return guarded<TickSeries>(*logger_, "ticks", [&] {
        return TickSeries(fetch(wire::Command::ticks(symbol, days), timeout), &toTick);
    });
}

Result<CandleSeries> HistoricalClient::candleRange(const Symbol& symbol, Timestamp from,
                                                   Timestamp to, int64_t period_seconds,
                                                   bool include_after_hours,
                                                   CallTimeout timeout) {
    return guarded<CandleSeries>(*logger_, "candleRange", [&] {
        return CandleSeries(fetch(wire::Command::candleRange(symbol, from, to, period_seconds,
                                                             include_after_hours),
                                  timeout),
                            &toCandle);
    });
}

} // namespace darwin::client
