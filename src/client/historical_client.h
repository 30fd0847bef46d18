#pragma once

#include "domain.h"
#include "../common/logger.h"
#include "../common/result.h"
#include "../config/client_config.h"
#include "../session/connection_manager.h"
#include "../wire/record.h"
#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Finite, restartable sequence of historical entries. The records of one
// reply are shared between copies; each dereference converts one record.
// ---------------------------------------------------------------------------
template <typename T>
class RecordSeries {
public:
    using Converter = T (*)(const wire::Record&);

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = T;

        const_iterator() = default;
        const_iterator(typename std::vector<wire::Record>::const_iterator it, Converter convert)
            : it_(it), convert_(convert) {}

        T operator*() const { return convert_(*it_); }

        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++it_; return tmp; }

        bool operator==(const const_iterator& o) const { return it_ == o.it_; }
        bool operator!=(const const_iterator& o) const { return it_ != o.it_; }

    private:
        typename std::vector<wire::Record>::const_iterator it_;
        Converter convert_ = nullptr;
    };

    RecordSeries() : records_(std::make_shared<std::vector<wire::Record>>()) {}
    RecordSeries(std::vector<wire::Record> records, Converter convert)
        : records_(std::make_shared<std::vector<wire::Record>>(std::move(records)))
        , convert_(convert) {}

    const_iterator begin() const { return {records_->begin(), convert_}; }
    const_iterator end() const { return {records_->end(), convert_}; }

    size_t size() const { return records_->size(); }
    bool empty() const { return records_->empty(); }

    // Throws std::out_of_range.
    T at(size_t i) const { return convert_(records_->at(i)); }

    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(size());
        for (const auto& r : *records_) out.push_back(convert_(r));
        return out;
    }

private:
    std::shared_ptr<std::vector<wire::Record>> records_;
    Converter convert_ = nullptr;
};

using CandleSeries = RecordSeries<Candle>;
using TickSeries = RecordSeries<Tick>;

// ---------------------------------------------------------------------------
// Historical data facade over the daemon's historical socket. Live only.
// ---------------------------------------------------------------------------
class HistoricalClient {
public:
    explicit HistoricalClient(const config::ClientConfig& config);
    HistoricalClient(const config::EndpointConfig& endpoint, const config::SessionConfig& session);
    ~HistoricalClient();

    HistoricalClient(const HistoricalClient&) = delete;
    HistoricalClient& operator=(const HistoricalClient&) = delete;

    Result<Empty> connect();
    Result<Empty> disconnect();
    bool isConnected() const { return connection_.isConnected(); }

    // A timeout overrides session.request_timeout_ms for that call.
    Result<CandleSeries> dailyCandles(const Symbol& symbol, int64_t days,
                                      CallTimeout timeout = std::nullopt);
    Result<CandleSeries> intradayCandles(const Symbol& symbol, int64_t days, int64_t period_seconds,
                                         CallTimeout timeout = std::nullopt);
    Result<TickSeries> ticks(const Symbol& symbol, int64_t days, CallTimeout timeout = std::nullopt);

    // from and to are calendar dates (Timestamp::fromDate), inclusive.
    Result<CandleSeries> candleRange(const Symbol& symbol, Timestamp from, Timestamp to,
                                     int64_t period_seconds, bool include_after_hours,
                                     CallTimeout timeout = std::nullopt);

    session::ConnectionMetrics connectionMetrics() const { return connection_.metrics(); }

private:
    // Validate, send and collect the items of the list reply.
    std::vector<wire::Record> fetch(const wire::Command& command, CallTimeout timeout);

    session::ConnectionManager connection_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace darwin::client
