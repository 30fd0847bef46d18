#pragma once

#include "../common/result.h"

namespace darwin::client {

// ---------------------------------------------------------------------------
// Scoped session: connects on construction, disconnects on every exit path.
// Works with any client exposing connect() / disconnect() returning
// Result<Empty> (TradingClient, HistoricalClient).
//
//   SessionGuard<TradingClient> session(client);
//   if (!session) return session.result().error;
//   client.placeLimitOrder(...);
// ---------------------------------------------------------------------------
template <typename Client>
class SessionGuard {
public:
    explicit SessionGuard(Client& client)
        : client_(client), result_(client.connect()) {}

    ~SessionGuard() { client_.disconnect(); }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    bool connected() const { return result_.success; }
    explicit operator bool() const { return result_.success; }

    // Outcome of the connect attempt.
    const Result<Empty>& result() const { return result_; }

    Client& client() { return client_; }
    Client* operator->() { return &client_; }

private:
    Client& client_;
    Result<Empty> result_;
};

} // namespace darwin::client
