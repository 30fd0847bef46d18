#pragma once

#include "../common/logger.h"
#include "../wire/record.h"
#include "../wire/schema.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace darwin::client::router {

// What a synchronous call waits for.
struct Expectation {
    std::string key;     // correlation key of the reply records
    std::string command; // verb, matched against END/ERR command fields
    bool list = false;   // reply is item records terminated by END

    static Expectation forVerb(const wire::RecordSchema& verb);
};

// Records resolving one synchronous call. A single-record reply has one
// item and no terminal; a list reply has its items and the END record; a
// daemon error has the ERR record as terminal.
struct Reply {
    std::vector<wire::Record> items;
    std::optional<wire::Record> terminal;

    bool isError() const;
    int64_t errorCode() const; // 0 unless isError()
};

using Subscriber = std::function<void(const wire::Record&)>;
using SubscriptionId = uint64_t;

// Subscribe to every asynchronous record regardless of kind.
inline constexpr const char* kAllKinds = "*";

// ---------------------------------------------------------------------------
// Dual-path dispatch of decoded records.
//
// Pending table: per correlation key, a FIFO of calls. Only the head of a
// key's queue is in flight; the rest wait their turn, so two same-kind
// calls never cross-resolve.
//
// Subscriber table: per record kind, callbacks receiving asynchronous
// records in arrival order, invoked on the dispatching thread outside the
// lock.
// ---------------------------------------------------------------------------
class ResponseRouter {
public:
    ResponseRouter();

    ResponseRouter(const ResponseRouter&) = delete;
    ResponseRouter& operator=(const ResponseRouter&) = delete;

    // Queue a call, invoke send once it is in flight and block until its
    // reply arrives. The timeout covers queueing and waiting.
    // Throws NotConnectedError while closed, TimeoutError on deadline,
    // TransportError when cancelled by close(); exceptions from send
    // propagate after the call is withdrawn.
    Reply call(const Expectation& expect, const std::function<void()>& send,
               std::chrono::milliseconds timeout);

    // Entry point for the read loop (or the simulation engine).
    void dispatch(const wire::Record& record);

    SubscriptionId subscribe(const std::string& kind, Subscriber fn);
    bool unsubscribe(SubscriptionId id);

    // Accept calls.
    void open();

    // Stop accepting calls and resolve every queued call with
    // TransportError(reason).
    void close(const std::string& reason);

    bool isOpen() const;
    size_t pendingCount() const;
    size_t subscriberCount() const;

private:
    struct PendingCall {
        Expectation expect;
        bool active = false;
        bool done = false;
        bool cancelled = false;
        std::string cancel_reason; // message only; may be empty
        Reply reply;
    };
    using CallPtr = std::shared_ptr<PendingCall>;

    struct Subscription {
        SubscriptionId id;
        std::string kind;
        Subscriber fn;
    };

    void withdraw(const CallPtr& call);
    CallPtr findByCommand(const std::string& command, bool is_error) const;
    void complete(const CallPtr& call);
    void fanOut(const wire::Record& record);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;

    // std::map keeps queue references stable while other keys are added.
    std::map<std::string, std::deque<CallPtr>> pending_;
    std::vector<Subscription> subscribers_;
    SubscriptionId next_subscription_id_ = 1;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace darwin::client::router
