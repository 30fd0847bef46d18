#include "router/response_router.h"

#include "common/errors.h"
#include <algorithm>

namespace darwin::client::router {

Expectation Expectation::forVerb(const wire::RecordSchema& verb) {
    return Expectation{verb.reply_key, verb.tag, verb.list_reply};
}

bool Reply::isError() const {
    return terminal && terminal->kind() == wire::Tag::ERR;
}

int64_t Reply::errorCode() const {
    return isError() ? terminal->getInt("error_code") : 0;
}

namespace {

std::string cancelMessage(const std::string& command, const std::string& reason) {
    return command + " cancelled" + (reason.empty() ? std::string() : ": " + reason);
}

} // anonymous namespace

ResponseRouter::ResponseRouter()
    : logger_(getLogger(LogCategory::ROUTER)) {}

// ---------------------------------------------------------------------------
// Synchronous calls
// ---------------------------------------------------------------------------

Reply ResponseRouter::call(const Expectation& expect, const std::function<void()>& send,
                           std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto call = std::make_shared<PendingCall>();
    call->expect = expect;

    std::unique_lock<std::mutex> lock(mutex_);
    if (!open_) {
        throw NotConnectedError("cannot send " + expect.command + ": session is not connected");
    }

    auto& queue = pending_[expect.key];
    queue.push_back(call);
    if (queue.size() > 1) {
        logger_->debug("{} queued behind {} call(s) on {}", expect.command,
                       queue.size() - 1, expect.key);
    }

    // Wait for our turn at the head of the key's queue.
    bool ready = cv_.wait_until(lock, deadline, [&] {
        return call->cancelled || pending_[expect.key].front() == call;
    });
    if (call->cancelled) {
        withdraw(call);
        throw TransportError(cancelMessage(expect.command, call->cancel_reason));
    }
    if (!ready) {
        withdraw(call);
        throw TimeoutError(expect.command + " timed out waiting for a previous " +
                           expect.key + " request");
    }

    // In flight before the line leaves, so the reply can never beat it.
    call->active = true;
    lock.unlock();
    try {
        send();
    } catch (const ClientError&) {
        lock.lock();
        withdraw(call);
        throw;
    }
    lock.lock();

    ready = cv_.wait_until(lock, deadline, [&] {
        return call->done || call->cancelled;
    });
    withdraw(call);
    if (call->done) {
        return std::move(call->reply);
    }
    if (call->cancelled) {
        throw TransportError(cancelMessage(expect.command, call->cancel_reason));
    }
    throw TimeoutError(expect.command + " timed out after " +
                       std::to_string(timeout.count()) + " ms");
}

void ResponseRouter::withdraw(const CallPtr& call) {
    auto it = pending_.find(call->expect.key);
    if (it == pending_.end()) return;
    auto& queue = it->second;
    queue.erase(std::remove(queue.begin(), queue.end(), call), queue.end());
    if (queue.empty()) {
        pending_.erase(it);
    }
    // The next call of this key may now proceed.
    cv_.notify_all();
}

void ResponseRouter::complete(const CallPtr& call) {
    call->done = true;
    call->active = false;
    cv_.notify_all();
}

ResponseRouter::CallPtr ResponseRouter::findByCommand(const std::string& command,
                                                      bool is_error) const {
    CallPtr only_active;
    size_t active_count = 0;
    for (const auto& [key, queue] : pending_) {
        if (queue.empty() || !queue.front()->active) continue;
        const CallPtr& head = queue.front();
        if (head->expect.command == command) return head;
        only_active = head;
        ++active_count;
    }
    // The daemon sometimes reports errors without naming the command.
    if (is_error && active_count == 1) return only_active;
    return nullptr;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

void ResponseRouter::dispatch(const wire::Record& record) {
    const wire::RecordSchema& schema = record.schema();
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (record.kind() == wire::Tag::END || record.kind() == wire::Tag::ERR) {
            bool is_error = record.kind() == wire::Tag::ERR;
            CallPtr call = findByCommand(record.getString("command"), is_error);
            if (!call) {
                if (is_error) {
                    logger_->warn("Dropping ERR {} for {}: no matching call in flight",
                                  record.getInt("error_code"), record.getString("command"));
                } else {
                    logger_->debug("No call waiting for END {}", record.getString("command"));
                }
                return;
            }
            call->reply.terminal = record;
            complete(call);
            return;
        }

        if (!schema.asynchronous && !schema.reply_key.empty()) {
            auto it = pending_.find(schema.reply_key);
            if (it != pending_.end() && !it->second.empty() && it->second.front()->active) {
                const CallPtr& call = it->second.front();
                call->reply.items.push_back(record);
                if (!call->expect.list) {
                    complete(call);
                }
                return;
            }
        }
    }

    // Event, or a reply-shaped record nobody asked for (unsolicited push).
    fanOut(record);
}

void ResponseRouter::fanOut(const wire::Record& record) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscribers_) {
            if (sub.kind == record.kind() || sub.kind == kAllKinds) {
                targets.push_back(sub.fn);
            }
        }
    }
    if (targets.empty()) {
        logger_->debug("No subscriber for {} record", record.kind());
        return;
    }
    for (const auto& fn : targets) {
        try {
            fn(record);
        } catch (const std::exception& e) {
            logger_->error("Subscriber for {} threw: {}", record.kind(), e.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Subscribers
// ---------------------------------------------------------------------------

SubscriptionId ResponseRouter::subscribe(const std::string& kind, Subscriber fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_subscription_id_++;
    subscribers_.push_back(Subscription{id, kind, std::move(fn)});
    return id;
}

bool ResponseRouter::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void ResponseRouter::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

void ResponseRouter::close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    size_t cancelled = 0;
    for (auto& [key, queue] : pending_) {
        for (auto& call : queue) {
            if (!call->done) {
                call->cancelled = true;
                call->cancel_reason = reason;
                ++cancelled;
            }
        }
    }
    if (cancelled > 0) {
        logger_->info("Cancelled {} pending call(s): {}", cancelled, reason);
    }
    cv_.notify_all();
}

bool ResponseRouter::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t ResponseRouter::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [key, queue] : pending_) n += queue.size();
    return n;
}

size_t ResponseRouter::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace darwin::client::router
