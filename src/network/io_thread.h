#pragma once

#include "../common/asio_compat.h"
#include <optional>
#include <string>
#include <thread>

namespace darwin::client::network {

/// One boost::asio::io_context running on a dedicated background thread.
/// Hosts a session's read loop, write queue and heartbeat timer.
class IoThread {
public:
    explicit IoThread(std::string name);

    ~IoThread();

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

    /// Start the thread. Calling it again while running is a no-op.
    void start();

    /// Release the work guard, stop the io_context and join the thread.
    void stop();

    bool running() const { return thread_.joinable(); }

    /// True when called from the io thread itself.
    bool in_io_thread() const { return std::this_thread::get_id() == thread_.get_id(); }

    boost::asio::io_context& context() { return io_context_; }

private:
    using work_guard_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::string name_;
    boost::asio::io_context io_context_;
    std::optional<work_guard_t> work_guard_;
    std::thread thread_;
};

} // namespace darwin::client::network
