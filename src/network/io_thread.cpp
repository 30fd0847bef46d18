#include "network/io_thread.h"

#include "common/logger.h"

namespace darwin::client::network {

IoThread::IoThread(std::string name)
    : name_(std::move(name)) {}

IoThread::~IoThread() {
    stop();
}

void IoThread::start() {
    if (thread_.joinable()) {
        return; // already running
    }

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    thread_ = std::thread([this] {
        getLogger(LogCategory::NETWORK)->debug("io thread '{}' started", name_);
        io_context_.run();
        getLogger(LogCategory::NETWORK)->debug("io thread '{}' stopped", name_);
    });
}

void IoThread::stop() {
    if (!thread_.joinable()) {
        return;
    }

    // Release the work guard so run() can return when idle.
    work_guard_.reset();
    io_context_.stop();

    if (in_io_thread()) {
        // Stopped from one of its own handlers; the thread exits on return.
        thread_.detach();
        return;
    }
    thread_.join();
}

} // namespace darwin::client::network
