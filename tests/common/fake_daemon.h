#pragma once

#include "common/asio_compat.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace darwin::client::test_support {

// ---------------------------------------------------------------------------
// Line-protocol stand-in for the daemon, listening on an ephemeral loopback
// port. Accepts one client at a time; each received line is recorded and
// passed to the handler, whose returned lines are written back in order.
// push() writes unsolicited lines from the test thread.
// ---------------------------------------------------------------------------
class FakeDaemon {
public:
    using Handler = std::function<std::vector<std::string>(const std::string& line)>;

    FakeDaemon()
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(
                             boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        doAccept();
        thread_ = std::thread([this] { io_.run(); });
    }

    ~FakeDaemon() {
        io_.stop();
        if (thread_.joinable()) thread_.join();
    }

    FakeDaemon(const FakeDaemon&) = delete;
    FakeDaemon& operator=(const FakeDaemon&) = delete;

    uint16_t port() const { return port_; }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // Reply to any line with nothing.
    void silence() {
        setHandler([](const std::string&) { return std::vector<std::string>{}; });
    }

    void push(const std::string& line) {
        boost::asio::post(io_, [this, line] { writeLine(line); });
    }

    // Close the current client connection from the daemon side.
    void dropClient() {
        boost::asio::post(io_, [this] {
            if (client_) {
                boost::system::error_code ec;
                client_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
                client_->close(ec);
                client_.reset();
            }
        });
    }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    // Count of received lines starting with prefix.
    size_t receivedCount(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& l : received_) {
            if (l.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    bool waitForReceived(const std::string& prefix, size_t count,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            size_t n = 0;
            for (const auto& l : received_) {
                if (l.compare(0, prefix.size(), prefix) == 0) ++n;
            }
            return n >= count;
        });
    }

    bool waitForClient(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return accepted_ > 0; });
    }

    size_t acceptedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_;
    }

private:
    using Socket = boost::asio::ip::tcp::socket;

    void doAccept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, Socket socket) {
            if (ec) return;
            client_ = std::make_shared<Socket>(std::move(socket));
            buffer_ = std::make_shared<boost::asio::streambuf>();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++accepted_;
            }
            cv_.notify_all();
            doRead(client_, buffer_);
            doAccept();
        });
    }

    void doRead(std::shared_ptr<Socket> socket, std::shared_ptr<boost::asio::streambuf> buf) {
        boost::asio::async_read_until(*socket, *buf, '\n',
            [this, socket, buf](const boost::system::error_code& ec, size_t) {
                if (ec) return;
                std::istream in(buf.get());
                std::string line;
                std::getline(in, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();

                Handler handler;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_.push_back(line);
                    handler = handler_;
                }
                cv_.notify_all();

                if (handler && socket == client_) {
                    for (const auto& reply : handler(line)) writeLine(reply);
                }
                doRead(socket, buf);
            });
    }

    // Runs on the io thread.
    void writeLine(const std::string& line) {
        if (!client_) return;
        boost::system::error_code ec;
        std::string framed = line + "\n";
        boost::asio::write(*client_, boost::asio::buffer(framed), ec);
    }

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread thread_;

    std::shared_ptr<Socket> client_;
    std::shared_ptr<boost::asio::streambuf> buffer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Handler handler_;
    std::vector<std::string> received_;
    size_t accepted_ = 0;
};

// A loopback port with nothing listening on it.
inline uint16_t unusedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace darwin::client::test_support
