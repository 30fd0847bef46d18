#include "network/line_connection.h"

#include "common/errors.h"
#include "common/logger.h"
#include <chrono>
#include <future>

namespace darwin::client::network {

namespace {

struct ConnectAttempt {
    explicit ConnectAttempt(boost::asio::io_context& io) : socket(io), timer(io) {}

    boost::asio::ip::tcp::socket socket;
    boost::asio::steady_timer timer;
    bool done = false;
    bool timed_out = false;
    std::promise<boost::system::error_code> result;
};

} // anonymous namespace

LineConnection::Ptr LineConnection::connect(boost::asio::io_context& io, const std::string& host,
                                            uint16_t port, uint32_t timeout_ms) {
    const std::string target = host + ":" + std::to_string(port);

    boost::asio::ip::tcp::resolver resolver(io);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw ConnectionError("cannot resolve " + target + ": " + ec.message());
    }

    auto attempt = std::make_shared<ConnectAttempt>(io);
    auto future = attempt->result.get_future();

    // Both handlers run on the io thread, so done/timed_out need no lock.
    boost::asio::post(io, [attempt, endpoints, timeout_ms] {
        attempt->timer.expires_after(std::chrono::milliseconds(timeout_ms));
        attempt->timer.async_wait([attempt](const boost::system::error_code& timer_ec) {
            if (timer_ec || attempt->done) return;
            attempt->timed_out = true;
            boost::system::error_code ignored;
            attempt->socket.close(ignored);
        });
        boost::asio::async_connect(attempt->socket, endpoints,
            [attempt](const boost::system::error_code& connect_ec,
                      const boost::asio::ip::tcp::endpoint& /*ep*/) {
                attempt->done = true;
                attempt->timer.cancel();
                attempt->result.set_value(connect_ec);
            });
    });

    ec = future.get();
    if (attempt->timed_out) {
        throw ConnectionError("connect to " + target + " timed out after " +
                              std::to_string(timeout_ms) + " ms");
    }
    if (ec) {
        throw ConnectionError("connect to " + target + " failed: " + ec.message());
    }
    return create(std::move(attempt->socket));
}

LineConnection::LineConnection(boost::asio::ip::tcp::socket socket)
    : socket_(std::move(socket))
    , strand_(boost::asio::make_strand(socket_.get_executor())) {
    boost::system::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_endpoint_str_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    } else {
        remote_endpoint_str_ = "<unknown>";
    }
}

LineConnection::~LineConnection() {
    boost::system::error_code ec;
    socket_.close(ec);
}

LineConnection::Ptr LineConnection::create(boost::asio::ip::tcp::socket socket) {
    return Ptr(new LineConnection(std::move(socket)));
}

void LineConnection::start(LineCallback on_line, DisconnectCallback on_disconnect) {
    on_line_ = std::move(on_line);
    on_disconnect_ = std::move(on_disconnect);
    getLogger(LogCategory::NETWORK)->info("Connected to {}", remote_endpoint_str_);
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self] { do_read(); });
}

void LineConnection::send(std::string line) {
    line.push_back('\n');
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self, line = std::move(line)]() mutable {
        if (closed_) {
            getLogger(LogCategory::NETWORK)->debug("Dropping write to closed connection {}",
                                                   remote_endpoint_str_);
            return;
        }
        bool idle = write_queue_.empty();
        write_queue_.push_back(std::move(line));
        if (idle) do_write();
    });
}

void LineConnection::close() {
    if (closed_) return;
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self] {
        close_on_strand(boost::asio::error::operation_aborted);
    });
}

void LineConnection::close_on_strand(const boost::system::error_code& reason) {
    if (closed_.exchange(true)) return;

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    getLogger(LogCategory::NETWORK)->info("Connection to {} closed", remote_endpoint_str_);

    if (on_disconnect_) {
        auto cb = std::move(on_disconnect_);
        cb(reason);
    }
}

void LineConnection::do_read() {
    auto self = shared_from_this();
    boost::asio::async_read_until(
        socket_, read_buf_, '\n',
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t bytes) {
                if (closed_) return;
                if (ec) {
                    if (ec != boost::asio::error::eof &&
                        ec != boost::asio::error::operation_aborted) {
                        getLogger(LogCategory::NETWORK)->warn("Read error from {}: {}",
                                                              remote_endpoint_str_, ec.message());
                    }
                    close_on_strand(ec);
                    return;
                }

                auto begin = boost::asio::buffers_begin(read_buf_.data());
                std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes - 1));
                read_buf_.consume(bytes);
                if (!line.empty() && line.back() == '\r') line.pop_back();

                getLogger(LogCategory::NETWORK)->trace("<< {}", line);
                if (on_line_) on_line_(line);

                if (!closed_) do_read();
            }));
}

void LineConnection::do_write() {
    auto self = shared_from_this();
    getLogger(LogCategory::NETWORK)->trace(">> {}", write_queue_.front());
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(write_queue_.front()),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t /*bytes*/) {
                if (closed_) return;
                if (ec) {
                    getLogger(LogCategory::NETWORK)->warn("Write error to {}: {}",
                                                          remote_endpoint_str_, ec.message());
                    close_on_strand(ec);
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) do_write();
            }));
}

} // namespace darwin::client::network
