#pragma once

#include "../common/asio_compat.h"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace darwin::client::network {

/// Lines longer than this are treated as a broken stream.
static constexpr std::size_t kMaxLineLength = 64 * 1024;

/// One TCP connection to the daemon carrying newline-terminated text lines.
/// Reads and writes run on a strand; send() may be called from any thread.
class LineConnection : public std::enable_shared_from_this<LineConnection> {
public:
    using Ptr = std::shared_ptr<LineConnection>;
    using LineCallback = std::function<void(const std::string&)>;
    using DisconnectCallback = std::function<void(const boost::system::error_code&)>;

    /// Resolve and connect within timeout_ms. Throws ConnectionError on
    /// resolution failure, refusal or timeout. The io_context must be running
    /// on another thread.
    static Ptr connect(boost::asio::io_context& io, const std::string& host,
                       uint16_t port, uint32_t timeout_ms);

    /// Wrap an already connected socket.
    static Ptr create(boost::asio::ip::tcp::socket socket);

    ~LineConnection();

    LineConnection(const LineConnection&) = delete;
    LineConnection& operator=(const LineConnection&) = delete;

    /// Begin the read loop. on_line gets each line without its terminator;
    /// on_disconnect fires once, when the stream ends, errors or is closed.
    void start(LineCallback on_line, DisconnectCallback on_disconnect);

    /// Queue one line for writing; the newline is appended here.
    /// Lines are written whole and in call order.
    void send(std::string line);

    /// Close the socket. Safe to call repeatedly and from any thread.
    void close();

    bool is_open() const { return !closed_; }

    std::string remote_endpoint_str() const { return remote_endpoint_str_; }

private:
    explicit LineConnection(boost::asio::ip::tcp::socket socket);

    void do_read();
    void do_write();
    void close_on_strand(const boost::system::error_code& reason);

    boost::asio::ip::tcp::socket socket_;
    boost::asio::strand<boost::asio::ip::tcp::socket::executor_type> strand_;

    std::string remote_endpoint_str_;
    boost::asio::streambuf read_buf_{kMaxLineLength};
    std::deque<std::string> write_queue_;

    LineCallback on_line_;
    DisconnectCallback on_disconnect_;
    std::atomic<bool> closed_{false};
};

} // namespace darwin::client::network
