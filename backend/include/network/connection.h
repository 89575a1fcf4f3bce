#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

/**
 * One accepted client.
 *
 * Runs the connection's read loop and its write queue. Reads, writes and
 * close are serialized on the connection's strand. The first read error,
 * write error or bad frame moves it from Open to Closed: the socket is
 * closed and the close handler fires exactly once.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Id             = uint64_t;
    using Frame          = std::shared_ptr<const std::string>;
    using MessageHandler = std::function<void(std::string message)>;
    using CloseHandler   = std::function<void(Id id)>;

    Connection(asio::ip::tcp::socket socket, Id id, std::size_t max_message_bytes);

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    /// Invoked on the strand for every decoded message, in arrival order.
    void set_on_message(MessageHandler cb);

    /// Invoked once, on the strand, when the connection closes.
    void set_on_close(CloseHandler cb);

    /// Start reading. Call once, after the connection is registered.
    void start();

    /// Queue an encoded frame. Returns false if the connection is closed.
    bool deliver(Frame frame);

    /// Close from any thread. Later calls are no-ops.
    void close();

    [[nodiscard]] Id id() const { return id_; }
    [[nodiscard]] bool is_open() const { return open_.load(); }
    [[nodiscard]] const std::string& peer() const { return peer_; }

private:
    void do_read();
    void on_read(const asio::error_code& ec, std::size_t length);
    void do_write();
    void do_close();

    asio::ip::tcp::socket socket_;
    asio::strand<asio::ip::tcp::socket::executor_type> strand_;
    asio::streambuf read_buffer_;
    const std::size_t max_message_bytes_;
    std::deque<Frame> write_queue_;

    MessageHandler on_message_;
    CloseHandler   on_close_;

    std::atomic<bool> open_{true};
    const Id id_;
    std::string peer_;
};
