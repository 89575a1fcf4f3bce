#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "broadcast/inbound_queue.h"
#include "registry/connection_registry.h"

/**
 * Async TCP acceptor for relay clients.
 *
 * Every accepted socket becomes a Connection that is registered before
 * its read loop starts, feeds the inbound queue, and removes itself from
 * the registry when it closes.
 */
class Acceptor {
public:
    /// Binds and listens immediately; throws asio::system_error on failure.
    Acceptor(asio::io_context& io, const asio::ip::tcp::endpoint& endpoint,
             ConnectionRegistry& registry, InboundQueue& queue,
             std::size_t max_message_bytes);

    void start();

    /// Close the listening socket and wait until the accept loop has seen
    /// it. If `io_running` reports that no I/O thread is left to run the
    /// close, the socket is closed directly. Must not be called from an
    /// I/O thread.
    void stop(const std::function<bool()>& io_running);

    /// Bound address; carries the real port when constructed with port 0.
    [[nodiscard]] const asio::ip::tcp::endpoint& local_endpoint() const { return endpoint_; }
    [[nodiscard]] uint64_t accepted() const { return next_id_.load() - 1; }
    [[nodiscard]] uint64_t accept_errors() const { return accept_errors_.load(); }

    /// Delay before accepting again after a failed accept.
    static constexpr std::chrono::milliseconds retry_delay{100};

private:
    void do_accept();
    void on_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);
    void close_listener();

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::acceptor acceptor_;
    asio::steady_timer retry_timer_;
    asio::ip::tcp::endpoint endpoint_;
    ConnectionRegistry& registry_;
    InboundQueue& queue_;
    std::size_t max_message_bytes_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> accept_errors_{0};
};
