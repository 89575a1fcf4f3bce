#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * Blocking TCP client for a relay server. Owns its own io_context, so
 * one instance must not be shared between threads.
 */
class RelayClient {
public:
    RelayClient();

    bool connect(const std::string& host, uint16_t port);

    /// Encode and write one message.
    bool send(const std::string& text);

    /// Wait up to `timeout` for the next message. Returns std::nullopt on
    /// timeout, disconnect or a malformed frame; a disconnect also closes
    /// the socket.
    std::optional<std::string> receive(std::chrono::milliseconds timeout);

    void disconnect();

    [[nodiscard]] bool is_connected() const { return socket_.is_open(); }

private:
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
};
