/**
 * RelayClient — Connects to a relay server and exchanges line frames.
 *
 * receive() runs an async read on the private io_context for at most the
 * given time and cancels it on timeout, which keeps reads blocking from
 * the caller's point of view without ever hanging.
 */

#include "network/relay_client.h"

#include <spdlog/spdlog.h>

#include "codec/line_codec.h"

RelayClient::RelayClient() : socket_(io_) {}

bool RelayClient::connect(const std::string& host, uint16_t port) {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        spdlog::error("Cannot resolve {}: {}", host, ec.message());
        return false;
    }

    asio::connect(socket_, endpoints, ec);
    if (ec) {
        spdlog::error("Cannot connect to {}:{}: {}", host, port, ec.message());
        return false;
    }

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec)
        spdlog::debug("TCP_NODELAY not set: {}", ec.message());
    return true;
}

bool RelayClient::send(const std::string& text) {
    asio::error_code ec;
    asio::write(socket_, asio::buffer(LineCodec::encode(text)), ec);
    if (ec) {
        spdlog::warn("Send failed: {}", ec.message());
        return false;
    }
    return true;
}

std::optional<std::string> RelayClient::receive(std::chrono::milliseconds timeout) {
    asio::error_code result = asio::error::would_block;
    std::size_t length = 0;

    asio::async_read_until(socket_, buffer_, LineCodec::delimiter,
        [&](const asio::error_code& ec, std::size_t n) {
            result = ec;
            length = n;
        });

    io_.restart();
    io_.run_for(timeout);

    if (result == asio::error::would_block) {
        socket_.cancel();
        io_.restart();
        io_.run();
        // The read may have completed between the timeout and the cancel.
        if (result == asio::error::operation_aborted)
            return std::nullopt;
    }

    if (result) {
        if (result != asio::error::eof)
            spdlog::debug("Receive failed: {}", result.message());
        disconnect();
        return std::nullopt;
    }

    auto begin = asio::buffers_begin(buffer_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 1));
    buffer_.consume(length);
    return LineCodec::decode(line);
}

void RelayClient::disconnect() {
    if (!socket_.is_open())
        return;

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec)
        spdlog::debug("Close failed: {}", ec.message());
}
