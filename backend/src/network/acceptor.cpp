/**
 * Acceptor — Listens for incoming TCP connections from relay clients.
 *
 * A failed accept is logged and the loop re-arms after retry_delay, so a
 * persistent error such as EMFILE does not spin; only closing the acceptor
 * (operation_aborted) ends it. The accept loop, the retry timer and stop()
 * share one strand, so the listening socket is never touched concurrently.
 */

#include "network/acceptor.h"

#include <future>
#include <memory>

#include <spdlog/spdlog.h>

#include "network/connection.h"

Acceptor::Acceptor(asio::io_context& io, const asio::ip::tcp::endpoint& endpoint,
                   ConnectionRegistry& registry, InboundQueue& queue,
                   std::size_t max_message_bytes)
    : strand_(asio::make_strand(io)),
      acceptor_(io),
      retry_timer_(strand_),
      registry_(registry),
      queue_(queue),
      max_message_bytes_(max_message_bytes) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    endpoint_ = acceptor_.local_endpoint();
}

void Acceptor::start() {
    spdlog::info("Accepting connections on {}:{}",
                 endpoint_.address().to_string(), endpoint_.port());
    asio::post(strand_, [this] { do_accept(); });
}

void Acceptor::stop(const std::function<bool()>& io_running) {
    auto done = std::make_shared<std::promise<void>>();
    auto closed = done->get_future();
    asio::post(strand_, [this, done] {
        close_listener();
        done->set_value();
    });

    while (closed.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (!io_running()) {
            spdlog::warn("No I/O thread left, closing acceptor directly");
            close_listener();
            return;
        }
    }
}

void Acceptor::close_listener() {
    retry_timer_.cancel();
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec)
        spdlog::warn("Closing acceptor: {}", ec.message());
}

void Acceptor::do_accept() {
    acceptor_.async_accept(asio::bind_executor(strand_,
        [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }));
}

void Acceptor::on_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
        spdlog::debug("Accept loop stopped");
        return;
    }

    if (ec) {
        ++accept_errors_;
        spdlog::warn("Accept error: {}, retrying in {}ms", ec.message(), retry_delay.count());
        retry_timer_.expires_after(retry_delay);
        retry_timer_.async_wait(asio::bind_executor(strand_,
            [this](const asio::error_code& wait_ec) {
                if (!wait_ec && acceptor_.is_open())
                    do_accept();
            }));
        return;
    }

    auto connection = std::make_shared<Connection>(std::move(socket), next_id_++,
                                                   max_message_bytes_);

    connection->set_on_message([this](std::string message) {
        if (!queue_.push(std::move(message)))
            spdlog::debug("Inbound queue closed, dropping message");
    });
    connection->set_on_close([this](Connection::Id id) {
        if (registry_.remove(id))
            spdlog::debug("[conn {}] evicted, {} online", id, registry_.size());
    });

    registry_.add(connection);
    spdlog::info("[conn {}] {} connected, {} online", connection->id(),
                 connection->peer(), registry_.size());
    connection->start();

    do_accept();
}
