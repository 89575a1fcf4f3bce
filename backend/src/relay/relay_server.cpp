/**
 * RelayServer — Wires the relay together.
 *
 * Socket I/O runs on io_threads workers sharing one io_context; the
 * broadcaster has its own thread. Shutdown order matters: the acceptor is
 * closed first so nothing new is registered, then every connection is
 * closed, then the queue, and only then are the I/O threads allowed to
 * run out of work.
 */

#include "relay/relay_server.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

RelayServer::RelayServer(ServerConfig config)
    : config_(std::move(config)),
      broadcaster_(queue_, registry_) {}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_)
        throw std::logic_error("relay server already started");

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);
    acceptor_ = std::make_unique<Acceptor>(io_, endpoint, registry_, queue_,
                                           config_.max_message_bytes);
    started_ = true;
    running_ = true;

    work_.emplace(asio::make_work_guard(io_));
    broadcaster_.start();
    acceptor_->start();

    threads_.reserve(config_.io_threads);
    active_workers_ = config_.io_threads;
    for (std::size_t i = 0; i < config_.io_threads; ++i) {
        threads_.emplace_back([this, i] {
            try {
                io_.run();
            } catch (const std::exception& e) {
                spdlog::critical("I/O thread {} failed: {}", i, e.what());
            }
            --active_workers_;
        });
    }

    spdlog::info("Relay listening on {}:{} ({} I/O threads, max message {} bytes)",
                 config_.host, port(), config_.io_threads, config_.max_message_bytes);
}

void RelayServer::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_)
            return;
        running_ = false;
    }

    spdlog::info("Relay shutting down");
    acceptor_->stop([this] { return active_workers_.load() > 0; });

    auto connections = registry_.clear();
    for (const auto& connection : connections)
        connection->close();

    queue_.close();
    broadcaster_.join();

    work_.reset();
    for (auto& t : threads_)
        t.join();
    threads_.clear();

    spdlog::info("Relay stopped: {} connections served, {} messages broadcast",
                 acceptor_->accepted(), broadcaster_.rounds());
}

uint16_t RelayServer::port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : config_.port;
}
