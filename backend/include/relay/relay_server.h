#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "broadcast/broadcaster.h"
#include "broadcast/inbound_queue.h"
#include "config/server_config.h"
#include "network/acceptor.h"
#include "registry/connection_registry.h"

/**
 * The running relay: I/O threads, acceptor, registry, inbound queue and
 * broadcaster, started and stopped together.
 */
class RelayServer {
public:
    explicit RelayServer(ServerConfig config);
    ~RelayServer();

    RelayServer(const RelayServer&)            = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// Bind, listen and start all threads. Throws asio::system_error
    /// if the address cannot be bound. A server starts at most once.
    void start();

    /// Stop accepting, close every connection, drain the broadcaster and
    /// join all threads. Safe to call more than once; not from an I/O thread.
    void stop();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] std::size_t connection_count() const { return registry_.size(); }
    [[nodiscard]] uint64_t broadcast_rounds() const { return broadcaster_.rounds(); }
    [[nodiscard]] uint64_t accept_errors() const { return acceptor_ ? acceptor_->accept_errors() : 0; }
    [[nodiscard]] const ServerConfig& config() const { return config_; }

private:
    ServerConfig config_;

    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> active_workers_{0};

    ConnectionRegistry registry_;
    InboundQueue queue_;
    Broadcaster broadcaster_;
    std::unique_ptr<Acceptor> acceptor_;

    std::mutex state_mutex_;
    bool started_ = false;
    bool running_ = false;
};
