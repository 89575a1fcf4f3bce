#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "broadcast/inbound_queue.h"
#include "registry/connection_registry.h"

/**
 * Fans every queued message out to all registered connections.
 *
 * Runs on its own thread until the inbound queue is closed and drained.
 * A failing destination only affects itself: the frame is queued on each
 * connection independently and write errors close that connection alone.
 */
class Broadcaster {
public:
    Broadcaster(InboundQueue& queue, ConnectionRegistry& registry);
    ~Broadcaster();

    Broadcaster(const Broadcaster&)            = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    void start();

    /// Wait for the thread to finish. Close the queue first.
    void join();

    /// Deliver one message to the current registry snapshot.
    /// Returns the number of connections the frame was queued on.
    std::size_t broadcast(const std::string& message);

    [[nodiscard]] uint64_t rounds() const { return rounds_.load(); }

private:
    void run();

    InboundQueue& queue_;
    ConnectionRegistry& registry_;
    std::thread thread_;
    std::atomic<uint64_t> rounds_{0};
};
