/**
 * Broadcaster — Single consumer of the inbound queue.
 *
 * Each message is encoded once and the same frame is shared by every
 * destination. Messages leave in queue order, and each connection writes
 * its frames in the order they were handed over, so a sender's messages
 * reach every recipient in the order they were sent.
 */

#include "broadcast/broadcaster.h"

#include <memory>

#include <spdlog/spdlog.h>

#include "codec/line_codec.h"

Broadcaster::Broadcaster(InboundQueue& queue, ConnectionRegistry& registry)
    : queue_(queue), registry_(registry) {}

Broadcaster::~Broadcaster() {
    if (thread_.joinable()) {
        queue_.close();
        thread_.join();
    }
}

void Broadcaster::start() {
    thread_ = std::thread([this] { run(); });
}

void Broadcaster::join() {
    if (thread_.joinable())
        thread_.join();
}

std::size_t Broadcaster::broadcast(const std::string& message) {
    auto frame = std::make_shared<const std::string>(LineCodec::encode(message));

    std::size_t delivered = 0;
    auto targets = registry_.snapshot();
    for (const auto& connection : targets) {
        if (connection->deliver(frame))
            ++delivered;
        else
            spdlog::debug("[broadcast] skipping closed conn {}", connection->id());
    }

    ++rounds_;
    spdlog::debug("[broadcast] {} bytes to {}/{} connections",
                  message.size(), delivered, targets.size());
    return delivered;
}

void Broadcaster::run() {
    spdlog::debug("[broadcast] thread started");
    while (auto message = queue_.pop())
        broadcast(*message);
    spdlog::info("[broadcast] stopped after {} rounds", rounds_.load());
}
