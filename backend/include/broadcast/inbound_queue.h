#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

/**
 * Unbounded FIFO of decoded messages.
 *
 * Every Receiver pushes, the Broadcaster is the only consumer. After
 * close(), pushes are rejected and pop() drains what is left, then
 * returns std::nullopt instead of blocking.
 */
class InboundQueue {
public:
    /// Returns false once the queue is closed.
    bool push(std::string message);

    /// Block until a message is available or the queue is closed and empty.
    std::optional<std::string> pop();

    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::string> messages_;
    bool closed_ = false;
};
