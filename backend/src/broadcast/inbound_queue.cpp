#include "broadcast/inbound_queue.h"

bool InboundQueue::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        messages_.push_back(std::move(message));
    }
    ready_.notify_one();
    return true;
}

std::optional<std::string> InboundQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !messages_.empty(); });

    if (messages_.empty())
        return std::nullopt;

    std::string message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void InboundQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool InboundQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t InboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}
