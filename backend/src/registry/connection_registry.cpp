#include "registry/connection_registry.h"

#include <algorithm>
#include <mutex>

void ConnectionRegistry::add(ConnectionPtr connection) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    connections_.push_back(std::move(connection));
}

bool ConnectionRegistry::remove(Connection::Id id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [id](const ConnectionPtr& c) { return c->id() == id; });
    if (it == connections_.end())
        return false;
    connections_.erase(it);
    return true;
}

std::vector<ConnectionRegistry::ConnectionPtr> ConnectionRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_;
}

std::size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

std::vector<ConnectionRegistry::ConnectionPtr> ConnectionRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<ConnectionPtr> held;
    held.swap(connections_);
    return held;
}
