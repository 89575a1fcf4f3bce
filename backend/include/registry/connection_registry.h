#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "network/connection.h"

/**
 * The set of live connections, in accept order.
 *
 * add/remove take the lock exclusively; snapshot/size take it shared.
 * A snapshot is a copy: later adds and removes do not affect it.
 */
class ConnectionRegistry {
public:
    using ConnectionPtr = std::shared_ptr<Connection>;

    void add(ConnectionPtr connection);

    /// Returns false if no connection with this id is registered.
    bool remove(Connection::Id id);

    [[nodiscard]] std::vector<ConnectionPtr> snapshot() const;
    [[nodiscard]] std::size_t size() const;

    /// Empty the registry and hand back what it held.
    std::vector<ConnectionPtr> clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<ConnectionPtr> connections_;
};
