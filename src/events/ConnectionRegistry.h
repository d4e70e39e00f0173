#pragma once

#include "events/Connection.hpp"
#include "events/Sharding.hpp"

#include <cstddef>
#include <memory>
#include <unordered_set>
#include <vector>

namespace sessionrelay::events {

using ConnectionPtr = std::shared_ptr<Connection>;

// Open streams per session. A session's entry disappears with its last connection.
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void add(const SessionId& session_id, ConnectionPtr conn);

    // Returns false if the connection was not registered (already pruned).
    bool remove(const SessionId& session_id, const ConnectionPtr& conn);

    std::vector<ConnectionPtr> snapshot(const SessionId& session_id) const;

    // Drops the whole set and hands it back so the caller can close the streams.
    std::vector<ConnectionPtr> erase_session(const SessionId& session_id);

    std::size_t connection_count(const SessionId& session_id) const;
    std::size_t total_connections() const;

private:
    ShardedMap<std::unordered_set<ConnectionPtr>> sessions_;
};

} // namespace sessionrelay::events
