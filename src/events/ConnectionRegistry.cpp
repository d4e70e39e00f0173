#include "events/ConnectionRegistry.h"

#include <utility>

namespace sessionrelay::events {

void ConnectionRegistry::add(const SessionId& session_id, ConnectionPtr conn) {
    if (!conn) return;
    sessions_.with(session_id, [&](auto& map) { map[session_id].insert(std::move(conn)); });
}

bool ConnectionRegistry::remove(const SessionId& session_id, const ConnectionPtr& conn) {
    return sessions_.with(session_id, [&](auto& map) {
        auto it = map.find(session_id);
        if (it == map.end()) return false;

        const bool erased = it->second.erase(conn) > 0;
        if (it->second.empty()) map.erase(it);
        return erased;
    });
}

std::vector<ConnectionPtr> ConnectionRegistry::snapshot(const SessionId& session_id) const {
    return sessions_.with(session_id, [&](const auto& map) {
        std::vector<ConnectionPtr> out;
        auto it = map.find(session_id);
        if (it != map.end()) out.assign(it->second.begin(), it->second.end());
        return out;
    });
}

std::vector<ConnectionPtr> ConnectionRegistry::erase_session(const SessionId& session_id) {
    return sessions_.with(session_id, [&](auto& map) {
        std::vector<ConnectionPtr> out;
        auto it = map.find(session_id);
        if (it == map.end()) return out;

        out.assign(it->second.begin(), it->second.end());
        map.erase(it);
        return out;
    });
}

std::size_t ConnectionRegistry::connection_count(const SessionId& session_id) const {
    return sessions_.with(session_id, [&](const auto& map) -> std::size_t {
        auto it = map.find(session_id);
        return it == map.end() ? 0 : it->second.size();
    });
}

std::size_t ConnectionRegistry::total_connections() const {
    std::size_t n = 0;
    sessions_.for_each_shard([&](const auto& map) {
        for (const auto& [id, conns] : map) n += conns.size();
    });
    return n;
}

} // namespace sessionrelay::events
