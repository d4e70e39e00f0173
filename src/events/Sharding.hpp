#pragma once

#include "events/DomainEvent.h"

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace sessionrelay::events {

inline constexpr std::size_t kShardCount = 16;

inline std::size_t shard_index(const SessionId& session_id, std::size_t shards) {
    return std::hash<SessionId>{}(session_id) % shards;
}

// Session-keyed map split into independently locked shards, so unrelated
// sessions rarely contend and there is no global lock.
template <typename Value, std::size_t N = kShardCount>
class ShardedMap {
public:
    using Map = std::unordered_map<SessionId, Value>;

    // Runs fn(map) with the shard owning session_id locked.
    template <typename Fn>
    decltype(auto) with(const SessionId& session_id, Fn&& fn) {
        Shard& s = shards_[shard_index(session_id, N)];
        std::lock_guard<std::mutex> lk(s.mu);
        return std::forward<Fn>(fn)(s.map);
    }

    template <typename Fn>
    decltype(auto) with(const SessionId& session_id, Fn&& fn) const {
        const Shard& s = shards_[shard_index(session_id, N)];
        std::lock_guard<std::mutex> lk(s.mu);
        return std::forward<Fn>(fn)(static_cast<const Map&>(s.map));
    }

    // Visits each shard in turn, one lock at a time.
    template <typename Fn>
    void for_each_shard(Fn&& fn) {
        for (Shard& s : shards_) {
            std::lock_guard<std::mutex> lk(s.mu);
            fn(s.map);
        }
    }

    template <typename Fn>
    void for_each_shard(Fn&& fn) const {
        for (const Shard& s : shards_) {
            std::lock_guard<std::mutex> lk(s.mu);
            fn(static_cast<const Map&>(s.map));
        }
    }

private:
    struct Shard {
        mutable std::mutex mu;
        Map map;
    };

    std::array<Shard, N> shards_;
};

// Striped per-session critical section. Held across "append + push" and
// "register + replay" so a connection never sees live events interleaved
// with its own replay.
class SessionLocks {
public:
    static constexpr std::size_t kStripes = 64;

    std::mutex& for_session(const SessionId& session_id) {
        return stripes_[shard_index(session_id, kStripes)];
    }

private:
    std::array<std::mutex, kStripes> stripes_;
};

} // namespace sessionrelay::events
