#pragma once

#include "events/DomainEvent.h"
#include "events/Sharding.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace sessionrelay::events {

// Per-session, capacity-bounded, append-only replay buffer.
class EventLog {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kDefaultMaxEvents = 100;

    explicit EventLog(std::size_t max_events_per_session = kDefaultMaxEvents);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Creates the buffer on first use. Oldest events are dropped past capacity.
    // An event whose seq does not exceed the session's last seq is rejected, so
    // every buffer stays in strictly ascending seq order. Returns the accepted events.
    std::vector<DomainEvent> append(const SessionId& session_id,
                const std::vector<DomainEvent>& events,
                Clock::time_point now = Clock::now());

    // Buffered events with seq > after_seq, oldest first. Empty for unknown sessions.
    std::vector<DomainEvent> since(const SessionId& session_id, Seq after_seq) const;

    std::optional<Seq> last_seq(const SessionId& session_id) const;
    std::size_t event_count(const SessionId& session_id) const;
    std::size_t session_count() const;
    std::size_t total_events() const;
    std::size_t capacity() const noexcept { return max_events_; }

    std::vector<SessionId> idle_sessions(Clock::time_point now, Clock::duration timeout) const;

    // Removes the buffer only if it is still idle at `now`.
    bool erase_if_idle(const SessionId& session_id, Clock::time_point now, Clock::duration timeout);

private:
    struct Buffer {
        std::deque<DomainEvent> events;
        Clock::time_point last_activity{};
    };

    std::size_t max_events_;
    ShardedMap<Buffer> buffers_;
};

} // namespace sessionrelay::events
