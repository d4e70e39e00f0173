#pragma once

#include "events/DomainEvent.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace sessionrelay::events {

// Hands out strictly increasing seq numbers per session, starting at 1.
// Callers that need seq order to match append order must hold the session's
// stripe lock across make() and the append.
class EventSequencer {
public:
    EventSequencer() = default;

    EventSequencer(const EventSequencer&) = delete;
    EventSequencer& operator=(const EventSequencer&) = delete;

    // Main API
    DomainEvent make(const SessionId& session_id, std::string type, boost::json::value payload) {
        DomainEvent e;
        e.seq = next(session_id);
        e.id = make_event_id(session_id, e.seq);
        e.type = std::move(type);
        e.session_id = session_id;
        e.payload = std::move(payload);
        e.timestamp = now_unix_ms();
        return e;
    }

    Seq next(const SessionId& session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        return ++counters_[session_id];
    }

    Seq current(const SessionId& session_id) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = counters_.find(session_id);
        return it == counters_.end() ? 0 : it->second;
    }

    // Raises the counter so the next seq lands above an externally stamped one.
    void observe(const SessionId& session_id, Seq seq) {
        std::lock_guard<std::mutex> lk(mu_);
        Seq& counter = counters_[session_id];
        if (seq > counter) counter = seq;
    }

private:
    mutable std::mutex mu_;
    // Never evicted: restarting a session at 1 would fall below clients' saved ids.
    std::unordered_map<SessionId, Seq> counters_;
};

} // namespace sessionrelay::events
