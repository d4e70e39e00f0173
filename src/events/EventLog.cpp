#include "events/EventLog.h"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace sessionrelay::events {

EventLog::EventLog(std::size_t max_events_per_session)
    : max_events_(max_events_per_session == 0 ? kDefaultMaxEvents : max_events_per_session) {}

std::vector<DomainEvent> EventLog::append(const SessionId& session_id,
                                          const std::vector<DomainEvent>& events,
                                          Clock::time_point now) {
    std::vector<DomainEvent> accepted;
    accepted.reserve(events.size());

    buffers_.with(session_id, [&](auto& map) {
        Buffer& buffer = map[session_id];

        for (const DomainEvent& e : events) {
            if (!buffer.events.empty() && e.seq <= buffer.events.back().seq) {
                std::cerr << "[EventLog] " << session_id << ": dropped seq " << e.seq
                          << ", last is " << buffer.events.back().seq << "\n";
                continue;
            }
            buffer.events.push_back(e);
            accepted.push_back(e);
        }
        buffer.last_activity = now;

        while (buffer.events.size() > max_events_) buffer.events.pop_front();
    });

    return accepted;
}

std::vector<DomainEvent> EventLog::since(const SessionId& session_id, Seq after_seq) const {
    return buffers_.with(session_id, [&](const auto& map) {
        std::vector<DomainEvent> out;
        auto it = map.find(session_id);
        if (it == map.end()) return out;

        const auto& events = it->second.events;
        std::copy_if(events.begin(), events.end(), std::back_inserter(out),
                     [after_seq](const DomainEvent& e) { return e.seq > after_seq; });
        return out;
    });
}

std::optional<Seq> EventLog::last_seq(const SessionId& session_id) const {
    return buffers_.with(session_id, [&](const auto& map) -> std::optional<Seq> {
        auto it = map.find(session_id);
        if (it == map.end() || it->second.events.empty()) return std::nullopt;
        return it->second.events.back().seq;
    });
}

std::size_t EventLog::event_count(const SessionId& session_id) const {
    return buffers_.with(session_id, [&](const auto& map) -> std::size_t {
        auto it = map.find(session_id);
        return it == map.end() ? 0 : it->second.events.size();
    });
}

std::size_t EventLog::session_count() const {
    std::size_t n = 0;
    buffers_.for_each_shard([&](const auto& map) { n += map.size(); });
    return n;
}

std::size_t EventLog::total_events() const {
    std::size_t n = 0;
    buffers_.for_each_shard([&](const auto& map) {
        for (const auto& [id, buffer] : map) n += buffer.events.size();
    });
    return n;
}

std::vector<SessionId> EventLog::idle_sessions(Clock::time_point now, Clock::duration timeout) const {
    std::vector<SessionId> idle;
    buffers_.for_each_shard([&](const auto& map) {
        for (const auto& [id, buffer] : map) {
            if (now - buffer.last_activity > timeout) idle.push_back(id);
        }
    });
    return idle;
}

bool EventLog::erase_if_idle(const SessionId& session_id, Clock::time_point now, Clock::duration timeout) {
    return buffers_.with(session_id, [&](auto& map) {
        auto it = map.find(session_id);
        if (it == map.end() || now - it->second.last_activity <= timeout) return false;
        map.erase(it);
        return true;
    });
}

} // namespace sessionrelay::events
