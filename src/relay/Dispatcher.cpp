#include "relay/Dispatcher.h"

#include "relay/SseFrame.h"

#include <mutex>
#include <utility>

namespace sessionrelay::relay {

Dispatcher::Dispatcher(events::EventLog& log,
                       events::ConnectionRegistry& registry,
                       events::SessionLocks& locks,
                       events::EventSequencer& sequencer)
    : log_(log), registry_(registry), locks_(locks), sequencer_(sequencer) {}

DispatchReport Dispatcher::dispatch(const events::SessionId& session_id,
                                    const std::vector<events::DomainEvent>& events) {
    std::vector<events::ConnectionPtr> dead;
    DispatchReport report;
    {
        std::lock_guard<std::mutex> lk(locks_.for_session(session_id));
        report = append_and_push(session_id, events, dead);
    }

    for (const auto& conn : dead) conn->close();
    report.pruned = dead.size();
    return report;
}

PublishResult Dispatcher::publish(const events::SessionId& session_id,
                                  std::string type,
                                  boost::json::value payload) {
    std::vector<events::ConnectionPtr> dead;
    PublishResult result;
    {
        std::lock_guard<std::mutex> lk(locks_.for_session(session_id));
        result.event = sequencer_.make(session_id, std::move(type), std::move(payload));
        result.report = append_and_push(session_id, {result.event}, dead);
    }

    for (const auto& conn : dead) conn->close();
    result.report.pruned = dead.size();
    return result;
}

DispatchReport Dispatcher::append_and_push(const events::SessionId& session_id,
                                           const std::vector<events::DomainEvent>& events,
                                           std::vector<events::ConnectionPtr>& dead) {
    DispatchReport report;

    const auto accepted = log_.append(session_id, events);
    report.appended = accepted.size();
    if (!accepted.empty()) sequencer_.observe(session_id, accepted.back().seq);

    std::vector<std::string> frames;
    frames.reserve(accepted.size());
    for (const auto& e : accepted) frames.push_back(format_event(e));

    for (const auto& conn : registry_.snapshot(session_id)) {
        bool alive = true;
        for (const auto& frame : frames) {
            if (!conn->send(frame)) {
                alive = false;
                break;
            }
        }

        if (alive) {
            ++report.delivered;
        } else {
            registry_.remove(session_id, conn);
            dead.push_back(conn);
        }
    }

    return report;
}

} // namespace sessionrelay::relay
