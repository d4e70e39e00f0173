#pragma once

#include "events/ConnectionRegistry.h"
#include "events/EventLog.h"
#include "events/EventSequencer.hpp"
#include "events/Sharding.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace sessionrelay::relay {

struct DispatchReport {
    std::size_t appended = 0;   // events the log accepted
    std::size_t delivered = 0;  // connections that took every event
    std::size_t pruned = 0;     // connections dropped on a failed write
};

struct PublishResult {
    events::DomainEvent event;
    DispatchReport report;
};

// Append, then best-effort push to every live connection of the session.
// Everything happens under the session's stripe lock, so the order events
// enter the log is the order every connection sees them.
class Dispatcher {
public:
    Dispatcher(events::EventLog& log,
               events::ConnectionRegistry& registry,
               events::SessionLocks& locks,
               events::EventSequencer& sequencer);

    // Events stamped by the producer. Ones at or below the session's last seq are dropped.
    DispatchReport dispatch(const events::SessionId& session_id,
                            const std::vector<events::DomainEvent>& events);

    // Stamps the next seq of the session and dispatches the event.
    PublishResult publish(const events::SessionId& session_id,
                          std::string type,
                          boost::json::value payload);

private:
    // Caller holds the session's stripe lock.
    DispatchReport append_and_push(const events::SessionId& session_id,
                                   const std::vector<events::DomainEvent>& events,
                                   std::vector<events::ConnectionPtr>& dead);

    events::EventLog& log_;
    events::ConnectionRegistry& registry_;
    events::SessionLocks& locks_;
    events::EventSequencer& sequencer_;
};

} // namespace sessionrelay::relay
