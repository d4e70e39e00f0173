#include "relay/Relay.h"

#include <utility>

namespace sessionrelay::relay {

Relay::Relay(RelayOptions options)
    : options_(options),
      log_(options_.max_events_per_session),
      stream_(log_, registry_, locks_),
      dispatcher_(log_, registry_, locks_, sequencer_),
      sweeper_(log_, registry_, locks_, options_.session_timeout, options_.sweep_interval) {}

OpenResult Relay::connect(const events::ConnectionPtr& conn,
                          std::optional<std::string_view> last_event_id) {
    sweeper_.maybe_sweep();
    return stream_.open(conn, last_event_id);
}

DispatchReport Relay::dispatch(const events::SessionId& session_id,
                               const std::vector<events::DomainEvent>& events) {
    sweeper_.maybe_sweep();
    return dispatcher_.dispatch(session_id, events);
}

PublishResult Relay::publish(const events::SessionId& session_id,
                             std::string type,
                             boost::json::value payload) {
    sweeper_.maybe_sweep();
    return dispatcher_.publish(session_id, std::move(type), std::move(payload));
}

RelayStats Relay::stats() const {
    RelayStats s;
    s.sessions = log_.session_count();
    s.total_events = log_.total_events();
    s.connections = registry_.total_connections();
    return s;
}

} // namespace sessionrelay::relay
