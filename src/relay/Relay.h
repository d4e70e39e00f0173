#pragma once

#include "events/ConnectionRegistry.h"
#include "events/EventLog.h"
#include "events/EventSequencer.hpp"
#include "events/Sharding.hpp"
#include "relay/Dispatcher.h"
#include "relay/RelayOptions.hpp"
#include "relay/RetentionSweeper.h"
#include "relay/StreamHandler.h"

#include <boost/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sessionrelay::relay {

struct RelayStats {
    std::size_t sessions = 0;
    std::size_t total_events = 0;
    std::size_t connections = 0;
};

// Owns the shared state (event log, connection registry, session locks) and
// the components operating on it. One instance per server, injected wherever
// it is needed.
class Relay {
public:
    explicit Relay(RelayOptions options = {});

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    // Entry points; all sweep opportunistically first.
    OpenResult connect(const events::ConnectionPtr& conn,
                       std::optional<std::string_view> last_event_id = std::nullopt);
    DispatchReport dispatch(const events::SessionId& session_id,
                            const std::vector<events::DomainEvent>& events);
    PublishResult publish(const events::SessionId& session_id,
                          std::string type,
                          boost::json::value payload);

    bool heartbeat(const events::ConnectionPtr& conn) { return stream_.heartbeat(conn); }
    void disconnect(const events::ConnectionPtr& conn) { stream_.close(conn); }

    RelayStats stats() const;

    const RelayOptions& options() const noexcept { return options_; }
    const events::EventLog& log() const noexcept { return log_; }
    const events::ConnectionRegistry& registry() const noexcept { return registry_; }
    RetentionSweeper& sweeper() noexcept { return sweeper_; }

private:
    RelayOptions options_;
    events::EventLog log_;
    events::ConnectionRegistry registry_;
    events::SessionLocks locks_;
    events::EventSequencer sequencer_;
    StreamHandler stream_;
    Dispatcher dispatcher_;
    RetentionSweeper sweeper_;
};

} // namespace sessionrelay::relay
