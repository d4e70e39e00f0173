#pragma once

#include "events/ConnectionRegistry.h"
#include "events/EventLog.h"
#include "events/Sharding.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace sessionrelay::relay {

enum class StreamState {
    Rejected,  // no session id, nothing was touched
    Live,
    Closed
};

struct OpenResult {
    StreamState state = StreamState::Rejected;
    events::Seq last_seq = 0;
    std::size_t replayed = 0;
};

// Server side of one streaming client: CONNECTING -> LIVE -> CLOSED.
//
// open() registers the connection, acknowledges it with `connected`, and, when
// the client presented a well-formed "<sessionId>:<seq>" token, replays what the
// log still holds past that seq followed by a `reconnected` summary. Live events
// then arrive through the Dispatcher; heartbeat() is driven by the transport's
// timer. Any failed write ends in close(), which is never reported upward.
class StreamHandler {
public:
    StreamHandler(events::EventLog& log,
                  events::ConnectionRegistry& registry,
                  events::SessionLocks& locks);

    OpenResult open(const events::ConnectionPtr& conn,
                    std::optional<std::string_view> last_event_id = std::nullopt);

    // false if the connection was closed because the write failed
    bool heartbeat(const events::ConnectionPtr& conn);

    void close(const events::ConnectionPtr& conn);

private:
    events::EventLog& log_;
    events::ConnectionRegistry& registry_;
    events::SessionLocks& locks_;
};

} // namespace sessionrelay::relay
