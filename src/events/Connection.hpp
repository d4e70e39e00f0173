#pragma once

#include "events/DomainEvent.h"

#include <string>

namespace sessionrelay::events {

// One client's open output stream. Implementations serialize their own writes
// (single writer per connection); send() only has to queue the frame.
class Connection {
public:
    virtual ~Connection() = default;

    virtual const SessionId& session_id() const noexcept = 0;

    // false once the stream is known to be dead; the frame is dropped
    virtual bool send(std::string frame) = 0;

    // Stops the heartbeat and shuts the stream down. Idempotent.
    virtual void close() = 0;
};

} // namespace sessionrelay::events
