#pragma once

#include "events/DomainEvent.h"

#include <string>
#include <string_view>

namespace sessionrelay::relay {

// text/event-stream framing: [id: ...\n] event: ...\n data: ...\n \n
std::string format_frame(std::string_view event, std::string_view data, std::string_view id = {});

// event name = type, id = event id, data = serialized event
std::string format_event(const events::DomainEvent& e);

// Comment-only keepalive frame.
const std::string& heartbeat_frame();

} // namespace sessionrelay::relay
