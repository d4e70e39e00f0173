#pragma once

#include "actions/ActionHandler.h"
#include "relay/Relay.h"

#include <string>
#include <string_view>

namespace sessionrelay::actions {

struct ToolResponse {
    unsigned status = 200;
    std::string body;  // JSON
};

// Ingress for `{"tool": ..., "args": {...}}` calls: runs the handler and routes
// its events to the relay (session from args.sessionId, else the first event)
// unless the handler already published them.
class ToolRouter {
public:
    ToolRouter(ActionHandler& handler, relay::Relay& relay);

    ToolResponse handle(std::string_view body);

private:
    ActionHandler& handler_;
    relay::Relay& relay_;
};

} // namespace sessionrelay::actions
