#pragma once

#include "actions/ActionHandler.h"
#include "relay/Relay.h"

namespace sessionrelay::actions {

// Built-in handler: `emit_event {sessionId, type, payload?}` publishes one
// event with the next seq of that session.
class EmitActionHandler : public ActionHandler {
public:
    static constexpr const char* kEmitTool = "emit_event";

    explicit EmitActionHandler(relay::Relay& relay);

    ActionResult handle(const std::string& tool, const boost::json::object& args) override;

private:
    relay::Relay& relay_;
};

} // namespace sessionrelay::actions
