#include "actions/EmitActionHandler.h"

#include <utility>

namespace sessionrelay::actions {

namespace json = boost::json;

static ActionResult failure(std::string message) {
    ActionResult r;
    r.error = std::move(message);
    return r;
}

EmitActionHandler::EmitActionHandler(relay::Relay& relay) : relay_(relay) {}

ActionResult EmitActionHandler::handle(const std::string& tool, const json::object& args) {
    if (tool != kEmitTool) return failure("Unknown tool: " + tool);

    const auto* sid = args.if_contains("sessionId");
    if (!sid || !sid->is_string() || sid->get_string().empty()) {
        return failure("Missing or invalid \"sessionId\"");
    }

    const auto* type = args.if_contains("type");
    if (!type || !type->is_string() || type->get_string().empty()) {
        return failure("Missing or invalid \"type\"");
    }

    json::value payload = json::object{};
    if (const auto* p = args.if_contains("payload")) payload = *p;

    auto published = relay_.publish(json::value_to<std::string>(*sid),
                                    json::value_to<std::string>(*type),
                                    std::move(payload));

    ActionResult r;
    r.success = true;
    r.data = json::object{{"eventId", published.event.id}, {"seq", published.event.seq}};
    r.events.push_back(std::move(published.event));
    r.published = true;
    return r;
}

} // namespace sessionrelay::actions
