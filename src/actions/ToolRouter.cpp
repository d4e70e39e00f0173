#include "actions/ToolRouter.h"

#include <boost/json.hpp>

#include <exception>
#include <iostream>

namespace sessionrelay::actions {

namespace json = boost::json;

static ToolResponse reply(unsigned status, const json::object& body) {
    return ToolResponse{status, json::serialize(body)};
}

static ToolResponse error_reply(unsigned status, const std::string& message) {
    return reply(status, {{"success", false}, {"error", message}});
}

ToolRouter::ToolRouter(ActionHandler& handler, relay::Relay& relay)
    : handler_(handler), relay_(relay) {}

ToolResponse ToolRouter::handle(std::string_view body) {
    json::error_code ec;
    json::value request = json::parse(json::string_view(body.data(), body.size()), ec);
    if (ec) return error_reply(500, ec.message());

    const auto* obj = request.if_object();
    const json::value* tool = obj ? obj->if_contains("tool") : nullptr;
    if (!tool || !tool->is_string() || tool->get_string().empty()) {
        return error_reply(400, "Missing or invalid \"tool\" field");
    }

    json::object args;
    if (const auto* a = obj->if_contains("args"); a && !a->is_null()) {
        if (!a->is_object()) return error_reply(400, "Invalid \"args\" field");
        args = a->get_object();
    }

    ActionResult result;
    try {
        result = handler_.handle(json::value_to<std::string>(*tool), args);
    } catch (const std::exception& e) {
        std::cerr << "[tool] " << tool->get_string() << ": " << e.what() << "\n";
        return error_reply(500, e.what());
    }

    if (!result.events.empty() && !result.published) {
        events::SessionId session_id;
        if (const auto* sid = args.if_contains("sessionId"); sid && sid->is_string()) {
            session_id = json::value_to<std::string>(*sid);
        } else {
            session_id = result.events.front().session_id;
        }
        if (!session_id.empty()) relay_.dispatch(session_id, result.events);
    }

    json::object out{{"success", result.success}};
    if (result.data) out["data"] = *result.data;
    if (result.error) out["error"] = *result.error;
    if (!result.events.empty()) {
        json::array list;
        for (const auto& e : result.events) list.push_back(json::value_from(e));
        out["events"] = std::move(list);
    }

    return reply(result.success ? 200 : 400, out);
}

} // namespace sessionrelay::actions
