#pragma once

#include "events/DomainEvent.h"

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sessionrelay::actions {

struct ActionResult {
    bool success = false;
    std::optional<boost::json::value> data;
    std::optional<std::string> error;
    std::vector<events::DomainEvent> events;  // in emission order
    bool published = false;                   // events already went through the relay
};

// Performs a tool call against some session and reports the resulting events.
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    virtual ActionResult handle(const std::string& tool, const boost::json::object& args) = 0;
};

} // namespace sessionrelay::actions
