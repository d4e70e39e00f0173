#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sessionrelay::events {

using SessionId = std::string;
using Seq = std::uint64_t;

struct DomainEvent {
    std::string id;          // "<session_id>:<seq>", the resumption token
    Seq seq = 0;
    std::string type;
    SessionId session_id;
    boost::json::value payload;
    std::int64_t timestamp = 0;  // unix ms
};

std::string make_event_id(std::string_view session_id, Seq seq);

// "<sessionId>:<seq>" -> seq. Anything else is treated as no token.
std::optional<Seq> parse_last_event_id(std::string_view token);

std::int64_t now_unix_ms();

// boost::json customization points (found via ADL)
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const DomainEvent& e);
DomainEvent tag_invoke(boost::json::value_to_tag<DomainEvent>, const boost::json::value& jv);

std::string to_json_string(const DomainEvent& e);

} // namespace sessionrelay::events
