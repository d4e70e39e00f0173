#include "events/DomainEvent.h"

#include <charconv>
#include <chrono>
#include <stdexcept>

namespace sessionrelay::events {

namespace json = boost::json;

std::string make_event_id(std::string_view session_id, Seq seq) {
    std::string id(session_id);
    id.push_back(':');
    id += std::to_string(seq);
    return id;
}

std::optional<Seq> parse_last_event_id(std::string_view token) {
    const auto colon = token.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    // exactly two parts
    const std::string_view digits = token.substr(colon + 1);
    if (digits.find(':') != std::string_view::npos) return std::nullopt;
    if (digits.empty()) return std::nullopt;

    Seq seq = 0;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, seq);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return seq;
}

std::int64_t now_unix_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void tag_invoke(json::value_from_tag, json::value& jv, const DomainEvent& e) {
    jv = json::object{
        {"id", e.id},
        {"seq", e.seq},
        {"type", e.type},
        {"timestamp", e.timestamp},
        {"sessionId", e.session_id},
        {"payload", e.payload}
    };
}

DomainEvent tag_invoke(json::value_to_tag<DomainEvent>, const json::value& jv) {
    const auto* obj = jv.if_object();
    if (!obj) throw std::invalid_argument("event must be an object");

    auto require = [obj](const char* key) -> const json::value& {
        const auto* v = obj->if_contains(key);
        if (!v) throw std::invalid_argument(std::string("event is missing \"") + key + "\"");
        return *v;
    };

    DomainEvent e;
    e.id = json::value_to<std::string>(require("id"));
    e.seq = json::value_to<Seq>(require("seq"));
    e.type = json::value_to<std::string>(require("type"));
    e.session_id = json::value_to<std::string>(require("sessionId"));

    if (const auto* p = obj->if_contains("payload")) e.payload = *p;
    if (const auto* ts = obj->if_contains("timestamp")) {
        e.timestamp = json::value_to<std::int64_t>(*ts);
    } else {
        e.timestamp = now_unix_ms();
    }
    return e;
}

std::string to_json_string(const DomainEvent& e) {
    return json::serialize(json::value_from(e));
}

} // namespace sessionrelay::events
