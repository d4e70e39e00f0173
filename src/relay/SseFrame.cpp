#include "relay/SseFrame.h"

namespace sessionrelay::relay {

std::string format_frame(std::string_view event, std::string_view data, std::string_view id) {
    std::string out;
    out.reserve(event.size() + data.size() + id.size() + 24);

    if (!id.empty()) {
        out += "id: ";
        out += id;
        out += '\n';
    }
    out += "event: ";
    out += event;
    out += '\n';

    // multi-line payloads need one data: line each
    std::size_t start = 0;
    for (;;) {
        const auto nl = data.find('\n', start);
        out += "data: ";
        out += data.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        out += '\n';
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    out += '\n';
    return out;
}

std::string format_event(const events::DomainEvent& e) {
    return format_frame(e.type, events::to_json_string(e), e.id);
}

const std::string& heartbeat_frame() {
    static const std::string frame = ": heartbeat\n\n";
    return frame;
}

} // namespace sessionrelay::relay
