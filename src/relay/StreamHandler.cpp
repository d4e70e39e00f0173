#include "relay/StreamHandler.h"

#include "relay/SseFrame.h"

#include <boost/json.hpp>

#include <mutex>

namespace sessionrelay::relay {

namespace json = boost::json;

StreamHandler::StreamHandler(events::EventLog& log,
                             events::ConnectionRegistry& registry,
                             events::SessionLocks& locks)
    : log_(log), registry_(registry), locks_(locks) {}

OpenResult StreamHandler::open(const events::ConnectionPtr& conn,
                               std::optional<std::string_view> last_event_id) {
    OpenResult result;
    if (!conn || conn->session_id().empty()) return result;

    const events::SessionId& session_id = conn->session_id();

    // malformed or absent token: seq 0, no replay
    std::optional<events::Seq> resume_from;
    if (last_event_id) resume_from = events::parse_last_event_id(*last_event_id);
    result.last_seq = resume_from.value_or(0);

    bool ok = true;
    {
        std::lock_guard<std::mutex> lk(locks_.for_session(session_id));
        registry_.add(session_id, conn);

        ok = conn->send(format_frame("connected", json::serialize(json::object{
            {"sessionId", session_id},
            {"lastSeq", result.last_seq}
        })));

        if (ok && resume_from) {
            const auto missed = log_.since(session_id, result.last_seq);
            for (const auto& e : missed) {
                if (!conn->send(format_event(e))) {
                    ok = false;
                    break;
                }
                ++result.replayed;
            }

            if (ok && !missed.empty()) {
                ok = conn->send(format_frame("reconnected", json::serialize(json::object{
                    {"missedCount", missed.size()},
                    {"fromSeq", result.last_seq},
                    {"toSeq", missed.back().seq}
                })));
            }
        }
    }

    if (!ok) {
        close(conn);
        result.state = StreamState::Closed;
        return result;
    }

    result.state = StreamState::Live;
    return result;
}

bool StreamHandler::heartbeat(const events::ConnectionPtr& conn) {
    if (conn->send(heartbeat_frame())) return true;
    close(conn);
    return false;
}

void StreamHandler::close(const events::ConnectionPtr& conn) {
    registry_.remove(conn->session_id(), conn);
    conn->close();
}

} // namespace sessionrelay::relay
