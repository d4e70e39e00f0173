#pragma once

#include <chrono>
#include <cstddef>

namespace sessionrelay::relay {

struct RelayOptions {
    std::size_t max_events_per_session = 100;
    std::chrono::seconds session_timeout{3600};
    std::chrono::seconds heartbeat_interval{30};
    std::chrono::seconds sweep_interval{60};
    std::size_t max_queued_frames = 1024;  // per stream, before the reader is dropped
};

} // namespace sessionrelay::relay
