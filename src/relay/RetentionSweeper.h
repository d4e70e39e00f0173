#pragma once

#include "events/ConnectionRegistry.h"
#include "events/EventLog.h"
#include "events/Sharding.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace sessionrelay::relay {

// Evicts sessions whose event buffer has been idle past the timeout. There is
// no timer of its own: request entry points call maybe_sweep().
class RetentionSweeper {
public:
    using Clock = std::chrono::steady_clock;

    RetentionSweeper(events::EventLog& log,
                     events::ConnectionRegistry& registry,
                     events::SessionLocks& locks,
                     Clock::duration session_timeout,
                     Clock::duration min_interval,
                     Clock::time_point started = Clock::now());

    // Returns the number of sessions evicted.
    std::size_t sweep(Clock::time_point now);

    // Sweeps only if min_interval has passed since the last run; at most one
    // concurrent caller wins.
    bool maybe_sweep(Clock::time_point now = Clock::now());

private:
    events::EventLog& log_;
    events::ConnectionRegistry& registry_;
    events::SessionLocks& locks_;
    Clock::duration session_timeout_;
    Clock::duration min_interval_;
    std::atomic<Clock::rep> last_sweep_;
};

} // namespace sessionrelay::relay
