#include "relay/RetentionSweeper.h"

#include <iostream>
#include <mutex>
#include <vector>

namespace sessionrelay::relay {

RetentionSweeper::RetentionSweeper(events::EventLog& log,
                                   events::ConnectionRegistry& registry,
                                   events::SessionLocks& locks,
                                   Clock::duration session_timeout,
                                   Clock::duration min_interval,
                                   Clock::time_point started)
    : log_(log),
      registry_(registry),
      locks_(locks),
      session_timeout_(session_timeout),
      min_interval_(min_interval),
      last_sweep_(started.time_since_epoch().count()) {}

std::size_t RetentionSweeper::sweep(Clock::time_point now) {
    std::size_t evicted = 0;

    for (const auto& session_id : log_.idle_sessions(now, session_timeout_)) {
        std::vector<events::ConnectionPtr> orphans;
        {
            std::lock_guard<std::mutex> lk(locks_.for_session(session_id));
            // a dispatch may have revived it since the scan
            if (!log_.erase_if_idle(session_id, now, session_timeout_)) continue;
            orphans = registry_.erase_session(session_id);
        }

        for (const auto& conn : orphans) conn->close();
        ++evicted;
    }

    if (evicted > 0) {
        std::cout << "[sweeper] evicted " << evicted << " idle session(s)\n";
    }
    return evicted;
}

bool RetentionSweeper::maybe_sweep(Clock::time_point now) {
    const Clock::rep now_ticks = now.time_since_epoch().count();
    Clock::rep last = last_sweep_.load();

    if (Clock::duration(now_ticks - last) < min_interval_) return false;
    if (!last_sweep_.compare_exchange_strong(last, now_ticks)) return false;

    sweep(now);
    return true;
}

} // namespace sessionrelay::relay
