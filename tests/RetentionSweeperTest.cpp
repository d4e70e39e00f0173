#include <gtest/gtest.h>

#include "FakeConnection.hpp"
#include "relay/RetentionSweeper.h"
#include "relay/StreamHandler.h"

#include <chrono>
#include <memory>

using namespace sessionrelay;
using namespace std::chrono_literals;
using sessionrelay::test::FakeConnection;

class RetentionSweeperTest : public ::testing::Test {
protected:
    using Clock = relay::RetentionSweeper::Clock;

    events::DomainEvent event(const events::SessionId& sid, events::Seq seq) {
        events::DomainEvent e;
        e.id = events::make_event_id(sid, seq);
        e.seq = seq;
        e.type = "move_executed";
        e.session_id = sid;
        e.timestamp = events::now_unix_ms();
        return e;
    }

    const Clock::time_point t0 = Clock::now();
    events::EventLog log;
    events::ConnectionRegistry registry;
    events::SessionLocks locks;
    relay::StreamHandler handler{log, registry, locks};
    relay::RetentionSweeper sweeper{log, registry, locks, 1h, 60s, t0};
};

TEST_F(RetentionSweeperTest, EvictsIdleSessionWithItsConnections) {
    log.append("old", {event("old", 1)}, t0);
    auto conn = std::make_shared<FakeConnection>("old");
    registry.add("old", conn);

    EXPECT_EQ(sweeper.sweep(t0 + 2h), 1u);
    EXPECT_EQ(log.session_count(), 0u);
    EXPECT_EQ(registry.connection_count("old"), 0u);
    EXPECT_TRUE(conn->closed());
}

TEST_F(RetentionSweeperTest, KeepsRecentlyActiveSessions) {
    log.append("busy", {event("busy", 1)}, t0);
    log.append("old", {event("old", 1)}, t0 - 2h);

    EXPECT_EQ(sweeper.sweep(t0 + 30min), 1u);
    EXPECT_EQ(log.event_count("busy"), 1u);
    EXPECT_EQ(log.event_count("old"), 0u);
}

TEST_F(RetentionSweeperTest, ExactlyAtTimeoutIsNotYetIdle) {
    log.append("s1", {event("s1", 1)}, t0);
    EXPECT_EQ(sweeper.sweep(t0 + 1h), 0u);
    EXPECT_EQ(sweeper.sweep(t0 + 1h + 1s), 1u);
}

TEST_F(RetentionSweeperTest, MaybeSweepHonorsMinimumInterval) {
    log.append("s1", {event("s1", 1)}, t0 - 2h);

    EXPECT_FALSE(sweeper.maybe_sweep(t0 + 30s));
    EXPECT_EQ(log.session_count(), 1u);

    EXPECT_TRUE(sweeper.maybe_sweep(t0 + 61s));
    EXPECT_EQ(log.session_count(), 0u);

    EXPECT_FALSE(sweeper.maybe_sweep(t0 + 90s));
    EXPECT_TRUE(sweeper.maybe_sweep(t0 + 122s));
}

TEST_F(RetentionSweeperTest, SweptSessionReconnectsWithoutReplay) {
    log.append("s1", {event("s1", 1), event("s1", 2)}, t0);
    sweeper.sweep(t0 + 2h);

    auto conn = std::make_shared<FakeConnection>("s1");
    const auto result = handler.open(conn, std::string_view("s1:1"));

    EXPECT_EQ(result.state, relay::StreamState::Live);
    EXPECT_EQ(result.replayed, 0u);
    EXPECT_EQ(conn->frames().size(), 1u);
}
