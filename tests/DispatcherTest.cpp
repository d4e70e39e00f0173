#include <gtest/gtest.h>

#include "FakeConnection.hpp"
#include "events/EventSequencer.hpp"
#include "relay/Dispatcher.h"
#include "relay/StreamHandler.h"

#include <boost/json.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sessionrelay;
using sessionrelay::test::FakeConnection;
using sessionrelay::test::parse_frames;
namespace json = boost::json;

class DispatcherTest : public ::testing::Test {
protected:
    std::vector<events::DomainEvent> emit(const events::SessionId& sid, int count,
                                          const std::string& type = "move_executed") {
        std::vector<events::DomainEvent> out;
        for (int i = 0; i < count; ++i) {
            out.push_back(sequencer.make(sid, type, json::object{{"i", i}}));
        }
        return out;
    }

    static std::vector<std::string> ids(const FakeConnection& conn) {
        std::vector<std::string> out;
        for (const auto& f : parse_frames(conn.frames())) {
            if (!f.id.empty()) out.push_back(f.id);
        }
        return out;
    }

    events::EventSequencer sequencer;
    events::EventLog log{1000};
    events::ConnectionRegistry registry;
    events::SessionLocks locks;
    relay::StreamHandler handler{log, registry, locks};
    relay::Dispatcher dispatcher{log, registry, locks, sequencer};
};

TEST_F(DispatcherTest, BuffersEvenWithoutListeners) {
    const auto report = dispatcher.dispatch("nobody-home", emit("nobody-home", 3));

    EXPECT_EQ(report.appended, 3u);
    EXPECT_EQ(report.delivered, 0u);
    EXPECT_EQ(log.event_count("nobody-home"), 3u);
}

TEST_F(DispatcherTest, PushesEachEventAsAnSseFrameInOrder) {
    auto conn = std::make_shared<FakeConnection>("s1");
    handler.open(conn);

    const auto report = dispatcher.dispatch("s1", emit("s1", 3, "game_state_changed"));
    EXPECT_EQ(report.delivered, 1u);

    const auto frames = parse_frames(conn->frames());
    ASSERT_EQ(frames.size(), 4u);  // connected + 3
    for (std::size_t i = 1; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].event, "game_state_changed");
        EXPECT_EQ(frames[i].id, "s1:" + std::to_string(i));

        const auto data = json::parse(frames[i].data).as_object();
        EXPECT_EQ(data.at("seq").to_number<std::size_t>(), i);
        EXPECT_EQ(data.at("sessionId").as_string(), "s1");
    }
}

TEST_F(DispatcherTest, SessionsDoNotLeakIntoEachOther) {
    auto a = std::make_shared<FakeConnection>("A");
    auto b = std::make_shared<FakeConnection>("B");
    handler.open(a);
    handler.open(b);

    dispatcher.dispatch("A", emit("A", 2));

    EXPECT_EQ(ids(*a), (std::vector<std::string>{"A:1", "A:2"}));
    EXPECT_TRUE(ids(*b).empty());
    EXPECT_EQ(b->frames().size(), 1u);
}

TEST_F(DispatcherTest, DeadConnectionIsPrunedAndNotRetried) {
    auto alive = std::make_shared<FakeConnection>("s1");
    auto dead = std::make_shared<FakeConnection>("s1");
    handler.open(alive);
    handler.open(dead);
    ASSERT_EQ(registry.connection_count("s1"), 2u);

    dead->fail_after(0);
    const auto first = dispatcher.dispatch("s1", emit("s1", 1));
    EXPECT_EQ(first.pruned, 1u);
    EXPECT_EQ(first.delivered, 1u);
    EXPECT_EQ(registry.connection_count("s1"), 1u);
    EXPECT_TRUE(dead->closed());

    const auto attempts = dead->attempts();
    dispatcher.dispatch("s1", emit("s1", 2));
    EXPECT_EQ(dead->attempts(), attempts);
    EXPECT_EQ(ids(*alive), (std::vector<std::string>{"s1:1", "s1:2", "s1:3"}));
}

TEST_F(DispatcherTest, StopsWritingToAConnectionAfterItsFirstFailure) {
    auto conn = std::make_shared<FakeConnection>("s1");
    handler.open(conn);
    conn->fail_after(1);

    dispatcher.dispatch("s1", emit("s1", 3));

    EXPECT_EQ(conn->attempts(), 3u);  // connected, event 1, failed event 2
    EXPECT_EQ(ids(*conn), (std::vector<std::string>{"s1:1"}));
    EXPECT_EQ(log.event_count("s1"), 3u);
}

TEST_F(DispatcherTest, LateJoinerSeesSameRelativeOrder) {
    auto early = std::make_shared<FakeConnection>("s1");
    handler.open(early);
    dispatcher.dispatch("s1", emit("s1", 2));

    auto late = std::make_shared<FakeConnection>("s1");
    handler.open(late);
    dispatcher.dispatch("s1", emit("s1", 3));

    EXPECT_EQ(ids(*early), (std::vector<std::string>{"s1:1", "s1:2", "s1:3", "s1:4", "s1:5"}));
    EXPECT_EQ(ids(*late), (std::vector<std::string>{"s1:3", "s1:4", "s1:5"}));
}

TEST_F(DispatcherTest, ConcurrentPublishersKeepOneAscendingOrderPerSession) {
    auto c1 = std::make_shared<FakeConnection>("s1");
    auto c2 = std::make_shared<FakeConnection>("s1");
    handler.open(c1);
    handler.open(c2);

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                dispatcher.publish("s1", "move_executed", json::object{{"producer", t}, {"i", i}});
            }
        });
    }
    for (auto& p : producers) p.join();

    const auto logged = log.since("s1", 0);
    ASSERT_EQ(logged.size(), 400u);

    std::vector<std::string> expected;
    for (std::size_t i = 0; i < logged.size(); ++i) {
        EXPECT_EQ(logged[i].seq, i + 1);
        expected.push_back("s1:" + std::to_string(i + 1));
    }
    EXPECT_EQ(ids(*c1), expected);
    EXPECT_EQ(ids(*c2), expected);
}

TEST_F(DispatcherTest, PublishStampsAboveProducerSeqs) {
    events::DomainEvent external;
    external.id = "s1:41";
    external.seq = 41;
    external.type = "game_completed";
    external.session_id = "s1";
    external.timestamp = events::now_unix_ms();
    dispatcher.dispatch("s1", {external});

    const auto published = dispatcher.publish("s1", "rematch", json::object{});
    EXPECT_EQ(published.event.seq, 42u);
    EXPECT_EQ(published.event.id, "s1:42");
    EXPECT_EQ(published.report.appended, 1u);
}

TEST_F(DispatcherTest, OutOfOrderEventsAreNeitherLoggedNorPushed) {
    auto conn = std::make_shared<FakeConnection>("s1");
    handler.open(conn);

    const auto batch = emit("s1", 3);
    dispatcher.dispatch("s1", {batch[0], batch[2]});
    const auto report = dispatcher.dispatch("s1", {batch[1]});

    EXPECT_EQ(report.appended, 0u);
    EXPECT_EQ(ids(*conn), (std::vector<std::string>{"s1:1", "s1:3"}));
    EXPECT_EQ(log.event_count("s1"), 2u);
}

// Client A watches, an event arrives, A leaves, B reconnects from "s1:0".
TEST_F(DispatcherTest, DisconnectThenReconnectScenario) {
    auto a = std::make_shared<FakeConnection>("s1");
    handler.open(a);

    events::DomainEvent e1;
    e1.id = "e1";
    e1.seq = 1;
    e1.type = "move";
    e1.session_id = "s1";
    e1.payload = json::object{{"from", "e2"}, {"to", "e4"}};
    e1.timestamp = events::now_unix_ms();
    dispatcher.dispatch("s1", {e1});

    auto a_frames = parse_frames(a->frames());
    ASSERT_EQ(a_frames.size(), 2u);
    EXPECT_EQ(a_frames[0].event, "connected");
    EXPECT_EQ(json::parse(a_frames[0].data).as_object().at("lastSeq").to_number<int>(), 0);
    EXPECT_EQ(a_frames[1].event, "move");
    EXPECT_EQ(a_frames[1].id, "e1");

    handler.close(a);
    EXPECT_EQ(registry.connection_count("s1"), 0u);

    auto b = std::make_shared<FakeConnection>("s1");
    const auto opened = handler.open(b, std::string_view("s1:0"));
    EXPECT_EQ(opened.replayed, 1u);

    const auto b_frames = parse_frames(b->frames());
    ASSERT_EQ(b_frames.size(), 3u);
    EXPECT_EQ(b_frames[0].event, "connected");
    EXPECT_EQ(b_frames[1].event, "move");
    EXPECT_EQ(b_frames[1].id, "e1");
    EXPECT_EQ(b_frames[2].event, "reconnected");

    const auto summary = json::parse(b_frames[2].data).as_object();
    EXPECT_EQ(summary.at("missedCount").to_number<int>(), 1);
    EXPECT_EQ(summary.at("fromSeq").to_number<int>(), 0);
    EXPECT_EQ(summary.at("toSeq").to_number<int>(), 1);
}
