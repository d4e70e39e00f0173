#include <gtest/gtest.h>

#include "events/DomainEvent.h"

#include <boost/json.hpp>

#include <stdexcept>

using namespace sessionrelay::events;
namespace json = boost::json;

TEST(DomainEventTest, EventIdJoinsSessionAndSeq) {
    EXPECT_EQ(make_event_id("s1", 7), "s1:7");
    EXPECT_EQ(make_event_id("room-lobby", 0), "room-lobby:0");
}

TEST(DomainEventTest, ParsesWellFormedResumeToken) {
    EXPECT_EQ(parse_last_event_id("s1:3"), std::optional<Seq>(3));
    EXPECT_EQ(parse_last_event_id("s1:0"), std::optional<Seq>(0));
    EXPECT_EQ(parse_last_event_id(":12"), std::optional<Seq>(12));
}

TEST(DomainEventTest, MalformedResumeTokensAreIgnored) {
    EXPECT_FALSE(parse_last_event_id(""));
    EXPECT_FALSE(parse_last_event_id("s1"));
    EXPECT_FALSE(parse_last_event_id("s1:"));
    EXPECT_FALSE(parse_last_event_id("s1:abc"));
    EXPECT_FALSE(parse_last_event_id("s1:3x"));
    EXPECT_FALSE(parse_last_event_id("s1:-1"));
    EXPECT_FALSE(parse_last_event_id("a:b:3"));
}

TEST(DomainEventTest, SerializesWithWireFieldNames) {
    DomainEvent e;
    e.id = "s1:1";
    e.seq = 1;
    e.type = "move";
    e.session_id = "s1";
    e.payload = json::object{{"x", 3}};
    e.timestamp = 1700000000000;

    const json::value v = json::value_from(e);
    const auto& obj = v.as_object();
    EXPECT_EQ(obj.at("id").as_string(), "s1:1");
    EXPECT_EQ(obj.at("seq").to_number<Seq>(), 1u);
    EXPECT_EQ(obj.at("type").as_string(), "move");
    EXPECT_EQ(obj.at("sessionId").as_string(), "s1");
    EXPECT_EQ(obj.at("timestamp").to_number<std::int64_t>(), 1700000000000);
    EXPECT_EQ(obj.at("payload").as_object().at("x").to_number<int>(), 3);
}

TEST(DomainEventTest, ParsingRejectsEventsWithoutRequiredFields) {
    const json::value missing_seq = json::parse(R"({"id":"s1:1","type":"move","sessionId":"s1"})");
    EXPECT_THROW(json::value_to<DomainEvent>(missing_seq), std::invalid_argument);

    const json::value not_object = json::parse("[1,2]");
    EXPECT_THROW(json::value_to<DomainEvent>(not_object), std::invalid_argument);
}

TEST(DomainEventTest, ParsingFillsMissingTimestamp) {
    const json::value v = json::parse(R"({"id":"s1:2","seq":2,"type":"ai_moved","sessionId":"s1"})");
    const auto e = json::value_to<DomainEvent>(v);
    EXPECT_EQ(e.seq, 2u);
    EXPECT_EQ(e.type, "ai_moved");
    EXPECT_GT(e.timestamp, 0);
    EXPECT_TRUE(e.payload.is_null());
}
