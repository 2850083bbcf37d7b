#include <doctest/doctest.h>

#include "dtchat/store.hpp"

using namespace dtchat;

static Time at(int64_t ms) { return *Time::from_millis(ms); }

static Peer peer(const std::string& uuid) {
    Peer p;
    p.uuid = uuid;
    p.name = uuid;
    p.endpoints.push_back(Endpoint(EndpointKind::Tcp, "127.0.0.1:7000"));
    return p;
}

static ChatMessage outbound(const std::string& uuid) {
    ChatMessage m;
    m.uuid = uuid;
    m.sender_uuid = "p1";
    m.room_uuid = "R";
    m.content = Content::make_text("x");
    m.send_time = at(1000);
    return m;
}

static MemoryStore make_store() {
    Room r;
    r.uuid = "R";
    r.name = "room";
    return MemoryStore(peer("p1"), {peer("p1"), peer("p2"), peer("p3")}, {r});
}

TEST_CASE("memory store exposes peers and rooms, never the local peer as an other") {
    MemoryStore s = make_store();
    CHECK(s.get_localpeer().uuid == "p1");
    const auto others = s.get_other_peers();
    CHECK(others.size() == 2);
    CHECK(others.count("p1") == 0);
    CHECK(others.count("p2") == 1);
    REQUIRE(s.get_rooms().count("R") == 1);
    CHECK(s.get_rooms().at("R").name == "room");
}

TEST_CASE("add_message rejects a second message with the same uuid") {
    MemoryStore s = make_store();
    CHECK(s.add_message(outbound("a")));
    ChatMessage again = outbound("a");
    again.content = Content::make_text("different");
    CHECK_FALSE(s.add_message(again));

    const auto all = s.get_all_messages();
    REQUIRE(all.size() == 1);
    CHECK(all[0].content.text == "x");
}

static ChatMessage inbound(const std::string& uuid) {
    ChatMessage m = outbound(uuid);
    m.sender_uuid = "p2";
    m.send_completed = at(1000);
    m.receive_time = at(1500);
    m.status = MessageStatus::Received;
    return m;
}

TEST_CASE("mark_as applies Sent, then Acked") {
    MemoryStore s = make_store();
    REQUIRE(s.add_message(outbound("a")));

    MarkOutcome out = s.mark_as("a", MarkIntent::sent(at(1100)));
    REQUIRE(out.applied());
    CHECK(out.message->status == MessageStatus::Sent);
    CHECK(out.message->send_completed == at(1100));
    CHECK_FALSE(out.message->receive_time.has_value());

    out = s.mark_as("a", MarkIntent::acked(at(2000)));
    REQUIRE(out.applied());
    CHECK(out.message->status == MessageStatus::ReceivedByPeer);
    CHECK(out.message->receive_time == at(2000));
    CHECK(out.message->send_completed == at(1100));
}

TEST_CASE("an ACK ahead of Sent is applied and the later Sent changes nothing") {
    MemoryStore s = make_store();
    REQUIRE(s.add_message(outbound("a")));

    MarkOutcome out = s.mark_as("a", MarkIntent::acked(at(2000)));
    REQUIRE(out.applied());
    CHECK(out.message->send_completed == at(2000));

    out = s.mark_as("a", MarkIntent::sent(at(2100)));
    CHECK(out.result == MarkResult::Unchanged);
    REQUIRE(out.message.has_value());
    CHECK(out.message->status == MessageStatus::ReceivedByPeer);
    CHECK(out.message->receive_time == at(2000));
}

TEST_CASE("Failed is terminal") {
    MemoryStore s = make_store();
    REQUIRE(s.add_message(outbound("a")));
    REQUIRE(s.mark_as("a", MarkIntent::failed()).applied());

    MarkOutcome out = s.mark_as("a", MarkIntent::sent(at(1100)));
    CHECK(out.result == MarkResult::Unchanged);
    CHECK(out.message->status == MessageStatus::Failed);

    out = s.mark_as("a", MarkIntent::acked(at(2000)));
    CHECK(out.result == MarkResult::Unchanged);
    CHECK(out.message->status == MessageStatus::Failed);
    CHECK_FALSE(s.get_all_messages()[0].receive_time.has_value());
}

TEST_CASE("a received message is never moved by Acked, Sent or Failed") {
    MemoryStore s = make_store();
    REQUIRE(s.add_message(inbound("m-1")));

    for (const MarkIntent& intent : {MarkIntent::acked(at(9000)), MarkIntent::sent(at(9000)),
                                     MarkIntent::failed()}) {
        const MarkOutcome out = s.mark_as("m-1", intent);
        CHECK(out.result == MarkResult::Unchanged);
        REQUIRE(out.message.has_value());
        CHECK(out.message->status == MessageStatus::Received);
    }
    const ChatMessage stored = s.get_all_messages().at(0);
    CHECK(stored.receive_time == at(1500));
    CHECK(stored.status == MessageStatus::Received);
}

TEST_CASE("a transport failure after the ACK does not undo it") {
    MemoryStore s = make_store();
    REQUIRE(s.add_message(outbound("a")));
    REQUIRE(s.mark_as("a", MarkIntent::acked(at(2000))).applied());

    const MarkOutcome out = s.mark_as("a", MarkIntent::failed());
    CHECK(out.result == MarkResult::Unchanged);
    CHECK(out.message->status == MessageStatus::ReceivedByPeer);
}

TEST_CASE("mark_as on an unknown uuid reports NotFound") {
    MemoryStore s = make_store();
    const MarkOutcome out = s.mark_as("ghost", MarkIntent::sent(at(1)));
    CHECK(out.result == MarkResult::NotFound);
    CHECK_FALSE(out.message.has_value());
}

TEST_CASE("get_last_messages returns the newest tail in insertion order") {
    MemoryStore s = make_store();
    for (const char* id : {"a", "b", "c", "d"}) REQUIRE(s.add_message(outbound(id)));

    const auto last2 = s.get_last_messages(2);
    REQUIRE(last2.size() == 2);
    CHECK(last2[0].uuid == "c");
    CHECK(last2[1].uuid == "d");

    CHECK(s.get_last_messages(10).size() == 4);
    CHECK(s.get_last_messages(0).empty());
}
