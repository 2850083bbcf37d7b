#include <doctest/doctest.h>
#include <sstream>

#include "engine_fixture.hpp"
#include "dtchat/prediction.hpp"

using namespace dtchat;
using namespace dtchat_test;

static PredictionState plan_state(const std::string& plan) {
    std::istringstream in(plan);
    std::unique_ptr<ContactPlanRouter> router;
    std::string err;
    REQUIRE(ContactPlanRouter::parse(in, router, err));
    auto oracle = std::make_shared<DeliveryOracle>(std::move(router), Time::now());
    return PredictionState::enabled(oracle);
}

static const char* ONE_HOP_PLAN =
    "a contact +0 +86400 1 2 100000\n"
    "a range +0 +86400 1 2 5\n";

TEST_CASE("room send: one attempt per matching participant, an error for the mismatched one") {
    EngineFixture fx;

    auto rm = fx.engine->send_to_room(Content::make_text("hi"), "R", false);

    REQUIRE(rm.has_value());
    CHECK(rm->room_uuid == "R");
    REQUIRE(rm->messages.size() == 2);           // P2 (tcp) and P3 (udp)
    CHECK(rm->messages[0] != rm->messages[1]);

    REQUIRE(fx.transport->sends.size() == 1);    // only P2 shares a kind with us
    CHECK(fx.transport->sends[0].remote == ep("tcp 127.0.0.1:7002"));
    CHECK(fx.transport->sends[0].token == rm->messages[0]);

    CHECK(fx.observer->count(EventKind::ProtocolEncode) == 1);
    CHECK(fx.observer->count(EventKind::Sending) == 2);
    CHECK(fx.find(rm->messages[0])->status == MessageStatus::Sending);
    CHECK(fx.find(rm->messages[1])->status == MessageStatus::Failed);
}

TEST_CASE("room send where the local peer is not a participant does nothing") {
    EngineFixture fx;

    CHECK_FALSE(fx.engine->send_to_room(Content::make_text("hi"), "outside", false).has_value());
    CHECK(fx.transport->sends.empty());
    CHECK(fx.store->get_all_messages().empty());
    CHECK(fx.observer->events.empty());
}

TEST_CASE("room send with nobody else in the room does nothing") {
    EngineFixture fx;
    CHECK_FALSE(fx.engine->send_to_room(Content::make_text("hi"), "solo", false).has_value());
    CHECK(fx.transport->sends.empty());
}

TEST_CASE("room send to an unknown room does nothing") {
    EngineFixture fx;
    CHECK_FALSE(fx.engine->send_to_room(Content::make_text("hi"), "nope", false).has_value());
    CHECK(fx.observer->events.empty());
}

TEST_CASE("room send carries the room uuid on every copy") {
    EngineFixture fx;
    auto rm = fx.engine->send_to_room(Content::make_file("a.bin", {1, 2, 3}), "R", false);
    REQUIRE(rm.has_value());
    for (const auto& id : rm->messages) CHECK(fx.find(id)->room_uuid == "R");
    const wire::Envelope env = fx.transport->sends.at(0).envelope();
    CHECK(env.kind == wire::PayloadKind::File);
    CHECK(env.file_name == "a.bin");
    CHECK(env.room_uuid == "R");
}

TEST_CASE("prediction fills predicted_arrival_time when both sides have BP endpoints") {
    EngineFixture fx(plan_state(ONE_HOP_PLAN));

    const std::string id = fx.engine->send_to_peer(Content::make_text("hi"), "R", "p2",
                                                   ep("tcp 127.0.0.1:7002"), true);

    auto m = fx.find(id);
    REQUIRE(m->predicted_arrival_time.has_value());
    CHECK(*m->predicted_arrival_time > m->send_time);
    CHECK(fx.observer->errors() == 0);
}

TEST_CASE("prediction is skipped when not requested") {
    EngineFixture fx(plan_state(ONE_HOP_PLAN));
    const std::string id = fx.engine->send_to_peer(Content::make_text("hi"), "R", "p2",
                                                   ep("tcp 127.0.0.1:7002"), false);
    CHECK_FALSE(fx.find(id)->predicted_arrival_time.has_value());
}

TEST_CASE("prediction failures are silent and never block the send") {
    SUBCASE("nodes missing from the plan") {
        EngineFixture fx(plan_state("a contact +0 +86400 3 4 100000\n"));
        const std::string id = fx.engine->send_to_peer(Content::make_text("hi"), "R", "p2",
                                                       ep("tcp 127.0.0.1:7002"), true);
        CHECK_FALSE(fx.find(id)->predicted_arrival_time.has_value());
        CHECK(fx.observer->errors() == 0);
    }
    SUBCASE("no route between the nodes") {
        EngineFixture fx(plan_state("a contact +0 +86400 2 1 100000\n"));
        const std::string id = fx.engine->send_to_peer(Content::make_text("hi"), "R", "p2",
                                                       ep("tcp 127.0.0.1:7002"), true);
        CHECK_FALSE(fx.find(id)->predicted_arrival_time.has_value());
        CHECK(fx.transport->sends.size() == 1);
        CHECK(fx.observer->errors() == 0);
    }
    SUBCASE("recipient has no BP endpoint") {
        EngineFixture fx(plan_state(ONE_HOP_PLAN));
        auto rm = fx.engine->send_to_room(Content::make_text("hi"), "R", true);
        REQUIRE(rm.has_value());
        CHECK_FALSE(fx.find(rm->messages[1])->predicted_arrival_time.has_value());
    }
    SUBCASE("prediction in error state") {
        EngineFixture fx(PredictionState::error("bad plan"));
        const std::string id = fx.engine->send_to_peer(Content::make_text("hi"), "R", "p2",
                                                       ep("tcp 127.0.0.1:7002"), true);
        CHECK_FALSE(fx.find(id)->predicted_arrival_time.has_value());
        CHECK(fx.transport->sends.size() == 1);
    }
}

TEST_CASE("start announces the prediction error reason") {
    EngineFixture fx(PredictionState::error("cannot open 'x.cp'"), false);
    fx.engine->start(fx.transport);
    const AppEvent* n = fx.observer->last(EventKind::Notice);
    REQUIRE(n != nullptr);
    CHECK(n->detail == "prediction error: cannot open 'x.cp'");
}
