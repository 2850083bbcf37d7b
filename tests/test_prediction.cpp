#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

#include "dtchat/prediction.hpp"

using namespace dtchat;

static std::unique_ptr<ContactPlanRouter> parse_ok(const std::string& text) {
    std::istringstream in(text);
    std::unique_ptr<ContactPlanRouter> r;
    std::string err;
    REQUIRE_MESSAGE(ContactPlanRouter::parse(in, r, err), err);
    return r;
}

static const char* TWO_HOP_PLAN =
    "# 1 -> 2 -> 3\n"
    "a contact +0 +100 1 2 1000\n"
    "a contact +50 +200 2 3 1000\n"
    "\n"
    "a range +0 +100 1 2 1\n"
    "a range +0 +200 3 2 2   # symmetric\n"
    "m production 1000000\n";

TEST_CASE("contact plan parsing skips comments, blanks and other commands") {
    auto r = parse_ok(TWO_HOP_PLAN);
    CHECK(r->node_count() == 3);
    REQUIRE(r->contacts().size() == 2);
    CHECK(r->contacts()[0].owlt_s == doctest::Approx(1.0));
    CHECK(r->contacts()[1].owlt_s == doctest::Approx(2.0));   // range given as 3->2
    CHECK(r->contacts()[1].start_s == doctest::Approx(50.0));
    CHECK(r->node_index("2").has_value());
    CHECK_FALSE(r->node_index("9").has_value());
}

TEST_CASE("a router only comes out of parse") {
    CHECK_FALSE(std::is_default_constructible<ContactPlanRouter>::value);
    auto r = parse_ok("");
    REQUIRE(r != nullptr);
    CHECK(r->node_count() == 0);
    CHECK(r->contacts().empty());
}

TEST_CASE("malformed contact lines fail the whole plan with the line number") {
    for (const char* bad : {"a contact +0 +10 1 2\n",
                            "\na contact +0 +ten 1 2 5\n",
                            "a range +10 +0 1 2 1\n"}) {
        std::istringstream in(bad);
        std::unique_ptr<ContactPlanRouter> r;
        std::string err;
        CHECK_FALSE(ContactPlanRouter::parse(in, r, err));
        CHECK(err.find("line ") == 0);
        CHECK(r == nullptr);
    }
}

TEST_CASE("earliest arrival waits for later contacts across hops") {
    auto r = parse_ok(TWO_HOP_PLAN);
    const NodeIndex n1 = *r->node_index("1");
    const NodeIndex n2 = *r->node_index("2");
    const NodeIndex n3 = *r->node_index("3");

    // 1000 bytes at 1000 B/s: 1 s on the wire plus 1 s light time
    CHECK(*r->earliest_arrival(n1, n2, 1000, 0) == doctest::Approx(2.0));
    // second hop opens at 50: 50 + 1 + 2
    CHECK(*r->earliest_arrival(n1, n3, 1000, 0) == doctest::Approx(53.0));
    // same node: arrival is the send time
    CHECK(*r->earliest_arrival(n2, n2, 1000, 7) == doctest::Approx(7.0));
    // no contact leaves 3
    CHECK_FALSE(r->earliest_arrival(n3, n1, 1000, 0).has_value());
    // first contact is closed by then
    CHECK_FALSE(r->earliest_arrival(n1, n2, 1000, 150).has_value());
}

TEST_CASE("a bundle that does not fit in the window finds no route") {
    auto r = parse_ok("a contact +0 +10 1 2 10\n");
    CHECK_FALSE(r->earliest_arrival(*r->node_index("1"), *r->node_index("2"), 1000, 0).has_value());
    CHECK(r->earliest_arrival(*r->node_index("1"), *r->node_index("2"), 50, 0).has_value());
}

TEST_CASE("node_name_from_bp_address extracts the ipn node number") {
    CHECK(node_name_from_bp_address("ipn:12.0") == "12");
    CHECK(node_name_from_bp_address("ipn:3.7") == "3");
    CHECK(node_name_from_bp_address("ipn:12") == "ipn:12");
    CHECK(node_name_from_bp_address("dtn://node/chat") == "dtn://node/chat");
}

TEST_CASE("DeliveryOracle maps wall-clock time through the plan and names failures") {
    const Time start = *Time::from_millis(1000000000000);
    DeliveryOracle oracle(parse_ok(TWO_HOP_PLAN), start);
    Time out;
    std::string err;

    REQUIRE(oracle.predict_at("ipn:1.0", "ipn:3.0", 1000, start, out, err) == PredictStatus::Ok);
    CHECK(out.millis() == 1000000053000);

    CHECK(oracle.predict_at("ipn:9.0", "ipn:3.0", 1000, start, out, err) == PredictStatus::InvalidEndpoint);
    CHECK(err == "Source ION ID '9' not found in contact plan");

    CHECK(oracle.predict_at("ipn:1.0", "ipn:8.0", 1000, start, out, err) == PredictStatus::InvalidEndpoint);
    CHECK(err == "Destination ION ID '8' not found in contact plan");

    CHECK(oracle.predict_at("ipn:3.0", "ipn:1.0", 1000, start, out, err) == PredictStatus::NoRouteFound);
    CHECK(err == "No route found from ION 3 to ION 1");

    CHECK(std::string(predict_status_name(PredictStatus::NoRouteFound)) == "no_route");
}

TEST_CASE("PredictionState is decided by the contact plan path") {
    CHECK(PredictionState::from_contact_plan("").mode == PredictionMode::Disabled);
    CHECK(PredictionState::disabled().describe() == "prediction disabled");

    const PredictionState missing = PredictionState::from_contact_plan("/nonexistent/dtchat.cp");
    CHECK(missing.mode == PredictionMode::Error);
    CHECK(missing.describe() == "prediction error: cannot open contact plan '/nonexistent/dtchat.cp'");

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "dtchat_test_plan.cp";
    {
        std::ofstream f(path);
        f << TWO_HOP_PLAN;
    }
    const PredictionState ok = PredictionState::from_contact_plan(path.string());
    CHECK(ok.mode == PredictionMode::Enabled);
    CHECK(ok.oracle != nullptr);
    CHECK(ok.describe() == "prediction enabled");

    {
        std::ofstream f(path);
        f << "a contact +0 +10 1 2\n";
    }
    const PredictionState bad = PredictionState::from_contact_plan(path.string());
    CHECK(bad.mode == PredictionMode::Error);
    CHECK(bad.reason.find("line 1") != std::string::npos);

    std::filesystem::remove(path);
}
