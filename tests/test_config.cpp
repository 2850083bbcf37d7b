#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>

#include "dtchat/config.hpp"

using namespace dtchat;

static const char* FULL_CONFIG = R"({
  "db_type": "memory",
  "file_reception_dir": "/tmp/in",
  "cp_path": "plans/earth-mars.cp",
  "local_peer": "p1",
  "peer_list": [
    { "uuid": "p1", "name": "Alice", "color": "blue",
      "endpoints": ["tcp 127.0.0.1:7001", "bp ipn:1.0"] },
    { "uuid": "p2", "name": "Bob", "endpoints": ["udp 127.0.0.1:7002"] },
    { "uuid": "p3" }
  ],
  "rooms": [
    { "uuid": "r1", "name": "Ops",
      "participants": [
        { "peer": "p1", "endpoint": "tcp 127.0.0.1:7001" },
        { "peer": "p2", "endpoint": "udp 127.0.0.1:7002" }
      ] }
  ]
})";

static const char* NO_ROOMS = R"({
  "local_peer": "p1",
  "peer_list": [
    { "uuid": "p1", "endpoints": ["tcp 127.0.0.1:7001", "udp 127.0.0.1:8001"] },
    { "uuid": "p2", "endpoints": ["tcp 127.0.0.1:7002"] },
    { "uuid": "p3" }
  ]
})";

TEST_CASE("a full config is read into the local peer, the others and the rooms") {
    AppConfig cfg;
    std::string err;
    REQUIRE_MESSAGE(parse_config(FULL_CONFIG, "", cfg, err) == ConfigStatus::Ok, err);

    CHECK(cfg.db_type == "memory");
    CHECK(cfg.file_reception_dir == "/tmp/in");
    CHECK(cfg.cp_path == "plans/earth-mars.cp");

    CHECK(cfg.local.uuid == "p1");
    CHECK(cfg.local.name == "Alice");
    CHECK(cfg.local.color == "blue");
    REQUIRE(cfg.local.endpoints.size() == 2);
    CHECK(cfg.local.endpoints[1] == Endpoint(EndpointKind::Bp, "ipn:1.0"));

    REQUIRE(cfg.others.size() == 2);
    CHECK(cfg.others[0].uuid == "p2");
    CHECK(cfg.others[1].name == "p3");         // name defaults to the uuid
    CHECK(cfg.others[1].endpoints.empty());

    REQUIRE(cfg.rooms.size() == 1);
    CHECK(cfg.rooms[0].name == "Ops");
    REQUIRE(cfg.rooms[0].participants.size() == 2);
    CHECK(cfg.rooms[0].participants[1].endpoint == Endpoint(EndpointKind::Udp, "127.0.0.1:7002"));
}

TEST_CASE("without rooms a default room holds every peer on its first endpoint") {
    AppConfig cfg;
    std::string err;
    REQUIRE(parse_config(NO_ROOMS, "", cfg, err) == ConfigStatus::Ok);

    CHECK(cfg.file_reception_dir == DEFAULT_FILE_RECEPTION_DIR);
    CHECK(cfg.cp_path.empty());
    REQUIRE(cfg.rooms.size() == 1);
    const Room& r = cfg.rooms[0];
    CHECK(r.uuid == DEFAULT_ROOM_UUID);
    REQUIRE(r.participants.size() == 2);        // p3 has no endpoint
    CHECK(r.participants[0].peer_uuid == "p1");
    CHECK(r.participants[0].endpoint == Endpoint(EndpointKind::Tcp, "127.0.0.1:7001"));
    CHECK(r.participants[1].peer_uuid == "p2");
}

TEST_CASE("the local peer override wins over the file") {
    AppConfig cfg;
    std::string err;
    REQUIRE(parse_config(NO_ROOMS, "p2", cfg, err) == ConfigStatus::Ok);
    CHECK(cfg.local.uuid == "p2");
    REQUIRE(cfg.others.size() == 2);
    CHECK(cfg.others[0].uuid == "p1");
}

TEST_CASE("a missing or unknown local peer is reported") {
    AppConfig cfg;
    std::string err;
    CHECK(parse_config(R"({"peer_list": [{"uuid": "p1"}]})", "", cfg, err) == ConfigStatus::UnknownLocalPeer);
    CHECK(parse_config(NO_ROOMS, "p9", cfg, err) == ConfigStatus::UnknownLocalPeer);
    CHECK(err.find("p9") != std::string::npos);
}

TEST_CASE("bad fields are InvalidField with a location") {
    AppConfig cfg;
    std::string err;

    SUBCASE("bad endpoint") {
        CHECK(parse_config(R"({"local_peer": "p1",
                               "peer_list": [{"uuid": "p1", "endpoints": ["smoke 1.2.3.4"]}]})",
                           "", cfg, err) == ConfigStatus::InvalidField);
        CHECK(err.find("peer_list[0]") != std::string::npos);
    }
    SUBCASE("room names an unknown peer") {
        CHECK(parse_config(R"({"local_peer": "p1",
                               "peer_list": [{"uuid": "p1"}],
                               "rooms": [{"uuid": "r", "participants":
                                          [{"peer": "ghost", "endpoint": "tcp a:1"}]}]})",
                           "", cfg, err) == ConfigStatus::InvalidField);
        CHECK(err.find("ghost") != std::string::npos);
    }
    SUBCASE("duplicate peer uuid") {
        CHECK(parse_config(R"({"local_peer": "p1",
                               "peer_list": [{"uuid": "p1"}, {"uuid": "p1"}]})",
                           "", cfg, err) == ConfigStatus::InvalidField);
        CHECK(err.find("duplicate") != std::string::npos);
    }
    SUBCASE("missing peer_list") {
        CHECK(parse_config(R"({"local_peer": "p1"})", "", cfg, err) == ConfigStatus::InvalidField);
    }
    SUBCASE("wrong type") {
        CHECK(parse_config(R"({"local_peer": "p1", "peer_list": [{"uuid": 7}]})",
                           "", cfg, err) == ConfigStatus::InvalidField);
    }
    SUBCASE("top level not an object") {
        CHECK(parse_config("[1, 2]", "", cfg, err) == ConfigStatus::InvalidField);
    }
}

TEST_CASE("only the memory store is supported") {
    AppConfig cfg;
    std::string err;
    CHECK(parse_config(R"({"db_type": "sqlite", "local_peer": "p1", "peer_list": [{"uuid": "p1"}]})",
                       "", cfg, err) == ConfigStatus::UnsupportedDb);
}

TEST_CASE("text that is not JSON is a ParseError") {
    AppConfig cfg;
    std::string err;
    CHECK(parse_config("{ not json", "", cfg, err) == ConfigStatus::ParseError);
    CHECK_FALSE(err.empty());
}

TEST_CASE("load_config reads a file and prefixes errors with its path") {
    AppConfig cfg;
    std::string err;
    CHECK(load_config("/nonexistent/dtchat.json", "", cfg, err) == ConfigStatus::FileNotFound);

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "dtchat_test_config.json";
    {
        std::ofstream f(path);
        f << NO_ROOMS;
    }
    REQUIRE(load_config(path.string(), "", cfg, err) == ConfigStatus::Ok);
    CHECK(cfg.local.uuid == "p1");

    auto store = make_store(cfg);
    CHECK(store->get_localpeer().uuid == "p1");
    CHECK(store->get_other_peers().size() == 2);
    CHECK(store->get_rooms().count(DEFAULT_ROOM_UUID) == 1);

    {
        std::ofstream f(path);
        f << "{";
    }
    CHECK(load_config(path.string(), "", cfg, err) == ConfigStatus::ParseError);
    CHECK(err.find(path.string()) == 0);

    std::filesystem::remove(path);
    CHECK(std::string(config_status_name(ConfigStatus::UnsupportedDb)) == "unsupported_db");
}
