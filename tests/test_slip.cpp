#include <doctest/doctest.h>
#include "dtchat/transport/slip.hpp"

using namespace dtchat;

TEST_CASE("SLIP encode wraps in END and escapes END/ESC") {
    const std::vector<uint8_t> in = {0x01, slip::END, 0x02, slip::ESC, 0x03};
    const std::vector<uint8_t> want = {slip::END, 0x01, slip::ESC, slip::ESC_END, 0x02,
                                       slip::ESC, slip::ESC_ESC, 0x03, slip::END};
    CHECK(slip::encode(in) == want);
    CHECK(slip::encode(std::vector<uint8_t>{}) == std::vector<uint8_t>{slip::END, slip::END});
}

TEST_CASE("decoder reassembles frames split across arbitrary reads") {
    const std::vector<uint8_t> a = {0x44, slip::END, slip::ESC, 0x00};
    const std::vector<uint8_t> b = {0x10, 0x20};
    std::vector<uint8_t> stream = slip::encode(a);
    const auto eb = slip::encode(b);
    stream.insert(stream.end(), eb.begin(), eb.end());

    for (size_t cut = 0; cut <= stream.size(); ++cut) {
        slip::Decoder d;
        std::vector<std::vector<uint8_t>> frames;
        d.feed(stream.data(), cut, frames);
        d.feed(stream.data() + cut, stream.size() - cut, frames);
        REQUIRE(frames.size() == 2);
        CHECK(frames[0] == a);
        CHECK(frames[1] == b);
        CHECK(d.pending() == 0);
    }
}

TEST_CASE("back-to-back END bytes produce no empty frames") {
    const std::vector<uint8_t> s = {slip::END, slip::END, slip::END, 0x07, slip::END, slip::END};
    slip::Decoder d;
    std::vector<std::vector<uint8_t>> frames;
    CHECK(d.feed(s.data(), s.size(), frames) == 1);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == std::vector<uint8_t>{0x07});
}

TEST_CASE("a bad escape drops only the frame in progress") {
    const std::vector<uint8_t> s = {slip::END, 0x01, slip::ESC, 0x55, 0x02, slip::END,
                                    0x03, slip::END};
    slip::Decoder d;
    std::vector<std::vector<uint8_t>> frames;
    d.feed(s.data(), s.size(), frames);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == std::vector<uint8_t>{0x03});
}

TEST_CASE("reset discards a partial frame") {
    const std::vector<uint8_t> partial = {slip::END, 0x01, 0x02};
    slip::Decoder d;
    std::vector<std::vector<uint8_t>> frames;
    d.feed(partial.data(), partial.size(), frames);
    CHECK(d.pending() == 2);
    d.reset();
    CHECK(d.pending() == 0);
    const std::vector<uint8_t> tail = {0x09, slip::END};
    d.feed(tail.data(), tail.size(), frames);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == std::vector<uint8_t>{0x09});
}
