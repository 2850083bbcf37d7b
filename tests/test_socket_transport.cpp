#include <doctest/doctest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dtchat/transport/slip.hpp"
#include "dtchat/transport/socket_transport.hpp"

using namespace dtchat;
using namespace dtchat::transport;

namespace {

// Loopback port the kernel just handed out, released again for the transport.
std::string loopback_address(int socktype) {
    const int fd = ::socket(AF_INET, socktype, 0);
    REQUIRE(fd >= 0);
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sa.sin_port = 0;
    REQUIRE(::bind(fd, reinterpret_cast<const sockaddr*>(&sa), sizeof sa) == 0);
    socklen_t len = sizeof sa;
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) == 0);
    ::close(fd);
    return "127.0.0.1:" + std::to_string(ntohs(sa.sin_port));
}

class WaitingObserver : public ITransportObserver {
public:
    void on_transport_event(const TransportEvent& ev) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            events_.push_back(ev);
        }
        cv_.notify_all();
    }

    // Blocks until pred(events) holds or the timeout passes.
    bool wait_for(const std::function<bool(const std::vector<TransportEvent>&)>& pred,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, timeout, [&] { return pred(events_); });
    }

    bool wait_count(TransportEventKind k, size_t n) {
        return wait_for([&](const std::vector<TransportEvent>& evs) { return count_in(evs, k) >= n; });
    }

    size_t count(TransportEventKind k) {
        std::lock_guard<std::mutex> lock(mu_);
        return count_in(events_, k);
    }

    std::vector<TransportEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mu_);
        return events_;
    }

    std::vector<TransportEvent> of_kind(TransportEventKind k) {
        std::vector<TransportEvent> out;
        for (const auto& e : snapshot()) if (e.kind == k) out.push_back(e);
        return out;
    }

private:
    static size_t count_in(const std::vector<TransportEvent>& evs, TransportEventKind k) {
        size_t n = 0;
        for (const auto& e : evs) if (e.kind == k) ++n;
        return n;
    }

    std::mutex mu_;
    std::condition_variable cv_;
    std::vector<TransportEvent> events_;
};

// Holds the sender thread inside its first callback until release().
class GateObserver : public WaitingObserver {
public:
    void on_transport_event(const TransportEvent& ev) override {
        {
            std::unique_lock<std::mutex> lock(gate_mu_);
            if (!entered_) {
                entered_ = true;
                gate_cv_.notify_all();
                gate_cv_.wait(lock, [this] { return open_; });
            }
        }
        WaitingObserver::on_transport_event(ev);
    }

    bool wait_entered() {
        std::unique_lock<std::mutex> lock(gate_mu_);
        return gate_cv_.wait_for(lock, std::chrono::seconds(5), [this] { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(gate_mu_);
            open_ = true;
        }
        gate_cv_.notify_all();
    }

private:
    std::mutex gate_mu_;
    std::condition_variable gate_cv_;
    bool entered_{false};
    bool open_{false};
};

std::vector<uint8_t> payload(size_t n) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(i * 7);
    return out;
}

} // namespace

TEST_CASE("UDP loopback: one datagram arrives as one Received and the send completes") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint listen(EndpointKind::Udp, loopback_address(SOCK_DGRAM));
    t.start_listener_async(listen);
    REQUIRE(obs.wait_count(TransportEventKind::ListenerStarted, 1));

    const std::vector<uint8_t> bytes = payload(300);
    t.send_async(listen, listen, bytes, "tok-udp");

    REQUIRE(obs.wait_count(TransportEventKind::Sent, 1));
    REQUIRE(obs.wait_count(TransportEventKind::Received, 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    t.stop();

    const auto received = obs.of_kind(TransportEventKind::Received);
    REQUIRE(received.size() == 1);
    CHECK(received[0].data == bytes);
    CHECK(received[0].endpoint.kind == EndpointKind::Udp);

    const auto sent = obs.of_kind(TransportEventKind::Sent);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].token == "tok-udp");
    CHECK(sent[0].bytes == bytes.size());
    CHECK(obs.count(TransportEventKind::SendFailed) == 0);
}

TEST_CASE("TCP loopback: the SLIP framed frame is delivered whole and the send ends in Sent") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint listen(EndpointKind::Tcp, loopback_address(SOCK_STREAM));
    t.start_listener_async(listen);
    REQUIRE(obs.wait_count(TransportEventKind::ListenerStarted, 1));

    // bytes that need escaping on the wire
    std::vector<uint8_t> bytes = payload(5000);
    bytes[0] = slip::END;
    bytes[1] = slip::ESC;
    t.send_async(listen, listen, bytes, "tok-tcp");

    REQUIRE(obs.wait_count(TransportEventKind::Sent, 1));
    REQUIRE(obs.wait_count(TransportEventKind::Received, 1));
    REQUIRE(obs.wait_count(TransportEventKind::Closed, 1));
    t.stop();

    const auto received = obs.of_kind(TransportEventKind::Received);
    REQUIRE(received.size() == 1);
    CHECK(received[0].data == bytes);

    // Sending precedes Sent for the same token
    const auto evs = obs.snapshot();
    size_t sending_at = evs.size(), sent_at = evs.size();
    for (size_t i = 0; i < evs.size(); ++i) {
        if (evs[i].token != "tok-tcp") continue;
        if (evs[i].kind == TransportEventKind::Sending && sending_at == evs.size()) sending_at = i;
        if (evs[i].kind == TransportEventKind::Sent) sent_at = i;
    }
    CHECK(sending_at < sent_at);
    CHECK(sent_at < evs.size());
}

TEST_CASE("TCP send to a closed port fails with ConnectionFailed for its token") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint nobody(EndpointKind::Tcp, loopback_address(SOCK_STREAM));
    t.send_async(Endpoint(EndpointKind::Tcp, "127.0.0.1:0"), nobody, payload(10), "tok-refused");

    REQUIRE(obs.wait_count(TransportEventKind::ConnectionFailed, 1));
    const auto failed = obs.of_kind(TransportEventKind::ConnectionFailed);
    CHECK(failed[0].token == "tok-refused");
    CHECK(failed[0].endpoint == nobody);
    CHECK(obs.count(TransportEventKind::Sent) == 0);
}

TEST_CASE("bundle protocol endpoints are refused on both sides") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint bp(EndpointKind::Bp, "ipn:2.0");
    t.send_async(Endpoint(EndpointKind::Bp, "ipn:1.0"), bp, payload(10), "tok-bp");
    t.start_listener_async(Endpoint(EndpointKind::Bp, "ipn:1.0"));

    REQUIRE(obs.wait_count(TransportEventKind::ConnectionFailed, 1));
    REQUIRE(obs.wait_count(TransportEventKind::SocketError, 1));

    const auto failed = obs.of_kind(TransportEventKind::ConnectionFailed);
    CHECK(failed[0].token == "tok-bp");
    CHECK(failed[0].reason == "bundle protocol transport not available");
    CHECK(obs.of_kind(TransportEventKind::SocketError)[0].reason ==
          "bundle protocol transport not available");
    CHECK(obs.count(TransportEventKind::Sending) == 0);
    CHECK(obs.count(TransportEventKind::ListenerStarted) == 0);
}

TEST_CASE("a frame larger than one UDP datagram fails without touching the network") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint listen(EndpointKind::Udp, loopback_address(SOCK_DGRAM));
    t.start_listener_async(listen);
    REQUIRE(obs.wait_count(TransportEventKind::ListenerStarted, 1));

    t.send_async(listen, listen, payload(SocketTransport::MAX_DATAGRAM + 1), "tok-big");
    t.send_async(listen, listen, payload(SocketTransport::MAX_DATAGRAM), "tok-max");

    REQUIRE(obs.wait_count(TransportEventKind::SendFailed, 1));
    REQUIRE(obs.wait_count(TransportEventKind::Sent, 1));

    const auto failed = obs.of_kind(TransportEventKind::SendFailed);
    REQUIRE(failed.size() == 1);
    CHECK(failed[0].token == "tok-big");
    CHECK(failed[0].reason.find("65508 bytes exceeds the UDP datagram limit") != std::string::npos);
    CHECK(obs.of_kind(TransportEventKind::Sent)[0].token == "tok-max");
}

TEST_CASE("local and remote endpoints of different kinds fail the send") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    t.send_async(Endpoint(EndpointKind::Tcp, "127.0.0.1:7001"),
                 Endpoint(EndpointKind::Udp, "127.0.0.1:7003"), payload(4), "tok-mixed");

    REQUIRE(obs.wait_count(TransportEventKind::SendFailed, 1));
    const auto failed = obs.of_kind(TransportEventKind::SendFailed);
    CHECK(failed[0].token == "tok-mixed");
    CHECK(failed[0].reason == "endpoint kind mismatch: local tcp, remote udp");
}

TEST_CASE("jobs beyond the queue capacity are reported as send queue full") {
    GateObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint local(EndpointKind::Bp, "ipn:1.0");
    const Endpoint remote(EndpointKind::Bp, "ipn:2.0");

    // the sender thread takes this job and stays in its callback
    t.send_async(local, remote, payload(1), "first");
    const bool held = obs.wait_entered();

    const size_t extra = 3;
    for (size_t i = 0; i < SocketTransport::SEND_QUEUE_CAPACITY + extra; ++i) {
        t.send_async(local, remote, payload(1), "job-" + std::to_string(i));
    }
    obs.release();
    REQUIRE(held);

    const size_t total = 1 + SocketTransport::SEND_QUEUE_CAPACITY + extra;
    REQUIRE(obs.wait_for([&](const std::vector<TransportEvent>& evs) { return evs.size() >= total; }));
    t.stop();

    const auto full = obs.of_kind(TransportEventKind::SendFailed);
    REQUIRE(full.size() == extra);
    for (size_t i = 0; i < extra; ++i) {
        CHECK(full[i].reason == "send queue full");
        CHECK(full[i].token == "job-" + std::to_string(SocketTransport::SEND_QUEUE_CAPACITY + i));
    }
    CHECK(obs.count(TransportEventKind::ConnectionFailed) == 1 + SocketTransport::SEND_QUEUE_CAPACITY);
}

TEST_CASE("stop joins listeners, can be called twice, and silences later calls") {
    WaitingObserver obs;
    SocketTransport t;
    t.set_observer(&obs);

    const Endpoint tcp(EndpointKind::Tcp, loopback_address(SOCK_STREAM));
    const Endpoint udp(EndpointKind::Udp, loopback_address(SOCK_DGRAM));
    t.start_listener_async(tcp);
    t.start_listener_async(udp);
    REQUIRE(obs.wait_count(TransportEventKind::ListenerStarted, 2));

    const auto begin = std::chrono::steady_clock::now();
    t.stop();
    t.stop();
    const auto took = std::chrono::steady_clock::now() - begin;
    CHECK(took < std::chrono::seconds(2));

    const size_t before = obs.snapshot().size();
    t.send_async(udp, udp, payload(8), "after-stop");
    t.start_listener_async(udp);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    CHECK(obs.snapshot().size() == before);

    // the port is free again once the listener thread has exited
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    const int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sa.sin_port = htons(static_cast<uint16_t>(std::stoi(tcp.address.substr(tcp.address.rfind(':') + 1))));
    CHECK(::bind(fd, reinterpret_cast<const sockaddr*>(&sa), sizeof sa) == 0);
    ::close(fd);
}
