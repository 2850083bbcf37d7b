// ============================================================================
// socket_transport.cpp - implementation for transport/socket_transport.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "dtchat/transport/socket_transport.hpp"
#include "dtchat/transport/slip.hpp"   // TCP frame boundaries

// POSIX socket headers
#include <arpa/inet.h>     // inet_ntop
#include <fcntl.h>         // fcntl, O_NONBLOCK
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>    // sockaddr_in / sockaddr_in6
#include <poll.h>          // poll(2) for the listener and connect timeouts
#include <sys/socket.h>    // socket, bind, listen, accept, send, recv
#include <unistd.h>        // close

#include <cerrno>
#include <cstring>         // std::strerror
#include <utility>

namespace dtchat::transport {

namespace {

const char* const BP_UNAVAILABLE = "bundle protocol transport not available";

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

void close_fd(int fd) {
  if (fd >= 0) ::close(fd);
}

// ---------------------------------------------------------------------------
// split_host_port()
// -----------------
// "10.0.0.2:7001" -> ("10.0.0.2", "7001"); "[::1]:7001" -> ("::1", "7001").
// Returns false when there is no ':' or either part is empty.
// ---------------------------------------------------------------------------
bool split_host_port(const std::string& address, std::string& host, std::string& port) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos) return false;
  host = address.substr(0, colon);
  port = address.substr(colon + 1);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return !host.empty() && !port.empty();
}

// ---------------------------------------------------------------------------
// resolve()
// ---------
// Numeric-port lookup of "host:port" for the given socket type. 'passive'
// selects bind semantics (AI_PASSIVE).
// ---------------------------------------------------------------------------
bool resolve(const std::string& address, int socktype, bool passive,
             sockaddr_storage& out, socklen_t& out_len, std::string& err) {
  std::string host, port;
  if (!split_host_port(address, host, port)) {
    err = "address '" + address + "' is not host:port";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = socktype;
  hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

  addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    err = "cannot resolve '" + address + "': " + ::gai_strerror(rc);
    return false;
  }
  std::memcpy(&out, res->ai_addr, res->ai_addrlen);
  out_len = static_cast<socklen_t>(res->ai_addrlen);
  ::freeaddrinfo(res);
  return true;
}

// "ip:port" text of a socket address (IPv6 without brackets, so ip_of() works).
std::string address_text(const sockaddr_storage& sa) {
  char ip[INET6_ADDRSTRLEN] = {0};
  uint16_t port = 0;
  if (sa.ss_family == AF_INET) {
    const auto* in4 = reinterpret_cast<const sockaddr_in*>(&sa);
    ::inet_ntop(AF_INET, &in4->sin_addr, ip, sizeof ip);
    port = ntohs(in4->sin_port);
  } else if (sa.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&sa);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof ip);
    port = ntohs(in6->sin6_port);
  }
  return std::string(ip) + ":" + std::to_string(port);
}

bool set_nonblocking(int fd, bool on) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)) == 0;
}

// Open, bind (and listen for TCP). Returns fd or -1 with err set.
int open_bound_socket(const Endpoint& ep, int socktype, std::string& err) {
  sockaddr_storage sa{};
  socklen_t len = 0;
  if (!resolve(ep.address, socktype, true, sa, len, err)) return -1;

  const int fd = ::socket(sa.ss_family, socktype, 0);
  if (fd < 0) { err = errno_text("socket"); return -1; }

  const int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);   // quick restarts on the same port

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&sa), len) != 0) {
    err = errno_text("bind");
    close_fd(fd);
    return -1;
  }
  if (socktype == SOCK_STREAM && ::listen(fd, 16) != 0) {
    err = errno_text("listen");
    close_fd(fd);
    return -1;
  }
  return fd;
}

// Write everything or fail; MSG_NOSIGNAL keeps a reset peer from raising SIGPIPE.
bool send_all(int fd, const std::vector<uint8_t>& data, std::string& err) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      err = errno_text("send");
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

// ---------- lifecycle ----------

SocketTransport::SocketTransport() {
  sender_ = std::thread(&SocketTransport::sender_loop, this);
}

SocketTransport::~SocketTransport() {
  stop();
}

void SocketTransport::set_observer(ITransportObserver* obs) {
  observer_.store(obs);
}

// ---------------------------------------------------------------------------
// stop()
// ------
// Idempotent. Listener threads notice the flag within one poll interval.
// Must not be called from an observer callback (it joins the calling thread).
// ---------------------------------------------------------------------------
void SocketTransport::stop() {
  std::vector<std::thread> listeners;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_.store(true);
    listeners.swap(listeners_);
    queue_.clear();
    rejected_.clear();
  }
  cv_.notify_all();

  if (sender_.joinable()) sender_.join();
  for (auto& t : listeners) {
    if (t.joinable()) t.join();
  }
}

void SocketTransport::emit(const TransportEvent& ev) {
  ITransportObserver* obs = observer_.load();
  if (obs) obs->on_transport_event(ev);
}

// ---------- sending ----------

void SocketTransport::send_async(const Endpoint& local, const Endpoint& remote,
                                 std::vector<uint8_t> bytes, const std::string& token) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_.load()) return;              // no events after stop
    if (queue_.full()) {
      rejected_.push_back(Rejected{remote, token});
    } else {
      queue_.push_back(SendJob{local, remote, std::move(bytes), token});
    }
  }
  cv_.notify_one();
}

void SocketTransport::sender_loop() {
  while (true) {
    SendJob job;
    bool has_job = false;
    std::vector<Rejected> rejected;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] {
        return stopping_.load() || !queue_.empty() || !rejected_.empty();
      });
      if (stopping_.load()) return;
      rejected.swap(rejected_);
      if (!queue_.empty()) {
        job = std::move(queue_.front());
        queue_.pop_front();
        has_job = true;
      }
    }

    for (const auto& r : rejected) {
      emit(TransportEvent::failure(TransportEventKind::SendFailed, r.remote,
                                   "send queue full", r.token));
    }
    if (has_job) process(job);
  }
}

// ---------------------------------------------------------------------------
// process()
// ---------
// Exactly one of Sent / ConnectionFailed / SendFailed per job, preceded by
// Sending when the job is actually attempted.
// ---------------------------------------------------------------------------
void SocketTransport::process(const SendJob& job) {
  if (job.local.kind != job.remote.kind) {
    emit(TransportEvent::failure(TransportEventKind::SendFailed, job.remote,
                                 std::string("endpoint kind mismatch: local ") +
                                 kind_name(job.local.kind) + ", remote " +
                                 kind_name(job.remote.kind), job.token));
    return;
  }

  switch (job.remote.kind) {
    case EndpointKind::Tcp:
      emit(TransportEvent::sending(job.token, job.remote, job.bytes.size()));
      send_tcp(job);
      break;
    case EndpointKind::Udp:
      emit(TransportEvent::sending(job.token, job.remote, job.bytes.size()));
      send_udp(job);
      break;
    case EndpointKind::Bp:
      emit(TransportEvent::failure(TransportEventKind::ConnectionFailed, job.remote,
                                   BP_UNAVAILABLE, job.token));
      break;
  }
}

void SocketTransport::send_tcp(const SendJob& job) {
  std::string err;
  sockaddr_storage sa{};
  socklen_t len = 0;
  if (!resolve(job.remote.address, SOCK_STREAM, false, sa, len, err)) {
    emit(TransportEvent::failure(TransportEventKind::ConnectionFailed, job.remote, err, job.token));
    return;
  }

  const int fd = ::socket(sa.ss_family, SOCK_STREAM, 0);
  if (fd < 0) {
    emit(TransportEvent::failure(TransportEventKind::SocketError, job.remote,
                                 errno_text("socket"), job.token));
    return;
  }

  // non-blocking connect so CONNECT_TIMEOUT_MS bounds an unreachable host
  set_nonblocking(fd, true);
  int rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&sa), len);
  if (rc != 0 && errno != EINPROGRESS) {
    err = errno_text("connect");
    close_fd(fd);
    emit(TransportEvent::failure(TransportEventKind::ConnectionFailed, job.remote, err, job.token));
    return;
  }
  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    rc = ::poll(&pfd, 1, CONNECT_TIMEOUT_MS);
    int so_err = 0;
    socklen_t so_len = sizeof so_err;
    if (rc == 0) {
      err = "connect: timed out";
    } else if (rc < 0) {
      err = errno_text("poll");
    } else if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) != 0 || so_err != 0) {
      err = std::string("connect: ") + std::strerror(so_err ? so_err : errno);
    }
    if (!err.empty()) {
      close_fd(fd);
      emit(TransportEvent::failure(TransportEventKind::ConnectionFailed, job.remote, err, job.token));
      return;
    }
  }
  set_nonblocking(fd, false);
  emit(TransportEvent::established(job.remote));

  const std::vector<uint8_t> frame = slip::encode(job.bytes);
  const bool ok = send_all(fd, frame, err);
  ::shutdown(fd, SHUT_WR);
  close_fd(fd);

  if (ok) emit(TransportEvent::sent(job.token, job.remote, job.bytes.size()));
  else    emit(TransportEvent::failure(TransportEventKind::SendFailed, job.remote, err, job.token));
}

void SocketTransport::send_udp(const SendJob& job) {
  if (job.bytes.size() > MAX_DATAGRAM) {
    emit(TransportEvent::failure(TransportEventKind::SendFailed, job.remote,
                                 "frame of " + std::to_string(job.bytes.size()) +
                                 " bytes exceeds the UDP datagram limit", job.token));
    return;
  }

  std::string err;
  sockaddr_storage sa{};
  socklen_t len = 0;
  if (!resolve(job.remote.address, SOCK_DGRAM, false, sa, len, err)) {
    emit(TransportEvent::failure(TransportEventKind::ConnectionFailed, job.remote, err, job.token));
    return;
  }

  const int fd = ::socket(sa.ss_family, SOCK_DGRAM, 0);
  if (fd < 0) {
    emit(TransportEvent::failure(TransportEventKind::SocketError, job.remote,
                                 errno_text("socket"), job.token));
    return;
  }
  const ssize_t n = ::sendto(fd, job.bytes.data(), job.bytes.size(), 0,
                             reinterpret_cast<const sockaddr*>(&sa), len);
  if (n < 0) err = errno_text("sendto");
  close_fd(fd);

  if (n == static_cast<ssize_t>(job.bytes.size())) {
    emit(TransportEvent::sent(job.token, job.remote, job.bytes.size()));
  } else {
    if (err.empty()) err = "sendto: short write";
    emit(TransportEvent::failure(TransportEventKind::SendFailed, job.remote, err, job.token));
  }
}

// ---------- listening ----------

void SocketTransport::start_listener_async(const Endpoint& ep) {
  std::lock_guard<std::mutex> lock(mu_);
  if (stopping_.load()) return;
  switch (ep.kind) {
    case EndpointKind::Tcp:
      listeners_.emplace_back(&SocketTransport::tcp_listen_loop, this, ep);
      break;
    case EndpointKind::Udp:
      listeners_.emplace_back(&SocketTransport::udp_listen_loop, this, ep);
      break;
    case EndpointKind::Bp:
      // reported from a thread like every other event
      listeners_.emplace_back([this, ep] {
        emit(TransportEvent::failure(TransportEventKind::SocketError, ep, BP_UNAVAILABLE));
      });
      break;
  }
}

// ---------------------------------------------------------------------------
// tcp_listen_loop()
// -----------------
// One poll set: the listening socket plus every accepted connection. Each
// connection owns a SLIP decoder; every completed frame becomes a Received
// event tagged with the connection's remote address.
// ---------------------------------------------------------------------------
void SocketTransport::tcp_listen_loop(Endpoint ep) {
  std::string err;
  const int lfd = open_bound_socket(ep, SOCK_STREAM, err);
  if (lfd < 0) {
    emit(TransportEvent::failure(TransportEventKind::SocketError, ep, err));
    return;
  }
  emit(TransportEvent::listener_started(ep));

  struct Conn {
    int fd;
    Endpoint peer;
    slip::Decoder dec;
  };
  std::vector<Conn> conns;
  uint8_t buf[4096];

  while (!stopping_.load()) {
    std::vector<pollfd> pfds;
    pfds.push_back(pollfd{lfd, POLLIN, 0});
    for (const auto& c : conns) pfds.push_back(pollfd{c.fd, POLLIN, 0});

    const int pr = ::poll(pfds.data(), pfds.size(), POLL_INTERVAL_MS);
    if (pr == 0) continue;                       // timeout: re-check stop flag
    if (pr < 0) {
      if (errno == EINTR) continue;
      emit(TransportEvent::failure(TransportEventKind::SocketError, ep, errno_text("poll")));
      break;
    }

    // existing connections first, back to front so erase keeps indices valid
    for (size_t i = conns.size(); i-- > 0;) {
      if (!(pfds[i + 1].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      Conn& c = conns[i];
      const ssize_t n = ::recv(c.fd, buf, sizeof buf, 0);
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;

      bool drop = false;
      if (n > 0) {
        std::vector<std::vector<uint8_t>> frames;
        c.dec.feed(buf, static_cast<size_t>(n), frames);
        for (auto& f : frames) emit(TransportEvent::received(c.peer, std::move(f)));
        if (c.dec.pending() > MAX_FRAME_BYTES) {
          emit(TransportEvent::failure(TransportEventKind::ReceiveFailed, c.peer,
                                       "frame exceeds " + std::to_string(MAX_FRAME_BYTES) + " bytes"));
          drop = true;
        }
      } else if (n == 0) {
        emit(TransportEvent::closed(c.peer));
        drop = true;
      } else {
        emit(TransportEvent::failure(TransportEventKind::ReceiveFailed, c.peer, errno_text("recv")));
        drop = true;
      }
      if (drop) {
        close_fd(c.fd);
        conns.erase(conns.begin() + static_cast<std::ptrdiff_t>(i));
      }
    }

    if (pfds[0].revents & POLLIN) {
      sockaddr_storage sa{};
      socklen_t len = sizeof sa;
      const int cfd = ::accept(lfd, reinterpret_cast<sockaddr*>(&sa), &len);
      if (cfd < 0) {
        if (errno != EINTR && errno != EAGAIN) {
          emit(TransportEvent::failure(TransportEventKind::SocketError, ep, errno_text("accept")));
        }
        continue;
      }
      Endpoint peer(EndpointKind::Tcp, address_text(sa));
      emit(TransportEvent::established(peer));
      conns.push_back(Conn{cfd, std::move(peer), slip::Decoder()});
    }
  }

  for (auto& c : conns) close_fd(c.fd);
  close_fd(lfd);
}

void SocketTransport::udp_listen_loop(Endpoint ep) {
  std::string err;
  const int fd = open_bound_socket(ep, SOCK_DGRAM, err);
  if (fd < 0) {
    emit(TransportEvent::failure(TransportEventKind::SocketError, ep, err));
    return;
  }
  emit(TransportEvent::listener_started(ep));

  std::vector<uint8_t> buf(65536);
  while (!stopping_.load()) {
    pollfd pfd{fd, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, POLL_INTERVAL_MS);
    if (pr == 0) continue;
    if (pr < 0) {
      if (errno == EINTR) continue;
      emit(TransportEvent::failure(TransportEventKind::SocketError, ep, errno_text("poll")));
      break;
    }

    sockaddr_storage sa{};
    socklen_t len = sizeof sa;
    const ssize_t n = ::recvfrom(fd, buf.data(), buf.size(), 0,
                                 reinterpret_cast<sockaddr*>(&sa), &len);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      emit(TransportEvent::failure(TransportEventKind::ReceiveFailed, ep, errno_text("recvfrom")));
      continue;
    }
    if (n == 0) continue;                        // empty datagram carries no envelope
    emit(TransportEvent::received(Endpoint(EndpointKind::Udp, address_text(sa)),
                                  std::vector<uint8_t>(buf.begin(), buf.begin() + n)));
  }
  close_fd(fd);
}

} // namespace dtchat::transport
