/**
 * @file socket_transport.hpp
 * @brief TCP/UDP transport for the chat engine: poll-driven listeners and one sender thread.
 *
 * @details
 * PURPOSE
 * -------
 * Move whole envelopes between hosts over plain sockets, with every outcome
 * reported through ITransportObserver. The engine hands frames in and never
 * blocks on the network.
 *
 * FRAMING
 * -------
 * - TCP: one short-lived connection per frame, frame SLIP-encoded (slip.hpp).
 *   Listeners keep accepted connections open and decode any number of frames
 *   from each until the peer closes.
 * - UDP: one datagram per frame, no framing. Frames over 65507 bytes fail.
 * - BP: not available in this transport; sends fail with ConnectionFailed and
 *   listeners report SocketError.
 *
 * THREADS
 * -------
 *   send_async() ──► [etl::deque, 64 jobs] ──► sender thread ──► connect/write/sendto
 *   start_listener_async(ep) ──► one listener thread per endpoint ──► poll(200 ms)
 *
 * All events are emitted from these threads, never from inside send_async()
 * or start_listener_async(); a caller may hold its own lock across those calls.
 * When the queue is full the job is rejected and the sender thread reports
 * SendFailed "send queue full" for its token.
 *
 * stop() raises the stop flag, wakes the sender, and joins every thread.
 * Queued jobs are dropped without events. The transport cannot be restarted.
 */
#ifndef DTCHAT_TRANSPORT_SOCKET_TRANSPORT_HPP
#define DTCHAT_TRANSPORT_SOCKET_TRANSPORT_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <etl/deque.h>

#include "dtchat/endpoint.hpp"
#include "dtchat/transport/transport_base.hpp"

namespace dtchat::transport {

class SocketTransport : public ITransport {
public:
  static constexpr size_t   SEND_QUEUE_CAPACITY = 64;
  static constexpr int      POLL_INTERVAL_MS    = 200;
  static constexpr int      CONNECT_TIMEOUT_MS  = 5000;
  static constexpr size_t   MAX_DATAGRAM        = 65507;
  static constexpr size_t   MAX_FRAME_BYTES     = 64u * 1024u * 1024u;   ///< per TCP frame in progress

  SocketTransport();
  ~SocketTransport() override;

  SocketTransport(const SocketTransport&) = delete;
  SocketTransport& operator=(const SocketTransport&) = delete;

  void set_observer(ITransportObserver* obs) override;
  void start_listener_async(const Endpoint& ep) override;
  void send_async(const Endpoint& local, const Endpoint& remote,
                  std::vector<uint8_t> bytes, const std::string& token) override;
  void stop() override;
  const char* name() const override { return "socket"; }

private:
  struct SendJob {
    Endpoint local;
    Endpoint remote;
    std::vector<uint8_t> bytes;
    std::string token;
  };

  struct Rejected {
    Endpoint remote;
    std::string token;
  };

  void emit(const TransportEvent& ev);

  void sender_loop();
  void process(const SendJob& job);
  void send_tcp(const SendJob& job);
  void send_udp(const SendJob& job);

  void tcp_listen_loop(Endpoint ep);
  void udp_listen_loop(Endpoint ep);

  std::atomic<ITransportObserver*> observer_{nullptr};
  std::atomic<bool> stopping_{false};

  std::mutex mu_;                       ///< guards queue_, rejected_, listeners_
  std::condition_variable cv_;
  etl::deque<SendJob, SEND_QUEUE_CAPACITY> queue_;
  std::vector<Rejected> rejected_;
  std::vector<std::thread> listeners_;
  std::thread sender_;
};

} // namespace dtchat::transport

#endif // DTCHAT_TRANSPORT_SOCKET_TRANSPORT_HPP
