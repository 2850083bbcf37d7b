#pragma once
/**
 * @file transport_base.hpp
 * @brief Asynchronous transport contract the chat engine drives.
 *
 * The engine never touches sockets or bundle agents. It asks a transport to
 * listen on its own endpoints and to send byte frames fire-and-forget; the
 * transport reports everything that happens afterwards through one observer
 * callback, from whatever thread it runs on.
 *
 * Contract:
 *  - set_observer(obs) before start_listener_async(); obs must outlive the transport's activity.
 *  - start_listener_async(ep) never blocks; ListenerStarted or an error follows.
 *  - send_async(local, remote, bytes, token) never blocks; exactly one of
 *    Sent / ConnectionFailed / SendFailed carrying @p token follows.
 *  - Received frames are whole envelopes (framing is the transport's job).
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dtchat/endpoint.hpp"

namespace dtchat::transport {

enum class TransportEventKind : uint8_t {
  // data
  Received = 0,
  Sent,
  Sending,
  // connection
  ListenerStarted,
  Established,
  Closed,
  // errors
  ConnectionFailed,
  SendFailed,
  ReceiveFailed,
  SocketError,
};

/// "received", "connection_failed", ...
const char* event_kind_name(TransportEventKind k);

/// True for ConnectionFailed, SendFailed, ReceiveFailed, SocketError.
bool is_error(TransportEventKind k);

/**
 * @brief One transport notification. Fields not relevant to `kind` are empty.
 *
 *   Received          data, endpoint = from
 *   Sent / Sending    token, endpoint = to, bytes
 *   ListenerStarted   endpoint
 *   Established/Closed endpoint = remote
 *   *Failed / SocketError  endpoint, reason, token (when tied to a send)
 */
struct TransportEvent {
  TransportEventKind   kind{TransportEventKind::Received};
  Endpoint             endpoint;
  std::vector<uint8_t> data;
  std::string          token;
  size_t               bytes{0};
  std::string          reason;

  static TransportEvent received(const Endpoint& from, std::vector<uint8_t> data);
  static TransportEvent sent(const std::string& token, const Endpoint& to, size_t bytes);
  static TransportEvent sending(const std::string& token, const Endpoint& to, size_t bytes);
  static TransportEvent listener_started(const Endpoint& ep);
  static TransportEvent established(const Endpoint& remote);
  static TransportEvent closed(const Endpoint& remote);
  static TransportEvent failure(TransportEventKind kind, const Endpoint& ep,
                                const std::string& reason, const std::string& token = std::string());

  /// key=value summary for logs (never includes data bytes).
  std::string describe() const;
};

/// Callback surface. Called from transport threads.
class ITransportObserver {
public:
  virtual ~ITransportObserver() = default;
  virtual void on_transport_event(const TransportEvent& ev) = 0;
};

/**
 * @brief Transport trait every backend implements.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual void set_observer(ITransportObserver* obs) = 0;
  virtual void start_listener_async(const Endpoint& ep) = 0;
  virtual void send_async(const Endpoint& local, const Endpoint& remote,
                          std::vector<uint8_t> bytes, const std::string& token) = 0;
  /// Stop listeners and workers; no events are delivered after it returns.
  virtual void stop() = 0;
  virtual const char* name() const = 0;
};

} // namespace dtchat::transport
