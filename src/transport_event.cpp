#include "dtchat/transport/transport_base.hpp"

#include <sstream>
#include <utility>

namespace dtchat::transport {

const char* event_kind_name(TransportEventKind k) {
  switch (k) {
    case TransportEventKind::Received:         return "received";
    case TransportEventKind::Sent:             return "sent";
    case TransportEventKind::Sending:          return "sending";
    case TransportEventKind::ListenerStarted:  return "listener_started";
    case TransportEventKind::Established:      return "established";
    case TransportEventKind::Closed:           return "closed";
    case TransportEventKind::ConnectionFailed: return "connection_failed";
    case TransportEventKind::SendFailed:       return "send_failed";
    case TransportEventKind::ReceiveFailed:    return "receive_failed";
    case TransportEventKind::SocketError:      return "socket_error";
  }
  return "unknown";
}

bool is_error(TransportEventKind k) {
  return k == TransportEventKind::ConnectionFailed || k == TransportEventKind::SendFailed ||
         k == TransportEventKind::ReceiveFailed || k == TransportEventKind::SocketError;
}

TransportEvent TransportEvent::received(const Endpoint& from, std::vector<uint8_t> data) {
  TransportEvent ev;
  ev.kind = TransportEventKind::Received;
  ev.endpoint = from;
  ev.bytes = data.size();
  ev.data = std::move(data);
  return ev;
}

TransportEvent TransportEvent::sent(const std::string& token, const Endpoint& to, size_t bytes) {
  TransportEvent ev;
  ev.kind = TransportEventKind::Sent;
  ev.token = token;
  ev.endpoint = to;
  ev.bytes = bytes;
  return ev;
}

TransportEvent TransportEvent::sending(const std::string& token, const Endpoint& to, size_t bytes) {
  TransportEvent ev = sent(token, to, bytes);
  ev.kind = TransportEventKind::Sending;
  return ev;
}

TransportEvent TransportEvent::listener_started(const Endpoint& ep) {
  TransportEvent ev;
  ev.kind = TransportEventKind::ListenerStarted;
  ev.endpoint = ep;
  return ev;
}

TransportEvent TransportEvent::established(const Endpoint& remote) {
  TransportEvent ev;
  ev.kind = TransportEventKind::Established;
  ev.endpoint = remote;
  return ev;
}

TransportEvent TransportEvent::closed(const Endpoint& remote) {
  TransportEvent ev;
  ev.kind = TransportEventKind::Closed;
  ev.endpoint = remote;
  return ev;
}

TransportEvent TransportEvent::failure(TransportEventKind kind, const Endpoint& ep,
                                       const std::string& reason, const std::string& token) {
  TransportEvent ev;
  ev.kind = kind;
  ev.endpoint = ep;
  ev.reason = reason;
  ev.token = token;
  return ev;
}

std::string TransportEvent::describe() const {
  std::ostringstream os;
  os << "transport=" << event_kind_name(kind)
     << " endpoint=\"" << endpoint.to_string() << "\"";
  if (!token.empty()) os << " token=" << token.substr(0, 8);
  if (bytes) os << " bytes=" << bytes;
  if (!reason.empty()) os << " reason=\"" << reason << "\"";
  return os.str();
}

} // namespace dtchat::transport
