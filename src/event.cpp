#include "dtchat/event.hpp"

#include <sstream>
#include <utility>

#include "dtchat/uuid.hpp"

namespace dtchat {

const char* app_event_name(EventKind k) {
  switch (k) {
    case EventKind::Notice:          return "notice";
    case EventKind::Sending:         return "sending";
    case EventKind::Sent:            return "sent";
    case EventKind::Received:        return "received";
    case EventKind::AckSent:         return "ack_sent";
    case EventKind::AckReceived:     return "ack_received";
    case EventKind::ProtocolDecode:  return "protocol_decode";
    case EventKind::ProtocolEncode:  return "protocol_encode";
    case EventKind::MessageNotFound: return "message_not_found";
    case EventKind::InternalError:   return "internal_error";
    case EventKind::HostError:       return "host_error";
    case EventKind::Transport:       return "transport";
  }
  return "unknown";
}

const char* category_name(EventCategory c) {
  switch (c) {
    case EventCategory::Info:           return "info";
    case EventCategory::Error:          return "error";
    case EventCategory::TransportInfo:  return "transport_info";
    case EventCategory::TransportError: return "transport_error";
  }
  return "unknown";
}

AppEvent AppEvent::notice(std::string text) {
  AppEvent ev;
  ev.category = EventCategory::Info;
  ev.kind = EventKind::Notice;
  ev.detail = std::move(text);
  return ev;
}

AppEvent AppEvent::info(EventKind kind, const ChatMessage& msg, std::string peer_uuid) {
  AppEvent ev;
  ev.category = EventCategory::Info;
  ev.kind = kind;
  ev.message = msg;
  ev.peer_uuid = std::move(peer_uuid);
  return ev;
}

AppEvent AppEvent::error(EventKind kind, std::string detail) {
  AppEvent ev;
  ev.category = EventCategory::Error;
  ev.kind = kind;
  ev.detail = std::move(detail);
  return ev;
}

AppEvent AppEvent::error(EventKind kind, std::string detail, const ChatMessage& msg) {
  AppEvent ev = error(kind, std::move(detail));
  ev.message = msg;
  return ev;
}

AppEvent AppEvent::from_transport(const transport::TransportEvent& tev) {
  AppEvent ev;
  ev.category = transport::is_error(tev.kind) ? EventCategory::TransportError
                                              : EventCategory::TransportInfo;
  ev.kind = EventKind::Transport;
  ev.detail = tev.reason;
  ev.transport = tev;
  return ev;
}

std::string describe(const AppEvent& ev) {
  std::ostringstream os;
  os << "cat=" << category_name(ev.category);
  if (ev.transport) {
    os << " " << ev.transport->describe();
    return os.str();
  }
  os << " event=" << app_event_name(ev.kind);
  if (ev.message) {
    os << " msg=" << short_id(ev.message->uuid)
       << " status=" << status_name(ev.message->status)
       << " room=" << short_id(ev.message->room_uuid);
  }
  if (!ev.peer_uuid.empty()) os << " peer=" << short_id(ev.peer_uuid);
  if (!ev.detail.empty()) os << " detail=\"" << ev.detail << "\"";
  return os.str();
}

void ObserverList::add(std::shared_ptr<IAppObserver> obs) {
  if (obs) observers_.push_back(std::move(obs));
}

void ObserverList::notify(const AppEvent& ev) const {
  for (const auto& obs : observers_) obs->on_event(ev);
}

} // namespace dtchat
