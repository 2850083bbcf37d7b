// -----------------------------------------------------------------------------
// engine.cpp - Implementation of the DTChat engine
//
// API & field descriptions:
//   see include/dtchat/engine.hpp
//
// Runnable examples & usage tests:
//   see tests/ (test_engine_flows.cpp, test_engine_failures.cpp, test_engine_rooms.cpp)
//
// NOTE: This file holds the internal policies: which failures become which
// events, when a pending entry is created and consumed, and what is persisted
// on each path. Every *_locked helper runs with mu_ held.
// -----------------------------------------------------------------------------
#include "dtchat/engine.hpp"

#include <utility>

#include "dtchat/uuid.hpp"

namespace dtchat {

using transport::TransportEvent;
using transport::TransportEventKind;

// ---------- public ----------

ChatEngine::ChatEngine(std::shared_ptr<IChatStore> store, PredictionState prediction)
: store_(std::move(store)),
  prediction_(std::move(prediction)) {
  if (store_) local_ = store_->get_localpeer();   // identity is fixed for the engine's lifetime
}

ChatEngine::~ChatEngine() {
  std::shared_ptr<transport::ITransport> t;
  {
    std::lock_guard<std::mutex> lock(mu_);
    t = transport_;
  }
  if (t) t->stop();                 // joins transport threads; they may still be waiting on mu_
}

void ChatEngine::add_observer(std::shared_ptr<IAppObserver> obs) {
  std::lock_guard<std::mutex> lock(mu_);
  observers_.add(std::move(obs));
}

// -----------------------------------------------------------------------------
// start() - attach transport, open listeners, announce prediction state.
// POLICY:
//   - start-once: a second call is an InternalError and changes nothing.
//   - one listener per local endpoint, whatever its kind; the transport
//     reports endpoints it cannot serve as errors.
// -----------------------------------------------------------------------------
bool ChatEngine::start(std::shared_ptr<transport::ITransport> transport) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!store_) {
    notify(AppEvent::error(EventKind::InternalError, "engine has no store"));
    return false;
  }
  if (transport_) {
    notify(AppEvent::error(EventKind::InternalError, "engine already started"));
    return false;
  }
  if (!transport) {
    notify(AppEvent::error(EventKind::InternalError, "no transport given to start()"));
    return false;
  }

  transport_ = std::move(transport);
  transport_->set_observer(this);
  for (const auto& ep : local_.endpoints) {
    transport_->start_listener_async(ep);
  }
  notify(AppEvent::notice(prediction_.describe()));
  return true;
}

std::string ChatEngine::send_to_peer(const Content& content,
                                     const std::string& room_uuid,
                                     const std::string& peer_uuid,
                                     const Endpoint& destination,
                                     bool want_prediction) {
  std::lock_guard<std::mutex> lock(mu_);
  return send_to_peer_locked(content, room_uuid, peer_uuid, destination, want_prediction);
}

// -----------------------------------------------------------------------------
// send_to_room() - one copy per other participant, each with its own uuid.
// PRE:
//   - room exists and the local peer is one of its participants.
// OUT:
//   - none and zero sends when PRE fails or nobody else is in the room.
// -----------------------------------------------------------------------------
std::optional<RoomMessage> ChatEngine::send_to_room(const Content& content,
                                                    const std::string& room_uuid,
                                                    bool want_prediction) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!store_) return std::nullopt;

  const auto rooms = store_->get_rooms();
  const auto it = rooms.find(room_uuid);
  if (it == rooms.end()) return std::nullopt;        // unknown room
  const Room& room = it->second;
  if (!room.has_member(local_.uuid)) return std::nullopt;

  std::vector<const Participant*> targets;
  for (const auto& p : room.participants) {
    if (p.peer_uuid != local_.uuid) targets.push_back(&p);
  }
  if (targets.empty()) return std::nullopt;          // alone in the room

  RoomMessage rm;
  rm.uuid = generate_uuid();
  rm.room_uuid = room_uuid;
  for (const Participant* p : targets) {
    rm.messages.push_back(
        send_to_peer_locked(content, room_uuid, p->peer_uuid, p->endpoint, want_prediction));
  }
  return rm;
}

void ChatEngine::on_wire_envelope(const std::vector<uint8_t>& bytes, const Endpoint& from) {
  std::lock_guard<std::mutex> lock(mu_);
  dispatch_locked(bytes, from);
}

void ChatEngine::send_ack_to_peer(const ChatMessage& for_message, const Endpoint& target_endpoint) {
  std::lock_guard<std::mutex> lock(mu_);
  send_ack_locked(for_message, target_endpoint);
}

void ChatEngine::mark_as_acked(const std::string& message_uuid, int64_t ack_timestamp_ms,
                               const std::string& ack_sender_uuid) {
  std::lock_guard<std::mutex> lock(mu_);
  mark_as_acked_locked(message_uuid, ack_timestamp_ms, ack_sender_uuid);
}

void ChatEngine::mark_as_sent(const std::string& token) {
  std::lock_guard<std::mutex> lock(mu_);
  mark_as_sent_locked(token);
}

void ChatEngine::mark_pending_message_as_failed(const std::string& token, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mu_);
  mark_failed_locked(token, reason, Endpoint());
}

// -----------------------------------------------------------------------------
// on_transport_event() - single entry point for everything a transport reports.
// POLICY:
//   - info kinds are forwarded as TransportInfo; Received is forwarded with the
//     sender mapped to a known peer endpoint, then decoded and dispatched.
//   - Sent consumes the pending entry (mark_as_sent).
//   - error kinds carrying a pending token are consumed by the failure path
//     and produce only the HostError (or nothing for an Ack). All other
//     errors are forwarded as TransportError.
// -----------------------------------------------------------------------------
void ChatEngine::on_transport_event(const TransportEvent& ev) {
  std::lock_guard<std::mutex> lock(mu_);
  switch (ev.kind) {
    case TransportEventKind::Received: {
      TransportEvent fwd = ev;
      fwd.endpoint = map_to_peer_endpoint_locked(ev.endpoint);
      notify(AppEvent::from_transport(fwd));
      dispatch_locked(ev.data, fwd.endpoint);
      break;
    }
    case TransportEventKind::Sent:
      notify(AppEvent::from_transport(ev));
      mark_as_sent_locked(ev.token);
      break;
    case TransportEventKind::Sending:
    case TransportEventKind::ListenerStarted:
    case TransportEventKind::Established:
    case TransportEventKind::Closed:
      notify(AppEvent::from_transport(ev));
      break;
    case TransportEventKind::ConnectionFailed:
    case TransportEventKind::SendFailed:
    case TransportEventKind::ReceiveFailed:
    case TransportEventKind::SocketError:
      if (!ev.token.empty() && mark_failed_locked(ev.token, ev.reason, ev.endpoint)) break;
      notify(AppEvent::from_transport(ev));
      break;
  }
}

// ---------- read side ----------

Peer ChatEngine::local_peer() const {
  std::lock_guard<std::mutex> lock(mu_);
  return local_;
}

std::map<std::string, Peer> ChatEngine::other_peers() const {
  std::lock_guard<std::mutex> lock(mu_);
  return store_ ? store_->get_other_peers() : std::map<std::string, Peer>();
}

std::map<std::string, Room> ChatEngine::rooms() const {
  std::lock_guard<std::mutex> lock(mu_);
  return store_ ? store_->get_rooms() : std::map<std::string, Room>();
}

std::vector<ChatMessage> ChatEngine::messages() const {
  std::lock_guard<std::mutex> lock(mu_);
  return store_ ? store_->get_all_messages() : std::vector<ChatMessage>();
}

std::vector<ChatMessage> ChatEngine::last_messages(size_t count) const {
  std::lock_guard<std::mutex> lock(mu_);
  return store_ ? store_->get_last_messages(count) : std::vector<ChatMessage>();
}

PredictionState ChatEngine::prediction_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return prediction_;
}

size_t ChatEngine::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

bool ChatEngine::started() const {
  std::lock_guard<std::mutex> lock(mu_);
  return transport_ != nullptr;
}

Endpoint ChatEngine::map_to_peer_endpoint(const Endpoint& ep) const {
  std::lock_guard<std::mutex> lock(mu_);
  return map_to_peer_endpoint_locked(ep);
}

// ---------- private: outbound ----------

// -----------------------------------------------------------------------------
// send_to_peer_locked()
// PRE:
//   - transport attached; local peer has an endpoint of destination.kind.
// POLICY:
//   - PRE failure or encode failure: no pending entry, message persisted as
//     Failed, one error event (InternalError / ProtocolEncode).
//   - the pending entry exists before send_async() so a fast completion on a
//     transport thread always finds it (it waits on mu_ until we return).
//   - prediction only for a successfully handed-off send.
// OUT:
//   - message persisted once, then exactly one Sending event.
// -----------------------------------------------------------------------------
std::string ChatEngine::send_to_peer_locked(const Content& content,
                                            const std::string& room_uuid,
                                            const std::string& peer_uuid,
                                            const Endpoint& destination,
                                            bool want_prediction) {
  const auto local_ep = local_endpoint_for(destination.kind);
  ChatMessage msg = ChatMessage::new_to_send(local_.uuid, room_uuid, content,
                                             local_ep ? *local_ep : Endpoint(destination.kind, ""));

  bool handed_off = false;
  size_t frame_len = 0;

  if (!transport_) {
    msg.status = MessageStatus::Failed;
    notify(AppEvent::error(EventKind::InternalError,
                           "no transport attached; call start() first", msg));
  } else if (!local_ep) {
    msg.status = MessageStatus::Failed;
    notify(AppEvent::error(EventKind::ProtocolEncode,
                           std::string("no local ") + kind_name(destination.kind) +
                           " endpoint to reach " + destination.to_string(), msg));
  } else {
    std::vector<uint8_t> frame;
    std::string err;
    if (!wire::encode(to_envelope(msg), frame, err)) {
      msg.status = MessageStatus::Failed;
      notify(AppEvent::error(EventKind::ProtocolEncode, "encode failed: " + err, msg));
    } else {
      pending_[msg.uuid] = PendingSend{PendingKind::Text, msg.uuid, std::nullopt};
      frame_len = frame.size();
      transport_->send_async(*local_ep, destination, std::move(frame), msg.uuid);
      handed_off = true;
    }
  }

  if (want_prediction && handed_off) predict_locked(msg, peer_uuid, frame_len);

  persist_locked(msg);
  notify(AppEvent::info(EventKind::Sending, msg, peer_uuid));
  return msg.uuid;
}

// -----------------------------------------------------------------------------
// predict_locked() - fill predicted_arrival_time when the oracle can answer.
// PRE:
//   - prediction enabled; both the local peer and the recipient expose a BP
//     endpoint.
// POLICY:
//   - any other outcome leaves the field unset, without an event.
// -----------------------------------------------------------------------------
void ChatEngine::predict_locked(ChatMessage& msg, const std::string& peer_uuid,
                                size_t size_bytes) const {
  if (prediction_.mode != PredictionMode::Enabled || !prediction_.oracle) return;

  const Endpoint* src = local_.endpoint_of(EndpointKind::Bp);
  if (!src) return;

  const auto peers = store_->get_other_peers();
  const auto it = peers.find(peer_uuid);
  if (it == peers.end()) return;
  const Endpoint* dst = it->second.endpoint_of(EndpointKind::Bp);
  if (!dst) return;

  Time arrival;
  std::string err;
  if (prediction_.oracle->predict_at(src->address, dst->address,
                                     static_cast<double>(size_bytes), msg.send_time,
                                     arrival, err) == PredictStatus::Ok) {
    msg.predicted_arrival_time = arrival;
  }
}

void ChatEngine::persist_locked(const ChatMessage& msg) {
  if (!store_->add_message(msg)) {
    notify(AppEvent::error(EventKind::InternalError,
                           "store rejected message " + short_id(msg.uuid), msg));
  }
}

// -----------------------------------------------------------------------------
// send_ack_locked()
// POLICY:
//   - the ACK leaves from our endpoint of the target's kind; the ACK uuid is
//     the transport token, the pending entry remembers the acknowledged uuid.
//   - ACK failures are final: no retry, no event on transport failure.
// -----------------------------------------------------------------------------
void ChatEngine::send_ack_locked(const ChatMessage& for_message, const Endpoint& target) {
  if (!transport_) {
    notify(AppEvent::error(EventKind::InternalError,
                           "no transport attached; ack not sent", for_message));
    return;
  }
  const auto local_ep = local_endpoint_for(target.kind);
  if (!local_ep) {
    notify(AppEvent::error(EventKind::ProtocolEncode,
                           std::string("no local ") + kind_name(target.kind) +
                           " endpoint to ack " + target.to_string(), for_message));
    return;
  }

  const wire::Envelope ack = make_ack_envelope(for_message, local_.uuid, Time::now(), *local_ep);
  std::vector<uint8_t> frame;
  std::string err;
  if (!wire::encode(ack, frame, err)) {
    notify(AppEvent::error(EventKind::ProtocolEncode, "ack encode failed: " + err, for_message));
    return;
  }

  pending_[ack.uuid] = PendingSend{PendingKind::Ack, ack.uuid, for_message.uuid};
  transport_->send_async(*local_ep, target, std::move(frame), ack.uuid);
  notify(AppEvent::info(EventKind::AckSent, for_message, for_message.sender_uuid));
}

// ---------- private: inbound ----------

// -----------------------------------------------------------------------------
// dispatch_locked() - decode one frame and route it by payload kind.
//   Text/File -> handle_content_locked
//   Ack       -> handle_ack_locked
// -----------------------------------------------------------------------------
void ChatEngine::dispatch_locked(const std::vector<uint8_t>& bytes, const Endpoint& from) {
  wire::Envelope env;
  std::string err;
  const wire::DecodeStatus st = wire::decode(bytes, env, err);
  if (st != wire::DecodeStatus::Ok) {
    notify(AppEvent::error(EventKind::ProtocolDecode,
                           std::string(wire::decode_status_name(st)) + ": " + err +
                           " (from " + from.to_string() + ")"));
    return;
  }

  switch (env.kind) {
    case wire::PayloadKind::Text:
    case wire::PayloadKind::File: {
      const auto content = content_of(env);
      if (content) handle_content_locked(env, *content);
      break;
    }
    case wire::PayloadKind::Ack:
      handle_ack_locked(env);
      break;
  }
}

// -----------------------------------------------------------------------------
// handle_content_locked() - inbound Text/File.
// POLICY:
//   - a replayed uuid is not stored twice, but is acknowledged again: the
//     peer may have missed our first ACK.
//   - the ACK goes to the envelope's source endpoint, not the socket peer.
// -----------------------------------------------------------------------------
void ChatEngine::handle_content_locked(const wire::Envelope& env, const Content& content) {
  const auto msg = ChatMessage::new_received(env, content);
  if (!msg) {
    notify(AppEvent::error(EventKind::ProtocolDecode,
                           "message " + short_id(env.uuid) +
                           " has an invalid timestamp or source endpoint"));
    return;
  }

  if (store_->add_message(*msg)) {
    notify(AppEvent::info(EventKind::Received, *msg, msg->sender_uuid));
  }
  send_ack_locked(*msg, msg->source_endpoint);
}

void ChatEngine::handle_ack_locked(const wire::Envelope& env) {
  mark_as_acked_locked(env.ack_message_uuid, env.timestamp_ms, env.sender_uuid);
}

void ChatEngine::mark_as_acked_locked(const std::string& message_uuid, int64_t ack_timestamp_ms,
                                      const std::string& ack_sender_uuid) {
  const auto at = Time::from_millis(ack_timestamp_ms);
  if (!at) {
    notify(AppEvent::error(EventKind::ProtocolDecode,
                           "ack for " + short_id(message_uuid) + " has an invalid timestamp"));
    return;
  }
  const MarkOutcome out = store_->mark_as(message_uuid, MarkIntent::acked(*at));
  switch (out.result) {
    case MarkResult::Applied:
      notify(AppEvent::info(EventKind::AckReceived, *out.message, ack_sender_uuid));
      break;
    case MarkResult::NotFound:
      notify(AppEvent::error(EventKind::MessageNotFound,
                             "ack for unknown message " + message_uuid));
      break;
    case MarkResult::Unchanged:
      // a repeated ACK for an acked message is expected: peers re-ack replays
      if (out.message->status == MessageStatus::ReceivedByPeer) break;
      notify(AppEvent::error(EventKind::MessageNotFound,
                             "ack for message " + message_uuid + " which is not awaiting one (" +
                             status_name(out.message->status) + ")", *out.message));
      break;
  }
}

// ---------- private: pending table ----------

std::optional<ChatEngine::PendingSend> ChatEngine::take_pending_locked(const std::string& token) {
  const auto it = pending_.find(token);
  if (it == pending_.end()) return std::nullopt;
  PendingSend p = std::move(it->second);
  pending_.erase(it);                           // each token completes at most once
  return p;
}

void ChatEngine::mark_as_sent_locked(const std::string& token) {
  const auto p = take_pending_locked(token);
  if (!p) return;                               // unknown or already completed
  if (p->kind == PendingKind::Ack) return;      // ACK delivery is not tracked further

  const MarkOutcome out = store_->mark_as(token, MarkIntent::sent(Time::now()));
  if (out.result == MarkResult::NotFound) {
    notify(AppEvent::error(EventKind::MessageNotFound,
                           "sent confirmation for unknown message " + token));
    return;
  }
  if (out.applied()) notify(AppEvent::info(EventKind::Sent, *out.message));
}

// -----------------------------------------------------------------------------
// mark_failed_locked()
// OUT:
//   - false: token unknown, or the message already left the in-flight states
//            (an ACK beat the failure report); the caller forwards the raw
//            transport error.
//   - true : pending entry consumed; Text -> Failed + one HostError,
//            Ack -> dropped silently.
// -----------------------------------------------------------------------------
bool ChatEngine::mark_failed_locked(const std::string& token, const std::string& reason,
                                    const Endpoint& endpoint) {
  const auto p = take_pending_locked(token);
  if (!p) return false;
  if (p->kind == PendingKind::Ack) return true;

  std::string detail = "host not reachable";
  if (!endpoint.address.empty()) detail += ": " + endpoint.to_string();
  if (!reason.empty()) detail += " (" + reason + ")";

  const MarkOutcome out = store_->mark_as(token, MarkIntent::failed());
  if (out.result == MarkResult::Unchanged) return false;   // already acked: peer has it
  if (out.applied()) notify(AppEvent::error(EventKind::HostError, detail, *out.message));
  else               notify(AppEvent::error(EventKind::HostError, detail));
  return true;
}

// ---------- private: endpoints ----------

std::optional<Endpoint> ChatEngine::local_endpoint_for(EndpointKind kind) const {
  const Endpoint* ep = local_.endpoint_of(kind);
  if (!ep) return std::nullopt;
  return *ep;
}

Endpoint ChatEngine::map_to_peer_endpoint_locked(const Endpoint& ep) const {
  if (ep.kind != EndpointKind::Tcp || !store_) return ep;

  const std::string ip = ip_of(ep.address);
  for (const auto& kv : store_->get_other_peers()) {
    const Endpoint* tcp = kv.second.endpoint_of(EndpointKind::Tcp);
    if (tcp && ip_of(tcp->address) == ip) return *tcp;
  }
  return ep;
}

} // namespace dtchat
