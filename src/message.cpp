// -----------------------------------------------------------------------------
// message.cpp - ChatMessage construction, envelope mapping, ordering.
//
// API & field descriptions:
//   see include/dtchat/message.hpp
// -----------------------------------------------------------------------------
#include "dtchat/message.hpp"

#include <algorithm>
#include <utility>

#include "dtchat/uuid.hpp"

namespace dtchat {

const char* status_name(MessageStatus s) {
  switch (s) {
    case MessageStatus::Sending:        return "SENDING";
    case MessageStatus::Sent:           return "SENT";
    case MessageStatus::ReceivedByPeer: return "ACKED";
    case MessageStatus::Received:       return "RECEIVED";
    case MessageStatus::Failed:         return "FAILED";
  }
  return "UNKNOWN";
}

Content Content::make_text(std::string text) {
  Content c;
  c.kind = ContentKind::Text;
  c.text = std::move(text);
  return c;
}

Content Content::make_file(std::string name, std::vector<uint8_t> data) {
  Content c;
  c.kind = ContentKind::File;
  c.file_name = std::move(name);
  c.file_data = std::move(data);
  return c;
}

bool Content::operator==(const Content& o) const {
  if (kind != o.kind) return false;
  if (kind == ContentKind::Text) return text == o.text;
  return file_name == o.file_name && file_data == o.file_data;
}

// ---------- construction ----------

ChatMessage ChatMessage::new_to_send(const std::string& sender_uuid,
                                     const std::string& room_uuid,
                                     Content content,
                                     const Endpoint& source_endpoint) {
  ChatMessage m;
  m.uuid = generate_uuid();
  m.sender_uuid = sender_uuid;
  m.room_uuid = room_uuid;
  m.content = std::move(content);
  m.source_endpoint = source_endpoint;
  m.send_time = Time::now();
  m.status = MessageStatus::Sending;
  return m;
}

// -----------------------------------------------------------------------------
// new_received() - trust the sender's timestamp, stamp local arrival.
// PRE:  env decoded without error (fields present, kind Text/File).
// OUT:  none when the timestamp is outside the calendar range or the source
//       endpoint text does not parse.
// -----------------------------------------------------------------------------
std::optional<ChatMessage> ChatMessage::new_received(const wire::Envelope& env,
                                                     const Content& content) {
  const auto sent = Time::from_millis(env.timestamp_ms);
  if (!sent) return std::nullopt;

  Endpoint src;
  if (!Endpoint::parse(env.source_endpoint, src)) return std::nullopt;

  ChatMessage m;
  m.uuid = env.uuid;
  m.sender_uuid = env.sender_uuid;
  m.room_uuid = env.room_uuid;
  m.content = content;
  m.source_endpoint = src;
  m.send_time = *sent;
  m.send_completed = *sent;
  m.receive_time = Time::now();
  m.status = MessageStatus::Received;
  return m;
}

ShipmentTimestamps ChatMessage::shipment_timestamps() const {
  ShipmentTimestamps t;
  t.send_ms = send_time.millis();
  if (predicted_arrival_time) t.predicted_ms = predicted_arrival_time->millis();
  if (receive_time) t.receive_ms = receive_time->millis();
  return t;
}

// ---------- envelope mapping ----------

std::optional<Content> content_of(const wire::Envelope& env) {
  switch (env.kind) {
    case wire::PayloadKind::Text: return Content::make_text(env.text);
    case wire::PayloadKind::File: return Content::make_file(env.file_name, env.file_data);
    case wire::PayloadKind::Ack:  return std::nullopt;
  }
  return std::nullopt;
}

wire::Envelope to_envelope(const ChatMessage& msg) {
  wire::Envelope env;
  env.uuid = msg.uuid;
  env.sender_uuid = msg.sender_uuid;
  env.room_uuid = msg.room_uuid;
  env.timestamp_ms = msg.send_time.millis();
  env.source_endpoint = msg.source_endpoint.to_string();
  if (msg.content.kind == ContentKind::Text) {
    env.kind = wire::PayloadKind::Text;
    env.text = msg.content.text;
  } else {
    env.kind = wire::PayloadKind::File;
    env.file_name = msg.content.file_name;
    env.file_data = msg.content.file_data;
  }
  return env;
}

wire::Envelope make_ack_envelope(const ChatMessage& for_msg,
                                 const std::string& local_uuid,
                                 const Time& at,
                                 const Endpoint& source) {
  wire::Envelope env;
  env.uuid = generate_uuid();
  env.sender_uuid = local_uuid;
  env.room_uuid = for_msg.room_uuid;
  env.timestamp_ms = at.millis();
  env.source_endpoint = source.to_string();
  env.kind = wire::PayloadKind::Ack;
  env.ack_message_uuid = for_msg.uuid;
  return env;
}

// ---------- ordering ----------

static int cmp_time(const Time& a, const Time& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

int standard_cmp(const ChatMessage& a, const ChatMessage& b) {
  const int by_send = cmp_time(a.send_time, b.send_time);
  if (by_send != 0) return by_send;
  const Time rx_a = a.receive_time.value_or(a.send_time);
  const Time rx_b = b.receive_time.value_or(b.send_time);
  return cmp_time(rx_a, rx_b);
}

static Time relative_anchor(const ChatMessage& m, const std::string& viewer_uuid) {
  if (m.sender_uuid == viewer_uuid) return m.receive_time.value_or(m.send_time);
  return m.send_time;
}

int relative_cmp(const ChatMessage& a, const ChatMessage& b, const std::string& viewer_uuid) {
  return cmp_time(relative_anchor(a, viewer_uuid), relative_anchor(b, viewer_uuid));
}

int compare(const ChatMessage& a, const ChatMessage& b, const SortStrategy& strategy) {
  if (strategy.mode == SortMode::Relative) return relative_cmp(a, b, strategy.viewer_uuid);
  return standard_cmp(a, b);
}

void insert_with_strategy(std::vector<ChatMessage>& messages,
                          ChatMessage msg,
                          const SortStrategy& strategy) {
  // upper_bound: first element strictly greater, so equal keys keep arrival order
  auto pos = std::upper_bound(messages.begin(), messages.end(), msg,
      [&strategy](const ChatMessage& lhs, const ChatMessage& rhs) {
        return compare(lhs, rhs, strategy) < 0;
      });
  messages.insert(pos, std::move(msg));
}

void sort_with_strategy(std::vector<ChatMessage>& messages, const SortStrategy& strategy) {
  std::stable_sort(messages.begin(), messages.end(),
      [&strategy](const ChatMessage& lhs, const ChatMessage& rhs) {
        return compare(lhs, rhs, strategy) < 0;
      });
}

std::vector<ChatMessage> filter_by_endpoint_kind(const std::vector<ChatMessage>& messages,
                                                 EndpointKind kind) {
  std::vector<ChatMessage> out;
  for (const auto& m : messages) {
    if (m.source_endpoint.kind == kind) out.push_back(m);
  }
  return out;
}

} // namespace dtchat
