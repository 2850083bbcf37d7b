/**
 * @file message.hpp
 * @brief ChatMessage - the tracked unit of conversation, its status lifecycle, and timeline order.
 *
 * @details
 * ## Lifecycle
 * ```
 *   outbound:  new_to_send() ── Sending ──► Sent ──► ReceivedByPeer
 *                                  │          │
 *                                  └──────────┴──► Failed (terminal)
 *   inbound:   new_received() ── Received
 * ```
 * - `send_completed` is set only with Sent (and kept through ReceivedByPeer).
 * - `receive_time` on an outbound message is the ACK's own timestamp, set only
 *   together with ReceivedByPeer. On an inbound message it is the local
 *   arrival instant.
 * - Transitions happen in the store (`IChatStore::mark_as`), never here.
 *
 * ## Ordering
 * Two comparators over messages, returning <0 / 0 / >0:
 * - `standard_cmp`: by send_time, ties by receive_time (send_time when unset).
 *   One timeline, identical for every viewer.
 * - `relative_cmp`: each message is anchored at its receive_time when it was
 *   authored by the viewer (and has one), else at its send_time. Own messages
 *   land where their ACK says they landed, others where their sender says they
 *   were sent.
 *
 * `insert_with_strategy()` does binary-search insertion after any equal
 * elements; `sort_with_strategy()` is a stable sort. Both keep insertion order
 * for equal keys.
 */
#ifndef DTCHAT_MESSAGE_HPP
#define DTCHAT_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "endpoint.hpp"
#include "time.hpp"
#include "wire.hpp"

namespace dtchat {

enum class MessageStatus : uint8_t {
  Sending = 0,
  Sent,
  ReceivedByPeer,
  Received,
  Failed,
};

/// Display label: SENDING, SENT, ACKED, RECEIVED, FAILED.
const char* status_name(MessageStatus s);

enum class ContentKind : uint8_t { Text = 0, File = 1 };

/// Message body: text, or a named file.
struct Content {
  ContentKind kind{ContentKind::Text};
  std::string text;
  std::string file_name;
  std::vector<uint8_t> file_data;

  static Content make_text(std::string text);
  static Content make_file(std::string name, std::vector<uint8_t> data);

  bool operator==(const Content& o) const;
  bool operator!=(const Content& o) const { return !(*this == o); }
};

/// (send, predicted arrival, receive) as epoch milliseconds.
struct ShipmentTimestamps {
  int64_t send_ms{0};
  std::optional<int64_t> predicted_ms;
  std::optional<int64_t> receive_ms;
};

struct ChatMessage {
  std::string uuid;
  std::string sender_uuid;
  std::string room_uuid;
  Content     content;
  Endpoint    source_endpoint;

  Time                send_time;
  std::optional<Time> send_completed;
  std::optional<Time> predicted_arrival_time;
  std::optional<Time> receive_time;
  MessageStatus       status{MessageStatus::Sending};

  /// Fresh outbound message: new uuid, send_time = now, status Sending.
  static ChatMessage new_to_send(const std::string& sender_uuid,
                                 const std::string& room_uuid,
                                 Content content,
                                 const Endpoint& source_endpoint);

  /**
   * @brief Inbound message from a decoded envelope.
   *
   * send_time = send_completed = envelope timestamp; receive_time = now;
   * status Received.
   *
   * @return none if the timestamp is out of range or the source endpoint
   *         does not parse.
   */
  static std::optional<ChatMessage> new_received(const wire::Envelope& env,
                                                 const Content& content);

  ShipmentTimestamps shipment_timestamps() const;
};

/// Text/File body of an envelope; none for Ack.
std::optional<Content> content_of(const wire::Envelope& env);

/// Text or File envelope carrying @p msg.
wire::Envelope to_envelope(const ChatMessage& msg);

/// Ack envelope for @p for_msg, with a new uuid, sent by @p local_uuid from @p source at @p at.
wire::Envelope make_ack_envelope(const ChatMessage& for_msg,
                                 const std::string& local_uuid,
                                 const Time& at,
                                 const Endpoint& source);

// ---------- ordering ----------

int standard_cmp(const ChatMessage& a, const ChatMessage& b);
int relative_cmp(const ChatMessage& a, const ChatMessage& b, const std::string& viewer_uuid);

enum class SortMode : uint8_t { Standard = 0, Relative = 1 };

struct SortStrategy {
  SortMode    mode{SortMode::Standard};
  std::string viewer_uuid;            ///< Relative only

  static SortStrategy standard() { return SortStrategy{}; }
  static SortStrategy relative(std::string viewer) {
    SortStrategy s;
    s.mode = SortMode::Relative;
    s.viewer_uuid = std::move(viewer);
    return s;
  }
};

int compare(const ChatMessage& a, const ChatMessage& b, const SortStrategy& strategy);

/// Insert into an already sorted vector, after any element comparing equal.
void insert_with_strategy(std::vector<ChatMessage>& messages,
                          ChatMessage msg,
                          const SortStrategy& strategy);

void sort_with_strategy(std::vector<ChatMessage>& messages, const SortStrategy& strategy);

/// Messages whose source endpoint is of kind @p kind, order preserved.
std::vector<ChatMessage> filter_by_endpoint_kind(const std::vector<ChatMessage>& messages,
                                                 EndpointKind kind);

} // namespace dtchat

#endif // DTCHAT_MESSAGE_HPP
