/**
 * @file engine.hpp
 * @brief DTChat engine - message lifecycle and acknowledgement protocol over async transports.
 *
 * @details
 * ## Field Brief
 * Links come and go, some peers sit behind a bundle agent with hours of delay,
 * and no transport tells you whether the *person* got the message. The engine
 * turns fire-and-forget sends into tracked message states:
 *
 *   Sending ──(transport Sent)──► Sent ──(peer ACK)──► ReceivedByPeer
 *      └──────(transport failure)──► Failed
 *
 * It does not know sockets, files or screens. It knows a store, a transport,
 * and a list of observers.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [UI / CLI]                        [ChatEngine]                    [ITransport]
 *      │ send_to_room / send_to_peer     │                                │
 *      ├────────────────────────────────►│ pick local endpoint (same kind)│
 *      │                                 │ pending[token] = Text          │
 *      │                                 │ encode ───── send_async ──────►│
 *      │                                 │ predict (BP only, optional)    │
 *      │                                 │ store.add + notify(Sending)    │
 *      │                                 │                                │
 *      │                                 │◄──── on_transport_event ───────┤ Sent / *Failed / Received
 *      │                                 │  Sent      -> mark_as_sent     │
 *      │                                 │  *Failed   -> mark_pending_message_as_failed
 *      │                                 │  Received  -> decode, dispatch │
 *      │                                 │      Text/File -> store, notify(Received), ACK back
 *      │                                 │      Ack       -> mark_as_acked│
 *      ◄──────── observers ──────────────┤                                │
 * ```
 *
 * ---
 *
 * @par Concurrency
 * One `std::mutex` guards all engine state (pending table, store access,
 * transport handle, observers). Every public method takes it, including the
 * transport callback, so a completion for a token can never race the send
 * that registered it. Observers are notified with the lock held; a listener
 * that calls back into the engine from `on_event()` deadlocks. Transports must
 * not call `on_transport_event()` from inside `send_async()` or
 * `start_listener_async()` for the same reason.
 *
 * ---
 *
 * @par Failure Model
 * Nothing is fatal; every failure becomes an event and the engine keeps going.
 * - Frame does not decode: `ProtocolDecode`.
 * - Envelope cannot be encoded, or no local endpoint of the destination's
 *   kind: `ProtocolEncode`; the message is stored as Failed.
 * - No transport attached yet: `InternalError`; the message is stored as Failed.
 * - Transport failure for a pending Text: message -> Failed, one `HostError`.
 *   For a pending Ack: dropped, no event (ACKs are not retried).
 * - Completion/failure for an unknown token: ignored (the raw transport
 *   error is still forwarded as TransportError).
 * - ACK for a message the store does not know: `MessageNotFound`.
 * - ACK for a message that is not in flight (Received, Failed):
 *   `MessageNotFound`, status untouched. A repeated ACK for an already
 *   acked message is ignored.
 * - Transport failure reported after the ACK already arrived: the message
 *   stays ReceivedByPeer; the raw error is forwarded as TransportError.
 * - Prediction failures: silent; `predicted_arrival_time` stays unset.
 * There is no ACK timeout and no retry: a message can stay Sent forever.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * auto store = std::make_shared<dtchat::MemoryStore>(me, peers, rooms);
 * dtchat::ChatEngine engine(store, dtchat::PredictionState::disabled());
 * engine.add_observer(std::make_shared<dtchat::LogObserver>(std::cerr, dtchat::LogLevel::Info));
 * engine.start(std::make_shared<dtchat::transport::SocketTransport>());
 *
 * engine.send_to_room(dtchat::Content::make_text("hi"), "default", false);
 * @endcode
 */
#ifndef DTCHAT_ENGINE_HPP
#define DTCHAT_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event.hpp"
#include "message.hpp"
#include "peer.hpp"
#include "prediction.hpp"
#include "store.hpp"
#include "transport/transport_base.hpp"
#include "wire.hpp"

namespace dtchat {

class ChatEngine : public transport::ITransportObserver {
public:
  /**
   * @brief Bind the engine to a store and a prediction setting.
   *
   * The local peer identity is read from the store once, here.
   */
  ChatEngine(std::shared_ptr<IChatStore> store, PredictionState prediction);

  /// Stops the attached transport so no callback outlives the engine.
  ~ChatEngine() override;

  ChatEngine(const ChatEngine&) = delete;
  ChatEngine& operator=(const ChatEngine&) = delete;

  /// Register a listener. Listeners are called in registration order.
  void add_observer(std::shared_ptr<IAppObserver> obs);

  /**
   * @brief Attach the transport and start a listener per local endpoint.
   *
   * Emits a Notice reflecting the prediction state.
   *
   * @retval false already started (start-once) or @p transport is null;
   *               an InternalError is emitted.
   */
  bool start(std::shared_ptr<transport::ITransport> transport);

  /**
   * @brief Send one message to one peer endpoint.
   *
   * @param content          text or file body
   * @param room_uuid        room the message belongs to
   * @param peer_uuid        recipient (used for prediction lookup)
   * @param destination      recipient endpoint; its kind selects the local endpoint
   * @param want_prediction  ask the oracle for an arrival estimate (BP only)
   * @return uuid of the new message, whatever the transport outcome.
   */
  std::string send_to_peer(const Content& content,
                           const std::string& room_uuid,
                           const std::string& peer_uuid,
                           const Endpoint& destination,
                           bool want_prediction);

  /**
   * @brief Fan a message out to every other participant of a room.
   * @return none when the room is unknown, the local peer is not a member, or
   *         no other participant remains. Nothing is sent in those cases.
   */
  std::optional<RoomMessage> send_to_room(const Content& content,
                                          const std::string& room_uuid,
                                          bool want_prediction);

  /// Decode and dispatch one inbound frame. @p from is the transport-level sender.
  void on_wire_envelope(const std::vector<uint8_t>& bytes, const Endpoint& from);

  /// ACK @p for_message back to @p target_endpoint.
  void send_ack_to_peer(const ChatMessage& for_message, const Endpoint& target_endpoint);

  /// Apply an ACK: Sending/Sent -> ReceivedByPeer with receive_time = ack timestamp.
  void mark_as_acked(const std::string& message_uuid, int64_t ack_timestamp_ms,
                     const std::string& ack_sender_uuid = std::string());

  /// Transport completed the send for @p token. Unknown tokens are ignored.
  void mark_as_sent(const std::string& token);

  /// Transport failed the send for @p token. Unknown tokens are ignored.
  void mark_pending_message_as_failed(const std::string& token,
                                      const std::string& reason = std::string());

  /// Transport callback (any thread).
  void on_transport_event(const transport::TransportEvent& ev) override;

  // ---------- read side (each call takes the lock) ----------

  Peer local_peer() const;
  std::map<std::string, Peer> other_peers() const;
  std::map<std::string, Room> rooms() const;
  std::vector<ChatMessage> messages() const;
  std::vector<ChatMessage> last_messages(size_t count) const;
  PredictionState prediction_state() const;
  size_t pending_count() const;
  bool started() const;

  /**
   * @brief Map a transport-level sender to a known peer endpoint.
   *
   * TCP peers connect from ephemeral ports; a "tcp 10.0.0.2:53122" sender is
   * reported as the configured "tcp 10.0.0.2:7001" of the peer with that IP.
   * Other kinds, and unknown IPs, are returned unchanged.
   */
  Endpoint map_to_peer_endpoint(const Endpoint& ep) const;

private:
  enum class PendingKind : uint8_t { Ack, Text };

  /// Bridges a transport token back to a message (see mark_as_sent / mark_pending_message_as_failed).
  struct PendingSend {
    PendingKind kind{PendingKind::Text};
    std::string token;
    std::optional<std::string> original_uuid;   ///< Ack: the acknowledged message
  };

  // All *_locked helpers require mu_ to be held.

  std::string send_to_peer_locked(const Content& content, const std::string& room_uuid,
                                  const std::string& peer_uuid, const Endpoint& destination,
                                  bool want_prediction);
  void dispatch_locked(const std::vector<uint8_t>& bytes, const Endpoint& from);
  void handle_content_locked(const wire::Envelope& env, const Content& content);
  void handle_ack_locked(const wire::Envelope& env);
  void send_ack_locked(const ChatMessage& for_message, const Endpoint& target);
  void mark_as_acked_locked(const std::string& message_uuid, int64_t ack_timestamp_ms,
                            const std::string& ack_sender_uuid);
  void mark_as_sent_locked(const std::string& token);
  bool mark_failed_locked(const std::string& token, const std::string& reason,
                          const Endpoint& endpoint);
  void predict_locked(ChatMessage& msg, const std::string& peer_uuid, size_t size_bytes) const;
  void persist_locked(const ChatMessage& msg);

  std::optional<PendingSend> take_pending_locked(const std::string& token);
  std::optional<Endpoint> local_endpoint_for(EndpointKind kind) const;
  Endpoint map_to_peer_endpoint_locked(const Endpoint& ep) const;

  void notify(const AppEvent& ev) const { observers_.notify(ev); }

private:
  // ---------- state ----------
  mutable std::mutex mu_;                              ///< guards everything below
  std::shared_ptr<IChatStore> store_;
  Peer local_;                                         ///< snapshot of store_->get_localpeer()
  PredictionState prediction_;
  ObserverList observers_;
  std::shared_ptr<transport::ITransport> transport_;   ///< null until start()
  std::map<std::string, PendingSend> pending_;         ///< token -> in-flight send
};

} // namespace dtchat

#endif // DTCHAT_ENGINE_HPP
