#pragma once
/**
 * @file event.hpp
 * @brief Observer fabric: what the engine reports and who hears it.
 *
 * @details
 * Every outcome of the engine, good or bad, becomes one `AppEvent`. There is
 * no fatal path: a failed send, a frame that does not decode, an ACK for a
 * message nobody knows, all turn into events and processing continues.
 *
 * Categories:
 * - Info            Notice, Sending, Sent, Received, AckSent, AckReceived
 * - Error           ProtocolDecode, ProtocolEncode, MessageNotFound,
 *                   InternalError, HostError
 * - TransportInfo   raw transport notifications (listener up, frame in, ...)
 * - TransportError  transport failures not tied to a pending send
 *
 * `ObserverList::notify()` calls every listener synchronously, in
 * registration order, on the caller's thread. The engine calls it while
 * holding its lock: a listener must not call back into the engine from
 * `on_event()` (queue the work instead). Exceptions thrown by a listener are
 * not caught here; they propagate to the engine caller.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "message.hpp"
#include "transport/transport_base.hpp"

namespace dtchat {

enum class EventCategory : uint8_t {
  Info = 0,
  Error,
  TransportInfo,
  TransportError,
};

enum class EventKind : uint8_t {
  // Info
  Notice = 0,      ///< free-form informational text (prediction state, ...)
  Sending,
  Sent,
  Received,
  AckSent,
  AckReceived,
  // Error
  ProtocolDecode,
  ProtocolEncode,
  MessageNotFound,
  InternalError,
  HostError,       ///< transport failure for a pending message
  // TransportInfo / TransportError
  Transport,
};

/// "sending", "ack_received", "protocol_decode", ...
const char* app_event_name(EventKind k);
const char* category_name(EventCategory c);

struct AppEvent {
  EventCategory category{EventCategory::Info};
  EventKind     kind{EventKind::Notice};

  std::optional<ChatMessage> message;   ///< message concerned, when there is one
  std::string peer_uuid;                ///< AckSent: ACK target; AckReceived: acking peer
  std::string detail;                   ///< human-readable text (errors, notices)
  std::optional<transport::TransportEvent> transport;

  static AppEvent notice(std::string text);
  static AppEvent info(EventKind kind, const ChatMessage& msg, std::string peer_uuid = std::string());
  static AppEvent error(EventKind kind, std::string detail);
  static AppEvent error(EventKind kind, std::string detail, const ChatMessage& msg);
  /// TransportInfo or TransportError depending on the event kind.
  static AppEvent from_transport(const transport::TransportEvent& ev);

  bool is_error() const {
    return category == EventCategory::Error || category == EventCategory::TransportError;
  }
};

/// One-line key=value rendering, e.g.
///   "cat=info event=sent msg=1a2b3c4d status=SENT room=default"
std::string describe(const AppEvent& ev);

/// Listener contract.
class IAppObserver {
public:
  virtual ~IAppObserver() = default;
  virtual void on_event(const AppEvent& ev) = 0;
};

/**
 * @brief Ordered set of listeners. Not thread-safe by itself: the owner serializes.
 */
class ObserverList {
public:
  /// Null listeners are ignored.
  void add(std::shared_ptr<IAppObserver> obs);
  void notify(const AppEvent& ev) const;
  size_t size() const { return observers_.size(); }

private:
  std::vector<std::shared_ptr<IAppObserver>> observers_;
};

} // namespace dtchat
