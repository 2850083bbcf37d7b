#pragma once
/**
 * @file store.hpp
 * @brief Persistence contract consumed by the engine, plus the in-memory store.
 *
 * The engine only ever calls the store while holding its own lock, so
 * implementations need no locking of their own for engine use. Every call is
 * synchronous; "not found" / "not accepted" are reported through the return
 * value, never by throwing.
 *
 * Status transitions are applied here (`mark_as`) and follow the message
 * lifecycle in message.hpp. Only outbound messages still in flight move:
 *   Acked(t) : Sending|Sent -> ReceivedByPeer, receive_time = t
 *   Sent(t)  : Sending      -> Sent, send_completed = t
 *   Failed   : Sending|Sent -> Failed
 * Any other (status, intent) pair leaves the message as it is and is reported
 * as MarkResult::Unchanged.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "message.hpp"
#include "peer.hpp"
#include "time.hpp"

namespace dtchat {

enum class MarkKind : uint8_t { Acked = 0, Sent = 1, Failed = 2 };

/// Requested status transition for one message.
struct MarkIntent {
  MarkKind kind{MarkKind::Failed};
  Time     at;                       ///< Acked / Sent only

  static MarkIntent acked(const Time& t) { return MarkIntent{MarkKind::Acked, t}; }
  static MarkIntent sent(const Time& t)  { return MarkIntent{MarkKind::Sent, t}; }
  static MarkIntent failed()             { return MarkIntent{MarkKind::Failed, Time()}; }
};

enum class MarkResult : uint8_t {
  Applied = 0,
  Unchanged,      ///< message found, transition not allowed from its status
  NotFound,
};

/// Outcome of `mark_as`: what happened, and the message as stored afterwards.
struct MarkOutcome {
  MarkResult result{MarkResult::NotFound};
  std::optional<ChatMessage> message;   ///< none only for NotFound

  bool applied() const { return result == MarkResult::Applied; }
};

/**
 * @brief Peer/room/message store seen by the engine.
 */
class IChatStore {
public:
  virtual ~IChatStore() = default;

  virtual Peer get_localpeer() const = 0;
  virtual std::map<std::string, Peer> get_other_peers() const = 0;
  virtual std::map<std::string, Room> get_rooms() const = 0;

  /// @retval false message not accepted (duplicate uuid for the memory store)
  virtual bool add_message(const ChatMessage& msg) = 0;

  /// Apply @p intent to message @p uuid if its current status allows it.
  virtual MarkOutcome mark_as(const std::string& uuid, const MarkIntent& intent) = 0;

  /// Most recent @p count messages in insertion order (all of them if fewer).
  virtual std::vector<ChatMessage> get_last_messages(size_t count) const = 0;
  virtual std::vector<ChatMessage> get_all_messages() const = 0;
};

/**
 * @brief Vector-backed store. Messages are kept in insertion order.
 */
class MemoryStore : public IChatStore {
public:
  MemoryStore(Peer local, std::vector<Peer> others, std::vector<Room> rooms);

  Peer get_localpeer() const override;
  std::map<std::string, Peer> get_other_peers() const override;
  std::map<std::string, Room> get_rooms() const override;

  bool add_message(const ChatMessage& msg) override;
  MarkOutcome mark_as(const std::string& uuid, const MarkIntent& intent) override;

  std::vector<ChatMessage> get_last_messages(size_t count) const override;
  std::vector<ChatMessage> get_all_messages() const override;

private:
  Peer local_;
  std::map<std::string, Peer> others_;
  std::map<std::string, Room> rooms_;
  std::vector<ChatMessage> messages_;
};

} // namespace dtchat
