#include "dtchat/store.hpp"

#include <algorithm>
#include <utility>

namespace dtchat {

MemoryStore::MemoryStore(Peer local, std::vector<Peer> others, std::vector<Room> rooms)
: local_(std::move(local)) {
  for (auto& p : others) {
    if (p.uuid == local_.uuid) continue;    // local peer is never an "other"
    const std::string key = p.uuid;
    others_[key] = std::move(p);
  }
  for (auto& r : rooms) {
    const std::string key = r.uuid;
    rooms_[key] = std::move(r);
  }
}

Peer MemoryStore::get_localpeer() const { return local_; }

std::map<std::string, Peer> MemoryStore::get_other_peers() const { return others_; }

std::map<std::string, Room> MemoryStore::get_rooms() const { return rooms_; }

bool MemoryStore::add_message(const ChatMessage& msg) {
  for (const auto& m : messages_) {
    if (m.uuid == msg.uuid) return false;   // replayed frame: keep the first copy
  }
  messages_.push_back(msg);
  return true;
}

// -----------------------------------------------------------------------------
// mark_as() - apply one status transition.
// POLICY:
//   - only outbound messages still in flight (Sending, Sent) move.
//   - Failed is terminal; Received belongs to a peer and never moves.
//   - Sent never downgrades an already acked message (ACK may beat the local
//     completion callback); an ACK arriving first also fills send_completed.
// OUT:
//   - Unchanged carries the stored message as it is.
// -----------------------------------------------------------------------------
MarkOutcome MemoryStore::mark_as(const std::string& uuid, const MarkIntent& intent) {
  MarkOutcome out;
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&uuid](const ChatMessage& m) { return m.uuid == uuid; });
  if (it == messages_.end()) return out;

  ChatMessage& m = *it;
  const bool in_flight = m.status == MessageStatus::Sending || m.status == MessageStatus::Sent;
  out.result = MarkResult::Unchanged;

  switch (intent.kind) {
    case MarkKind::Acked:
      if (!in_flight) break;
      m.receive_time = intent.at;
      m.status = MessageStatus::ReceivedByPeer;
      if (!m.send_completed) m.send_completed = intent.at;
      out.result = MarkResult::Applied;
      break;
    case MarkKind::Sent:
      if (m.status != MessageStatus::Sending) break;
      m.send_completed = intent.at;
      m.status = MessageStatus::Sent;
      out.result = MarkResult::Applied;
      break;
    case MarkKind::Failed:
      if (!in_flight) break;
      m.status = MessageStatus::Failed;
      out.result = MarkResult::Applied;
      break;
  }
  out.message = m;
  return out;
}

std::vector<ChatMessage> MemoryStore::get_last_messages(size_t count) const {
  const size_t n = std::min(count, messages_.size());
  return std::vector<ChatMessage>(messages_.end() - static_cast<std::ptrdiff_t>(n), messages_.end());
}

std::vector<ChatMessage> MemoryStore::get_all_messages() const { return messages_; }

} // namespace dtchat
