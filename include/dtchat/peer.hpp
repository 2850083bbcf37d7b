#pragma once
/**
 * @file peer.hpp
 * @brief Directory records owned by the store: peers, rooms, room send receipts.
 */

#include <string>
#include <vector>

#include "endpoint.hpp"

namespace dtchat {

/// A chat participant. At most one endpoint per kind is expected, not enforced.
struct Peer {
  std::string uuid;
  std::string name;
  std::string color;                  ///< presentation hint only
  std::vector<Endpoint> endpoints;

  /// First endpoint of the given kind, or nullptr.
  const Endpoint* endpoint_of(EndpointKind k) const {
    for (const auto& ep : endpoints) {
      if (ep.kind == k) return &ep;
    }
    return nullptr;
  }
};

/// Room member bound to the endpoint used when sending to this room.
struct Participant {
  std::string peer_uuid;
  Endpoint    endpoint;
};

struct Room {
  std::string uuid;
  std::string name;
  std::vector<Participant> participants;

  bool has_member(const std::string& peer_uuid) const {
    for (const auto& p : participants) {
      if (p.peer_uuid == peer_uuid) return true;
    }
    return false;
  }
};

/// Correlation record for one logical room send (one uuid per recipient copy).
struct RoomMessage {
  std::string uuid;
  std::string room_uuid;
  std::vector<std::string> messages;
};

} // namespace dtchat
