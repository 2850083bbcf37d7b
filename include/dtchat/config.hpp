#pragma once
/**
 * @file config.hpp
 * @brief JSON node configuration: identity, directory, rooms, contact plan.
 *
 * Example:
 * @code{.json}
 * {
 *   "db_type": "memory",
 *   "file_reception_dir": "./received",
 *   "cp_path": "contact_plan.txt",
 *   "local_peer": "a0c4...",
 *   "peer_list": [
 *     {"uuid": "a0c4...", "name": "alice", "color": "green",
 *      "endpoints": ["tcp 127.0.0.1:7001", "bp ipn:1.0"]}
 *   ],
 *   "rooms": [
 *     {"uuid": "ops", "name": "Ops",
 *      "participants": [{"peer": "a0c4...", "endpoint": "tcp 127.0.0.1:7001"}]}
 *   ]
 * }
 * @endcode
 *
 * Only "peer_list" is required. "local_peer" may come from the command line
 * instead (the override wins). Without "rooms", one room with uuid "default"
 * holds every peer on its first endpoint.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "peer.hpp"
#include "store.hpp"

namespace dtchat {

enum class ConfigStatus : uint8_t {
  Ok = 0,
  FileNotFound,
  ParseError,          ///< not valid JSON
  InvalidField,        ///< wrong type, missing field, bad endpoint, dangling reference
  UnknownLocalPeer,    ///< no local peer given, or not in peer_list
  UnsupportedDb,
};

const char* config_status_name(ConfigStatus s);

constexpr const char* DEFAULT_CONFIG_PATH        = "default.json";
constexpr const char* DEFAULT_FILE_RECEPTION_DIR = "./";
constexpr const char* DEFAULT_ROOM_UUID          = "default";

struct AppConfig {
  std::string db_type{"memory"};
  std::string file_reception_dir{DEFAULT_FILE_RECEPTION_DIR};
  std::string cp_path;               ///< empty: prediction disabled

  Peer local;
  std::vector<Peer> others;
  std::vector<Room> rooms;
};

/**
 * @brief Parse config text.
 * @param local_override  local peer uuid; empty means use "local_peer" from the text
 */
ConfigStatus parse_config(const std::string& text, const std::string& local_override,
                          AppConfig& out, std::string& err);

/// Read @p path and parse it.
ConfigStatus load_config(const std::string& path, const std::string& local_override,
                         AppConfig& out, std::string& err);

/// Store preloaded with the configured directory.
std::shared_ptr<MemoryStore> make_store(const AppConfig& cfg);

} // namespace dtchat
