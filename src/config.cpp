#include "dtchat/config.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <utility>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace dtchat {

namespace {

bool parse_endpoint_field(const json& j, const std::string& where, Endpoint& out, std::string& err) {
  const std::string text = j.get<std::string>();
  if (!Endpoint::parse(text, out)) {
    err = where + ": invalid endpoint '" + text + "'";
    return false;
  }
  return true;
}

bool parse_peer(const json& j, size_t idx, Peer& out, std::string& err) {
  const std::string where = "peer_list[" + std::to_string(idx) + "]";
  out.uuid = j.at("uuid").get<std::string>();
  if (out.uuid.empty()) {
    err = where + ": empty uuid";
    return false;
  }
  out.name = j.value("name", out.uuid);
  out.color = j.value("color", std::string());
  if (j.contains("endpoints")) {
    for (const auto& e : j.at("endpoints")) {
      Endpoint ep;
      if (!parse_endpoint_field(e, where, ep, err)) return false;
      out.endpoints.push_back(ep);
    }
  }
  return true;
}

// Every peer (local included) on its first endpoint.
Room make_default_room(const std::vector<Peer>& all) {
  Room r;
  r.uuid = DEFAULT_ROOM_UUID;
  r.name = "Default";
  for (const auto& p : all) {
    if (p.endpoints.empty()) continue;
    r.participants.push_back(Participant{p.uuid, p.endpoints.front()});
  }
  return r;
}

} // namespace

const char* config_status_name(ConfigStatus s) {
  switch (s) {
    case ConfigStatus::Ok:               return "ok";
    case ConfigStatus::FileNotFound:     return "file_not_found";
    case ConfigStatus::ParseError:       return "parse_error";
    case ConfigStatus::InvalidField:     return "invalid_field";
    case ConfigStatus::UnknownLocalPeer: return "unknown_local_peer";
    case ConfigStatus::UnsupportedDb:    return "unsupported_db";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parse_config()
// POLICY:
//   - json type/field errors are caught and returned as InvalidField; nothing
//     escapes as an exception.
//   - peers are keyed by uuid; a repeated uuid is an error.
// -----------------------------------------------------------------------------
ConfigStatus parse_config(const std::string& text, const std::string& local_override,
                          AppConfig& out, std::string& err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    err = e.what();
    return ConfigStatus::ParseError;
  }

  AppConfig cfg;
  std::string local_uuid = local_override;
  std::vector<Peer> all;
  std::map<std::string, size_t> by_uuid;

  try {
    if (!j.is_object()) {
      err = "top level must be an object";
      return ConfigStatus::InvalidField;
    }
    cfg.db_type = j.value("db_type", std::string("memory"));
    if (cfg.db_type != "memory") {
      err = "db_type '" + cfg.db_type + "' not supported (memory only)";
      return ConfigStatus::UnsupportedDb;
    }
    cfg.file_reception_dir = j.value("file_reception_dir", std::string(DEFAULT_FILE_RECEPTION_DIR));
    cfg.cp_path = j.value("cp_path", std::string());
    if (local_uuid.empty()) local_uuid = j.value("local_peer", std::string());

    const json& plist = j.at("peer_list");
    for (size_t i = 0; i < plist.size(); ++i) {
      Peer p;
      if (!parse_peer(plist.at(i), i, p, err)) return ConfigStatus::InvalidField;
      if (by_uuid.count(p.uuid)) {
        err = "peer_list: duplicate uuid '" + p.uuid + "'";
        return ConfigStatus::InvalidField;
      }
      by_uuid[p.uuid] = all.size();
      all.push_back(std::move(p));
    }

    if (j.contains("rooms")) {
      const json& rlist = j.at("rooms");
      for (size_t i = 0; i < rlist.size(); ++i) {
        const json& rj = rlist.at(i);
        const std::string where = "rooms[" + std::to_string(i) + "]";
        Room r;
        r.uuid = rj.at("uuid").get<std::string>();
        r.name = rj.value("name", r.uuid);
        for (const auto& pj : rj.at("participants")) {
          Participant part;
          part.peer_uuid = pj.at("peer").get<std::string>();
          if (!by_uuid.count(part.peer_uuid)) {
            err = where + ": unknown peer '" + part.peer_uuid + "'";
            return ConfigStatus::InvalidField;
          }
          if (!parse_endpoint_field(pj.at("endpoint"), where, part.endpoint, err)) {
            return ConfigStatus::InvalidField;
          }
          r.participants.push_back(std::move(part));
        }
        cfg.rooms.push_back(std::move(r));
      }
    }
  } catch (const json::exception& e) {
    err = e.what();
    return ConfigStatus::InvalidField;
  }

  if (local_uuid.empty()) {
    err = "no local peer: set \"local_peer\" or pass --peer";
    return ConfigStatus::UnknownLocalPeer;
  }
  const auto it = by_uuid.find(local_uuid);
  if (it == by_uuid.end()) {
    err = "local peer '" + local_uuid + "' not in peer_list";
    return ConfigStatus::UnknownLocalPeer;
  }

  if (cfg.rooms.empty()) cfg.rooms.push_back(make_default_room(all));
  cfg.local = all[it->second];
  for (auto& p : all) {
    if (p.uuid != local_uuid) cfg.others.push_back(std::move(p));
  }

  out = std::move(cfg);
  return ConfigStatus::Ok;
}

ConfigStatus load_config(const std::string& path, const std::string& local_override,
                         AppConfig& out, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open config '" + path + "'";
    return ConfigStatus::FileNotFound;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  const ConfigStatus st = parse_config(ss.str(), local_override, out, err);
  if (st != ConfigStatus::Ok) err = path + ": " + err;
  return st;
}

std::shared_ptr<MemoryStore> make_store(const AppConfig& cfg) {
  return std::make_shared<MemoryStore>(cfg.local, cfg.others, cfg.rooms);
}

} // namespace dtchat
