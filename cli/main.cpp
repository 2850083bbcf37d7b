/**
 * @file main.cpp
 * @brief dtchat - interactive terminal client around dtchat::ChatEngine.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); fall back to DTCHAT_CONFIG / DTCHAT_PEER.
 *  - Load the JSON config, build the store, the prediction state and the engine.
 *  - Attach observers: key=value log to stderr, terminal view to stdout,
 *    file sink writing received files into file_reception_dir.
 *  - Start the socket transport and read stdin: plain lines go to the current
 *    room, "/..." lines are commands.
 *
 * Notes:
 *  - Observers run on engine/transport threads with the engine lock held;
 *    they only print and write files, never call back into the engine.
 *  - Exit codes: 0 ok, 2 usage or config error.
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <unistd.h> // isatty

#include <etl/deque.h>

#include "CLI/CLI11.hpp"

#include "dtchat/config.hpp"
#include "dtchat/engine.hpp"
#include "dtchat/log.hpp"
#include "dtchat/transport/socket_transport.hpp"
#include "dtchat/uuid.hpp"

namespace fs = std::filesystem;
using namespace dtchat;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  // Peer colors from the config; unknown names print plain.
  std::string color(const std::string& name, const std::string& s) const {
    static const std::map<std::string, const char*> codes = {
      {"red", "31"}, {"green", "32"}, {"yellow", "33"}, {"blue", "34"},
      {"magenta", "35"}, {"cyan", "36"}, {"white", "37"},
    };
    const auto it = codes.find(name);
    if (!enabled || it == codes.end()) return s;
    return std::string("\033[") + it->second + "m" + s + "\033[0m";
  }
};

static std::string env_or(const char* var, const std::string& fallback) {
  const char* v = std::getenv(var);
  return (v && *v) ? std::string(v) : fallback;
}

static bool read_file_bytes(const fs::path& p, std::vector<uint8_t>& out, std::string& err) {
  std::ifstream in(p, std::ios::binary);
  if (!in) { err = "cannot open '" + p.string() + "'"; return false; }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

// ---------- terminal view ----------

/**
 * Prints one line per user-facing event and keeps the last 64 lines for
 * /history. Transport info is left to the log.
 */
class TerminalView : public IAppObserver {
public:
  static constexpr size_t HISTORY = 64;

  TerminalView(Peer local, std::map<std::string, Peer> others, Ansi ansi)
  : local_(std::move(local)), others_(std::move(others)), ansi_(ansi) {}

  void on_event(const AppEvent& ev) override {
    std::string line;
    if (ev.category == EventCategory::TransportInfo) return;
    if (ev.category == EventCategory::TransportError) {
      line = ansi_.red("! transport " + describe(ev));
    } else if (ev.category == EventCategory::Error) {
      line = ansi_.red(std::string("! ") + app_event_name(ev.kind) + ": " + ev.detail);
    } else if (ev.kind == EventKind::Notice) {
      line = ansi_.dim("* " + ev.detail);
    } else if (ev.kind == EventKind::AckSent) {
      if (!ev.message) return;
      line = ansi_.dim("  ack -> " + name_of(ev.peer_uuid) + " for " + short_id(ev.message->uuid));
    } else if (ev.message) {
      line = format_message(*ev.message);
    } else {
      return;
    }

    std::lock_guard<std::mutex> lock(mu_);
    std::cout << line << "\n" << std::flush;
    if (history_.full()) history_.pop_front();
    history_.push_back(line);
  }

  // "[14:02] ACKED    1a2b3c4d alice: hello  [14:02:01 -> 14:02:03]"
  std::string format_message(const ChatMessage& m) const {
    std::ostringstream os;
    os << "[" << m.send_time.hours_minutes() << "] ";
    std::string label = status_name(m.status);
    label.resize(9, ' ');
    os << (m.status == MessageStatus::Failed ? ansi_.red(label) : ansi_.bold(label));
    os << short_id(m.uuid) << " " << ansi_.color(color_of(m.sender_uuid), name_of(m.sender_uuid)) << ": ";
    if (m.content.kind == ContentKind::Text) os << m.content.text;
    else os << "<file " << m.content.file_name << ", " << m.content.file_data.size() << " bytes>";

    const std::string send = m.send_completed ? m.send_completed->format("", "%H:%M:%S", "") : "-";
    const std::string recv = m.receive_time ? m.receive_time->format("", "%H:%M:%S", "") : "-";
    os << "  " << ansi_.dim("[" + send + " -> " + recv + "]");
    if (m.predicted_arrival_time) {
      os << ansi_.dim(" eta " + m.predicted_arrival_time->format("", "%H:%M:%S", ""));
    }
    return os.str();
  }

  std::vector<std::string> history(size_t n) const {
    std::lock_guard<std::mutex> lock(mu_);
    const size_t count = n < history_.size() ? n : history_.size();
    return std::vector<std::string>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
  }

  std::string name_of(const std::string& uuid) const {
    if (uuid == local_.uuid) return local_.name;
    const auto it = others_.find(uuid);
    return it != others_.end() ? it->second.name : short_id(uuid);
  }

private:
  std::string color_of(const std::string& uuid) const {
    if (uuid == local_.uuid) return local_.color;
    const auto it = others_.find(uuid);
    return it != others_.end() ? it->second.color : std::string();
  }

  Peer local_;
  std::map<std::string, Peer> others_;
  Ansi ansi_;
  mutable std::mutex mu_;
  etl::deque<std::string, HISTORY> history_;
};

// ---------- file sink ----------

/// Writes received files into the reception directory, keeping only the final name component.
class FileSink : public IAppObserver {
public:
  explicit FileSink(fs::path dir) : dir_(std::move(dir)) {}

  void on_event(const AppEvent& ev) override {
    if (ev.kind != EventKind::Received || !ev.message) return;
    const ChatMessage& m = *ev.message;
    if (m.content.kind != ContentKind::File) return;

    const fs::path name = fs::path(m.content.file_name).filename();
    if (name.empty() || name == "." || name == "..") {
      std::cerr << "level=error event=file_write msg=" << short_id(m.uuid)
                << " detail=\"unusable file name '" << m.content.file_name << "'\"\n";
      return;
    }
    try {
      fs::create_directories(dir_);
      const fs::path target = dir_ / name;
      std::ofstream out(target, std::ios::binary | std::ios::trunc);
      out.write(reinterpret_cast<const char*>(m.content.file_data.data()),
                static_cast<std::streamsize>(m.content.file_data.size()));
      if (!out) {
        std::cerr << "level=error event=file_write msg=" << short_id(m.uuid)
                  << " detail=\"cannot write " << target.string() << "\"\n";
        return;
      }
      std::cerr << "level=info event=file_written msg=" << short_id(m.uuid)
                << " path=\"" << target.string() << "\"\n";
    } catch (const fs::filesystem_error& e) {
      std::cerr << "level=error event=file_write msg=" << short_id(m.uuid)
                << " detail=\"" << e.what() << "\"\n";
    }
  }

private:
  fs::path dir_;
};

// ---------- commands ----------

static void print_help() {
  std::cout <<
    "  <text>                 send to the current room\n"
    "  /rooms                 list rooms\n"
    "  /room <uuid>           switch current room\n"
    "  /peers                 list peers and endpoints\n"
    "  /history [n]           last n event lines (max 64)\n"
    "  /messages [n]          last n messages of the current room, sorted\n"
    "  /file <path>           send a file to the current room\n"
    "  /sort standard|relative\n"
    "  /quit\n";
}

static size_t parse_count(const std::string& arg, size_t fallback) {
  if (arg.empty()) return fallback;
  try {
    const long v = std::stol(arg);
    return v > 0 ? static_cast<size_t>(v) : fallback;
  } catch (const std::logic_error&) {
    return fallback;
  }
}

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_peer;
  std::string opt_log_level = "info";
  std::string opt_sort = "standard";
  bool opt_no_color = false;
  bool opt_predict = false;

  CLI::App app{"dtchat - delay-tolerant chat node"};

  app.add_option("--config", opt_config, "JSON config file (default: $DTCHAT_CONFIG or default.json)");
  app.add_option("--peer", opt_peer, "Local peer uuid (default: $DTCHAT_PEER or config local_peer)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error")
      ->capture_default_str()
      ->check(CLI::IsMember({"debug", "info", "warn", "warning", "error"}, CLI::ignore_case));
  app.add_option("--sort", opt_sort, "Message order: standard|relative")
      ->capture_default_str()
      ->check(CLI::IsMember({"standard", "relative"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--predict", opt_predict, "Ask the contact plan for arrival estimates (BP peers)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout();

  LogLevel level = LogLevel::Info;
  if (!parse_log_level(opt_log_level, level)) {
    std::cerr << ansi.red("error: invalid --log-level '" + opt_log_level + "'") << "\n";
    return 2;
  }

  const std::string config_path = opt_config.empty() ? env_or("DTCHAT_CONFIG", DEFAULT_CONFIG_PATH) : opt_config;
  const std::string peer_uuid   = opt_peer.empty() ? env_or("DTCHAT_PEER", "") : opt_peer;

  AppConfig cfg;
  std::string err;
  const ConfigStatus cst = load_config(config_path, peer_uuid, cfg, err);
  if (cst != ConfigStatus::Ok) {
    std::cerr << ansi.red(std::string("error: ") + config_status_name(cst) + ": " + err) << "\n";
    return 2;
  }

  // ---------- engine wiring ----------
  auto store = make_store(cfg);
  ChatEngine engine(store, PredictionState::from_contact_plan(cfg.cp_path));

  auto view = std::make_shared<TerminalView>(cfg.local, store->get_other_peers(), ansi);
  engine.add_observer(std::make_shared<LogObserver>(std::cerr, level));
  engine.add_observer(view);
  engine.add_observer(std::make_shared<FileSink>(fs::path(cfg.file_reception_dir)));

  auto transport = std::make_shared<transport::SocketTransport>();
  if (!engine.start(transport)) return 2;

  SortStrategy strategy = (opt_sort == "relative") ? SortStrategy::relative(cfg.local.uuid)
                                                   : SortStrategy::standard();
  std::string room = cfg.rooms.front().uuid;

  std::cout << ansi.bold("dtchat") << " as " << ansi.color(cfg.local.color, cfg.local.name)
            << " in room " << room << " (/help for commands)\n";

  // ---------- input loop ----------
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    if (line[0] != '/') {
      if (!engine.send_to_room(Content::make_text(line), room, opt_predict)) {
        std::cout << ansi.red("! nobody to send to in room " + room) << "\n";
      }
      continue;
    }

    std::istringstream is(line);
    std::string cmd, arg;
    is >> cmd;
    std::getline(is >> std::ws, arg);

    if (cmd == "/quit") break;
    else if (cmd == "/help") print_help();
    else if (cmd == "/rooms") {
      for (const auto& kv : engine.rooms()) {
        std::cout << (kv.first == room ? "* " : "  ") << kv.first << "  " << kv.second.name
                  << "  (" << kv.second.participants.size() << " participants)\n";
      }
    } else if (cmd == "/room") {
      const auto rooms = engine.rooms();
      if (rooms.count(arg)) room = arg;
      else std::cout << ansi.red("! unknown room '" + arg + "'") << "\n";
    } else if (cmd == "/peers") {
      for (const auto& kv : engine.other_peers()) {
        std::cout << "  " << ansi.color(kv.second.color, kv.second.name) << "  " << short_id(kv.first);
        for (const auto& ep : kv.second.endpoints) std::cout << "  [" << ep.to_string() << "]";
        std::cout << "\n";
      }
    } else if (cmd == "/history") {
      for (const auto& l : view->history(parse_count(arg, TerminalView::HISTORY))) std::cout << l << "\n";
    } else if (cmd == "/messages") {
      std::vector<ChatMessage> msgs;
      for (const auto& m : engine.messages()) {
        if (m.room_uuid == room) msgs.push_back(m);
      }
      sort_with_strategy(msgs, strategy);
      const size_t n = parse_count(arg, 20);
      const size_t from = msgs.size() > n ? msgs.size() - n : 0;
      for (size_t i = from; i < msgs.size(); ++i) std::cout << view->format_message(msgs[i]) << "\n";
    } else if (cmd == "/file") {
      std::vector<uint8_t> data;
      if (!read_file_bytes(fs::path(arg), data, err)) {
        std::cout << ansi.red("! " + err) << "\n";
        continue;
      }
      const std::string name = fs::path(arg).filename().string();
      if (!engine.send_to_room(Content::make_file(name, std::move(data)), room, opt_predict)) {
        std::cout << ansi.red("! nobody to send to in room " + room) << "\n";
      }
    } else if (cmd == "/sort") {
      if (arg == "standard") strategy = SortStrategy::standard();
      else if (arg == "relative") strategy = SortStrategy::relative(cfg.local.uuid);
      else std::cout << ansi.red("! /sort standard|relative") << "\n";
    } else {
      std::cout << ansi.red("! unknown command " + cmd) << "\n";
      print_help();
    }
  }

  transport->stop();
  return 0;
}
