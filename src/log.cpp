#include "dtchat/log.hpp"

#include <cctype>

namespace dtchat {

const char* log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "unknown";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  std::string k;
  for (char c : s) k.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if      (k == "debug")                   out = LogLevel::Debug;
  else if (k == "info")                    out = LogLevel::Info;
  else if (k == "warn" || k == "warning")  out = LogLevel::Warn;
  else if (k == "error")                   out = LogLevel::Error;
  else return false;
  return true;
}

LogLevel level_of(const AppEvent& ev) {
  switch (ev.category) {
    case EventCategory::TransportInfo:  return LogLevel::Debug;
    case EventCategory::Info:           return LogLevel::Info;
    case EventCategory::TransportError: return LogLevel::Warn;
    case EventCategory::Error:          return LogLevel::Error;
  }
  return LogLevel::Error;
}

void LogObserver::on_event(const AppEvent& ev) {
  const LogLevel lvl = level_of(ev);
  if (lvl < min_) return;
  std::lock_guard<std::mutex> lock(mu_);
  os_ << "level=" << log_level_name(lvl) << " " << describe(ev) << "\n";
  os_.flush();
  ++lines_;
}

uint64_t LogObserver::lines() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lines_;
}

} // namespace dtchat
