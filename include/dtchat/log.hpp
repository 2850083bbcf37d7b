#pragma once
/**
 * @file log.hpp
 * @brief key=value log lines for engine events.
 *
 * One line per event, grep-friendly:
 *   level=info cat=info event=ack_received msg=1a2b3c4d status=ACKED room=default peer=9f8e7d6c
 *   level=warn cat=transport_error transport=receive_failed endpoint="tcp 0.0.0.0:7001" reason="..."
 *
 * Levels: transport info -> debug, app info -> info, transport errors -> warn,
 * app errors -> error.
 */

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "event.hpp"

namespace dtchat {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel l);

/// "debug" | "info" | "warn" | "error" (case-insensitive).
bool parse_log_level(const std::string& s, LogLevel& out);

/// Level an event is logged at.
LogLevel level_of(const AppEvent& ev);

/**
 * @brief Observer writing one line per event at or above a threshold.
 */
class LogObserver : public IAppObserver {
public:
  LogObserver(std::ostream& os, LogLevel min_level) : os_(os), min_(min_level) {}

  void on_event(const AppEvent& ev) override;

  /// Lines written so far.
  uint64_t lines() const;

private:
  std::ostream& os_;
  LogLevel      min_;
  mutable std::mutex mu_;
  uint64_t      lines_{0};
};

} // namespace dtchat
