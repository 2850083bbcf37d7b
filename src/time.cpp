// -----------------------------------------------------------------------------
// time.cpp - wall-clock instants (see include/dtchat/time.hpp)
// -----------------------------------------------------------------------------
#include "dtchat/time.hpp"

#include <chrono>
#include <cmath>
#include <ctime>

namespace dtchat {

Time Time::now() {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return Time(static_cast<int64_t>(ms));
}

std::optional<Time> Time::from_millis(int64_t ms) {
  if (ms < MIN_MILLIS || ms > MAX_MILLIS) return std::nullopt;
  return Time(ms);
}

Time Time::from_seconds(double secs) {
  if (std::isnan(secs)) return Time();
  const double ms = std::round(secs * 1000.0);
  if (ms <= static_cast<double>(MIN_MILLIS)) return Time(MIN_MILLIS);
  if (ms >= static_cast<double>(MAX_MILLIS)) return Time(MAX_MILLIS);
  return Time(static_cast<int64_t>(ms));
}

// Break an instant down into calendar fields. Floor division keeps instants
// before the epoch on the right second.
static bool breakdown(int64_t ms, TimeZone tz, std::tm& out) {
  int64_t secs = ms / 1000;
  if (ms % 1000 < 0) --secs;
  const std::time_t t = static_cast<std::time_t>(secs);
  if (tz == TimeZone::Utc) return ::gmtime_r(&t, &out) != nullptr;
  return ::localtime_r(&t, &out) != nullptr;
}

static std::string strftime_str(const std::string& fmt, const std::tm& tm) {
  if (fmt.empty()) return std::string();
  char buf[128];
  const size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
  return std::string(buf, n);
}

std::string Time::format(const std::string& date_fmt,
                         const std::string& time_fmt,
                         const std::string& sep,
                         TimeZone tz) const {
  std::tm tm{};
  if (!breakdown(ms_, tz, tm)) return std::string();

  const std::string d = strftime_str(date_fmt, tm);
  const std::string h = strftime_str(time_fmt, tm);
  if (d.empty()) return h;
  if (h.empty()) return d;
  return d + sep + h;
}

std::string Time::hours_minutes(TimeZone tz) const {
  return format("", "%H:%M", "", tz);
}

std::string Time::date(TimeZone tz) const {
  return format("%Y-%m-%d", "", "", tz);
}

} // namespace dtchat
