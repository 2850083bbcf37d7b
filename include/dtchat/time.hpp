#pragma once
/**
 * @file time.hpp
 * @brief Absolute instants for message timelines and wire timestamps.
 *
 * @details
 * Every message carries wall-clock instants: when it was sent, when the local
 * transport confirmed it left, when an ACK says it landed. They travel between
 * peers as signed Unix epoch milliseconds, so `Time` stores exactly that and
 * nothing finer:
 *
 *   Time t = Time::now();
 *   auto back = Time::from_millis(t.millis());   // back == t, always
 *
 * Clocks of different peers are not synchronized. Values received on the wire
 * are trusted as given; the only validation is the calendar range check in
 * `from_millis()`.
 *
 * Formatting goes through strftime patterns and supports UTC and the process
 * local zone.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace dtchat {

/// Zone used when rendering an instant for humans.
enum class TimeZone : uint8_t { Utc = 0, Local = 1 };

class Time {
public:
  /// Representable range in epoch milliseconds (years -262143 .. +262142).
  static constexpr int64_t MIN_MILLIS = -8334632851200000LL;
  static constexpr int64_t MAX_MILLIS =  8210298412799999LL;

  /// Unix epoch.
  Time() = default;

  /// Current wall-clock instant, truncated to milliseconds.
  static Time now();

  /**
   * @brief Instant from epoch milliseconds.
   * @return none when @p ms lies outside [MIN_MILLIS, MAX_MILLIS].
   */
  static std::optional<Time> from_millis(int64_t ms);

  /// Instant from fractional epoch seconds, rounded to the nearest millisecond
  /// and clamped into the representable range. NaN maps to the epoch.
  static Time from_seconds(double secs);

  int64_t millis() const { return ms_; }
  double  seconds() const { return static_cast<double>(ms_) / 1000.0; }

  /**
   * @brief Render as "<date><sep><time>".
   *
   * @param date_fmt strftime pattern for the date part ("" to omit).
   * @param time_fmt strftime pattern for the time part ("" to omit).
   * @param sep      inserted only when both parts are non-empty.
   * @param tz       UTC or local zone.
   * @return formatted text, or "" if the instant cannot be broken down.
   */
  std::string format(const std::string& date_fmt = "%Y-%m-%d",
                     const std::string& time_fmt = "%H:%M:%S",
                     const std::string& sep = " ",
                     TimeZone tz = TimeZone::Local) const;

  /// "HH:MM" in the given zone.
  std::string hours_minutes(TimeZone tz = TimeZone::Local) const;

  /// "YYYY-MM-DD" in the given zone.
  std::string date(TimeZone tz = TimeZone::Local) const;

  bool operator==(const Time& o) const { return ms_ == o.ms_; }
  bool operator!=(const Time& o) const { return ms_ != o.ms_; }
  bool operator< (const Time& o) const { return ms_ <  o.ms_; }
  bool operator<=(const Time& o) const { return ms_ <= o.ms_; }
  bool operator> (const Time& o) const { return ms_ >  o.ms_; }
  bool operator>=(const Time& o) const { return ms_ >= o.ms_; }

private:
  explicit Time(int64_t ms) : ms_(ms) {}

  int64_t ms_{0};  ///< signed Unix epoch milliseconds
};

} // namespace dtchat
