#include "time_window/time_range.hpp"
#include <string>

namespace tw {

std::optional<TimeRange> centered_window(const ParsedTime& center,
                                         std::int64_t window_seconds,
                                         Error* err) {
  if (window_seconds < 1) {
    fail(err, ErrorCode::RangeTooShort,
         "Window must be at least 1 second, got " + std::to_string(window_seconds));
    return std::nullopt;
  }
  const std::int64_t back = window_seconds / 2;
  TimeRange r;
  r.start_epoch_seconds = center.epoch_seconds - back;
  r.end_epoch_seconds   = center.epoch_seconds + (window_seconds - back);
  r.duration_seconds    = window_seconds;
  return r;
}

std::optional<TimeRange> explicit_range(const ParsedTime& start,
                                        const ParsedTime& end,
                                        const RangeBounds& bounds,
                                        Error* err) {
  const std::int64_t d = end.epoch_seconds - start.epoch_seconds;
  // A non-positive span is never a range, whatever the caller's minimum.
  if (d < 1 || d < bounds.min_seconds) {
    const std::int64_t floor_s = bounds.min_seconds > 1 ? bounds.min_seconds : 1;
    fail(err, ErrorCode::RangeTooShort,
         "Minimum time span is " + std::to_string(floor_s)
         + (floor_s == 1 ? " second" : " seconds"));
    return std::nullopt;
  }
  if (d > bounds.max_seconds) {
    fail(err, ErrorCode::RangeTooLong,
         "Maximum time span is " + std::to_string(bounds.max_seconds) + " seconds, got "
         + std::to_string(d));
    return std::nullopt;
  }
  return TimeRange{start.epoch_seconds, end.epoch_seconds, d};
}

}
