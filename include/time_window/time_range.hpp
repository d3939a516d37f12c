#pragma once
#include <cstdint>
#include <limits>
#include <optional>

#include "time_window/errors.hpp"
#include "time_window/time_parser.hpp"

namespace tw {

// Half-open by convention: duration_seconds == end - start, always > 0.
struct TimeRange {
  std::int64_t start_epoch_seconds = 0;
  std::int64_t end_epoch_seconds = 0;
  std::int64_t duration_seconds = 0;
};

// Caller policy for explicit ranges; inclusive on both ends.
struct RangeBounds {
  std::int64_t min_seconds = 1;
  std::int64_t max_seconds = std::numeric_limits<std::int64_t>::max();

  static constexpr RangeBounds unbounded() noexcept { return RangeBounds{}; }
};

// start = center - floor(w/2), end = center + ceil(w/2). Fails with
// RangeTooShort when window_seconds < 1.
std::optional<TimeRange> centered_window(const ParsedTime& center,
                                         std::int64_t window_seconds,
                                         Error* err = nullptr);

std::optional<TimeRange> explicit_range(const ParsedTime& start,
                                        const ParsedTime& end,
                                        const RangeBounds& bounds,
                                        Error* err = nullptr);

}
