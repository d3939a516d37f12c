#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "time_window/errors.hpp"

namespace tw {

// Rules for the numeric duration column of a timestamp,duration row.
struct DurationPolicy {
  std::int64_t max_seconds = 3600;

  // True for "5", "10.75"; false for "-1", "5s", "1e3", ".5", "".
  static bool is_plain_numeral(std::string_view s) noexcept;

  // Numeric parse (fast_float). Only plain numerals are accepted.
  std::optional<double> parse_number(std::string_view s) const;

  bool in_bounds(double v) const noexcept { return v > 0.0 && v <= double(max_seconds); }

  // Whole seconds, rounded up, for a value in (0, max_seconds].
  // Fails with DurationOutOfBounds.
  std::optional<std::int64_t> parse_seconds(std::string_view s, Error* err = nullptr) const;
};

}
