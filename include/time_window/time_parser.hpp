#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "time_window/errors.hpp"

namespace tw {

enum class TimeFormat {
  Iso8601,
  UnixSeconds,
  UnixMillis,
  SimpleDateTime,
  YearMonthDayHourMinute
};

// One successfully parsed timestamp. `epoch_seconds` is the floor of the
// instant; `nanos` keeps the truncated sub-second remainder.
struct ParsedTime {
  std::string original_input;
  std::int64_t epoch_seconds = 0;
  TimeFormat format = TimeFormat::Iso8601;
  std::uint32_t nanos = 0;
};

// Human-readable format name, e.g. "ISO 8601".
std::string_view to_string(TimeFormat f) noexcept;

// Parse one textual timestamp into a UTC instant. Recognized forms, tried in
// this order against the trimmed input:
//   YYYY-MM-DDTHH:MM:SS[.f+][Z|+HH:MM|-HH:MM]
//   unix seconds   [946684800, 4102444800)        (optional .fraction)
//   unix millis    [946684800000, 4102444800000)  (optional .fraction)
//   YYYY-MM-DD|YYYY/MM/DD|MM/DD/YYYY  HH:MM:SS[.f+]
//   YYYY-MM-DD|YYYY/MM/DD|MM/DD/YYYY  HH:MM
// Values without an offset are taken as UTC. Runs in time linear in the input.
std::optional<ParsedTime> parse_time(std::string_view input, Error* err = nullptr);

// Whitespace trim shared by the row tooling.
std::string_view trim(std::string_view s) noexcept;

// Character classes shared by the scanners.
inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
inline bool is_blank(char c) noexcept { return c == ' ' || c == '\t'; }

}
