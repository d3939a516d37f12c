#include "time_window/parse_policy.hpp"
#include "time_window/time_parser.hpp"
#include <cmath>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>

namespace tw {

bool DurationPolicy::is_plain_numeral(std::string_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size() && is_digit(s[i])) ++i;
  if (i == 0) return false;
  if (i == s.size()) return true;
  if (s[i] != '.') return false;
  std::size_t j = ++i;
  while (i < s.size() && is_digit(s[i])) ++i;
  return i > j && i == s.size();
}

std::optional<double> DurationPolicy::parse_number(std::string_view s) const {
  if (!is_plain_numeral(s)) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> DurationPolicy::parse_seconds(std::string_view s, Error* err) const {
  auto v = parse_number(s);
  if (!v || !in_bounds(*v)) {
    fail(err, ErrorCode::DurationOutOfBounds,
         "Invalid duration '" + std::string(s) + "'. Duration must be between 1 and "
         + std::to_string(max_seconds) + " seconds.");
    return std::nullopt;
  }
  return static_cast<std::int64_t>(std::ceil(*v));
}

}
