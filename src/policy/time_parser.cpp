#include "time_window/time_parser.hpp"
#include <charconv>
#include <ctime>
#include <string>
#include <string_view>

// Every stage below is a single left-to-right scan with fixed-width fields and
// no backtracking, so rejecting any input costs O(n) per stage.

namespace tw {

namespace {

constexpr std::uint64_t kMinUnixSeconds = 946684800ULL;     // 2000-01-01
constexpr std::uint64_t kMaxUnixSeconds = 4102444800ULL;    // 2100-01-01, exclusive
constexpr std::uint64_t kMinUnixMillis  = kMinUnixSeconds * 1000ULL;
constexpr std::uint64_t kMaxUnixMillis  = kMaxUnixSeconds * 1000ULL;

// Everything a stage may extract from its input.
struct Fields {
  int year = 0, month = 0, day = 0;
  int hour = 0, minute = 0, second = 0;
  std::uint32_t nanos = 0;
  int offset_seconds = 0;      // east of UTC
  std::uint64_t integral = 0;  // numeral stages
};

// Forward-only reader over the trimmed input.
class Cursor {
public:
  explicit Cursor(std::string_view s) : s_(s) {}

  bool at_end() const { return i_ == s_.size(); }
  char peek(std::size_t ahead = 0) const {
    return (i_ + ahead < s_.size()) ? s_[i_ + ahead] : '\0';
  }

  bool lit(char c) {
    if (peek() != c) return false;
    ++i_; return true;
  }

  // Exactly `n` digits.
  bool fixed(std::size_t n, int& out) {
    if (i_ + n > s_.size()) return false;
    int v = 0;
    for (std::size_t k = 0; k < n; ++k) {
      char c = s_[i_ + k];
      if (!is_digit(c)) return false;
      v = v * 10 + (c - '0');
    }
    out = v; i_ += n;
    return true;
  }

  // One or more digits; returns the run.
  std::string_view run() {
    std::size_t b = i_;
    while (i_ < s_.size() && is_digit(s_[i_])) ++i_;
    return s_.substr(b, i_ - b);
  }

  bool blanks() {
    std::size_t b = i_;
    while (i_ < s_.size() && is_blank(s_[i_])) ++i_;
    return i_ > b;
  }

private:
  std::string_view s_;
  std::size_t i_{0};
};

// Truncate a digit run to nanoseconds: "2146161" -> 214616100.
std::uint32_t nanos_of(std::string_view digits) {
  std::uint32_t v = 0;
  std::size_t k = 0;
  for (; k < digits.size() && k < 9; ++k) v = v * 10 + std::uint32_t(digits[k] - '0');
  for (; k < 9; ++k) v *= 10;
  return v;
}

// Optional ".digits". Fails only on a dot with no digits after it.
bool fraction(Cursor& c, Fields& f) {
  if (!c.lit('.')) return true;
  std::string_view d = c.run();
  if (d.empty()) return false;
  f.nanos = nanos_of(d);
  return true;
}

// YYYY-MM-DD, YYYY/MM/DD or MM/DD/YYYY. `iso_only` restricts to the first.
bool date_part(Cursor& c, Fields& f, bool iso_only) {
  if (!iso_only && is_digit(c.peek()) && is_digit(c.peek(1)) && c.peek(2) == '/') {
    return c.fixed(2, f.month) && c.lit('/') && c.fixed(2, f.day) && c.lit('/')
        && c.fixed(4, f.year);
  }
  if (!c.fixed(4, f.year)) return false;
  char sep = c.peek();
  if (sep != '-' && (iso_only || sep != '/')) return false;
  return c.lit(sep) && c.fixed(2, f.month) && c.lit(sep) && c.fixed(2, f.day);
}

bool match_iso8601(std::string_view s, Fields& f) {
  Cursor c(s);
  if (!(date_part(c, f, true) && c.lit('T') && c.fixed(2, f.hour) && c.lit(':')
        && c.fixed(2, f.minute) && c.lit(':') && c.fixed(2, f.second)))
    return false;
  if (!fraction(c, f)) return false;
  if (c.lit('Z')) return c.at_end();
  char sign = c.peek();
  if (sign == '+' || sign == '-') {
    c.lit(sign);
    int oh = 0, om = 0;
    if (!(c.fixed(2, oh) && c.lit(':') && c.fixed(2, om))) return false;
    if (oh > 23 || om > 59) return false;
    f.offset_seconds = (sign == '-' ? -1 : 1) * (oh * 3600 + om * 60);
  }
  return c.at_end();
}

bool match_numeral(std::string_view s, Fields& f) {
  Cursor c(s);
  std::string_view whole = c.run();
  if (whole.empty()) return false;
  if (!fraction(c, f) || !c.at_end()) return false;
  auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), f.integral);
  return ec == std::errc() && ptr == whole.data() + whole.size();
}

bool match_date_time(std::string_view s, Fields& f) {
  Cursor c(s);
  return date_part(c, f, false) && c.blanks() && c.fixed(2, f.hour) && c.lit(':')
      && c.fixed(2, f.minute) && c.lit(':') && c.fixed(2, f.second)
      && fraction(c, f) && c.at_end();
}

bool match_date_hour_minute(std::string_view s, Fields& f) {
  Cursor c(s);
  return date_part(c, f, false) && c.blanks() && c.fixed(2, f.hour) && c.lit(':')
      && c.fixed(2, f.minute) && c.at_end();
}

enum class Verdict { Accept, NoMatch, Mismatch };

std::time_t utc_timegm(std::tm* tm) {
#if defined(_WIN32)
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

bool utc_breakdown(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return gmtime_s(out, &t) == 0;
#else
  return gmtime_r(&t, out) != nullptr;
#endif
}

// Range-check the fields, build a calendar value, then break the result back
// down and require every field to come back unchanged. A date such as
// 2025-04-31 normalizes to May 1st and fails the comparison.
Verdict validate_calendar(const Fields& f, std::int64_t& epoch, std::uint32_t& nanos) {
  if (f.month < 1 || f.month > 12 || f.day < 1 || f.day > 31 || f.hour > 23
      || f.minute > 59 || f.second > 59)
    return Verdict::Mismatch;

  std::tm tm{};
  tm.tm_year = f.year - 1900; tm.tm_mon = f.month - 1; tm.tm_mday = f.day;
  tm.tm_hour = f.hour; tm.tm_min = f.minute; tm.tm_sec = f.second;
  std::tm scratch = tm;
  const std::time_t t = utc_timegm(&scratch);

  std::tm back{};
  if (!utc_breakdown(t, &back)) return Verdict::Mismatch;
  if (back.tm_year != tm.tm_year || back.tm_mon != tm.tm_mon || back.tm_mday != tm.tm_mday
      || back.tm_hour != tm.tm_hour || back.tm_min != tm.tm_min || back.tm_sec != tm.tm_sec)
    return Verdict::Mismatch;

  epoch = static_cast<std::int64_t>(t) - f.offset_seconds;
  nanos = f.nanos;
  return Verdict::Accept;
}

Verdict validate_unix_seconds(const Fields& f, std::int64_t& epoch, std::uint32_t& nanos) {
  if (f.integral < kMinUnixSeconds || f.integral >= kMaxUnixSeconds) return Verdict::NoMatch;
  epoch = static_cast<std::int64_t>(f.integral);
  nanos = f.nanos;
  return Verdict::Accept;
}

Verdict validate_unix_millis(const Fields& f, std::int64_t& epoch, std::uint32_t& nanos) {
  if (f.integral < kMinUnixMillis || f.integral >= kMaxUnixMillis) return Verdict::NoMatch;
  epoch = static_cast<std::int64_t>(f.integral / 1000);
  nanos = static_cast<std::uint32_t>(f.integral % 1000) * 1000000u + f.nanos / 1000u;
  return Verdict::Accept;
}

struct Stage {
  TimeFormat format;
  bool (*match)(std::string_view, Fields&);
  Verdict (*validate)(const Fields&, std::int64_t&, std::uint32_t&);
};

// Fixed recognition order. Each stage sees the same trimmed input.
constexpr Stage kStages[] = {
  {TimeFormat::Iso8601,                match_iso8601,          validate_calendar},
  {TimeFormat::UnixSeconds,            match_numeral,          validate_unix_seconds},
  {TimeFormat::UnixMillis,             match_numeral,          validate_unix_millis},
  {TimeFormat::SimpleDateTime,         match_date_time,        validate_calendar},
  {TimeFormat::YearMonthDayHourMinute, match_date_hour_minute, validate_calendar},
};

}

std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view ws = " \t\r\n\v\f";
  auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::string_view to_string(TimeFormat f) noexcept {
  switch (f) {
    case TimeFormat::Iso8601:                return "ISO 8601";
    case TimeFormat::UnixSeconds:            return "Unix timestamp (seconds)";
    case TimeFormat::UnixMillis:             return "Unix timestamp (milliseconds)";
    case TimeFormat::SimpleDateTime:         return "Simple date time";
    case TimeFormat::YearMonthDayHourMinute: return "Year-month-day-hour-minute";
  }
  return "unknown";
}

std::optional<ParsedTime> parse_time(std::string_view input, Error* err) {
  const std::string_view s = trim(input);
  if (s.empty()) {
    fail(err, ErrorCode::EmptyInput, "Time input cannot be empty");
    return std::nullopt;
  }

  bool mismatched = false;
  for (const Stage& st : kStages) {
    Fields f;
    if (!st.match(s, f)) continue;
    std::int64_t epoch = 0;
    std::uint32_t nanos = 0;
    switch (st.validate(f, epoch, nanos)) {
      case Verdict::Accept:
        return ParsedTime{std::string(input), epoch, st.format, nanos};
      case Verdict::Mismatch:
        mismatched = true;
        break;
      case Verdict::NoMatch:
        break;
    }
  }

  if (mismatched) {
    fail(err, ErrorCode::SemanticMismatch,
         "Invalid calendar date or time: " + std::string(s));
  } else {
    fail(err, ErrorCode::UnrecognizedFormat,
         "Unable to parse time format: " + std::string(s)
         + ". Supported formats: ISO 8601, Unix timestamp, YYYY-MM-DD HH:MM:SS, etc.");
  }
  return std::nullopt;
}

}
