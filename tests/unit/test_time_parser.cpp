#include "time_window/time_parser.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static void expect_epoch(const std::string& in, std::int64_t epoch, tw::TimeFormat fmt) {
  tw::Error err;
  auto t = tw::parse_time(in, &err);
  if (!t) { check(false, "parse '" + in + "': " + err.message); return; }
  check(t->epoch_seconds == epoch,
        "'" + in + "' epoch=" + std::to_string(t->epoch_seconds) + " want " + std::to_string(epoch));
  check(t->format == fmt, "'" + in + "' format=" + std::string(tw::to_string(t->format)));
  check(t->original_input == in, "'" + in + "' original_input not verbatim");
}

static void expect_error(const std::string& in, tw::ErrorCode code) {
  tw::Error err;
  auto t = tw::parse_time(in, &err);
  check(!t, "'" + in + "' should not parse");
  check(err.code == code, "'" + in.substr(0, 40) + "' code=" + std::string(tw::to_string(err.code))
                          + " want " + std::string(tw::to_string(code)));
}

int main() {
  using F = tw::TimeFormat;
  using E = tw::ErrorCode;

  // ISO 8601
  expect_epoch("2025-07-26T00:49:16Z", 1753490956, F::Iso8601);
  expect_epoch("2025-07-26T00:49:16.2146161Z", 1753490956, F::Iso8601);
  expect_epoch("2025-07-26T00:49:16", 1753490956, F::Iso8601);  // naive = UTC
  expect_epoch("2025-07-26T00:49:16+00:00", 1753490956, F::Iso8601);
  expect_epoch("2025-07-26T00:49:16+09:00", 1753490956 - 9 * 3600, F::Iso8601);
  expect_epoch("2025-07-26T00:49:16-05:00", 1753490956 + 5 * 3600, F::Iso8601);
  expect_epoch("1969-12-31T23:59:59Z", -1, F::Iso8601);
  expect_epoch("2038-01-19T03:14:08Z", 2147483648LL, F::Iso8601);

  // fractional digits never move the integer second
  std::string frac = "2025-07-26T00:49:16.";
  for (int n = 1; n <= 7; ++n) {
    frac += "9";
    expect_epoch(frac + "Z", 1753490956, F::Iso8601);
  }
  {
    auto t = tw::parse_time("2025-07-26T00:49:16.1234Z");
    check(t && t->nanos == 123400000u, "nanos truncation for .1234");
    auto u = tw::parse_time("2025-07-26T00:49:16.2146161Z");
    check(u && u->nanos == 214616100u, "nanos for .2146161");
  }

  // Unix epochs
  expect_epoch("1753490956", 1753490956, F::UnixSeconds);
  expect_epoch("1753490956.999", 1753490956, F::UnixSeconds);
  expect_epoch("946684800", 946684800, F::UnixSeconds);
  expect_epoch("1753490956123", 1753490956, F::UnixMillis);
  expect_epoch("1753490956999.5", 1753490956, F::UnixMillis);
  {
    auto t = tw::parse_time("1753490956123");
    check(t && t->nanos == 123000000u, "millis remainder kept as nanos");
  }
  expect_error("946684799", E::UnrecognizedFormat);
  expect_error("4102444800", E::UnrecognizedFormat);
  expect_error("20250726", E::UnrecognizedFormat);
  expect_error("-1753490956", E::UnrecognizedFormat);
  expect_error("1753490956.", E::UnrecognizedFormat);
  expect_error(std::string(40, '9'), E::UnrecognizedFormat);

  // Simple date time, three date shapes
  expect_epoch("2025-07-26 00:49:16", 1753490956, F::SimpleDateTime);
  expect_epoch("2025/07/26 00:49:16", 1753490956, F::SimpleDateTime);
  expect_epoch("07/26/2025 00:49:16", 1753490956, F::SimpleDateTime);
  expect_epoch("2025-07-26 00:49:16.75", 1753490956, F::SimpleDateTime);
  expect_epoch("03/02/2025 12:00:00", 1740916800, F::SimpleDateTime);  // month first
  expect_epoch("1970-01-01 00:00:00", 0, F::SimpleDateTime);
  expect_epoch("1900-01-01 00:00:00", -2208988800LL, F::SimpleDateTime);
  expect_epoch("2100-12-31 23:59:59", 4133980799LL, F::SimpleDateTime);
  expect_epoch("2038-01-19 03:14:07", 2147483647LL, F::SimpleDateTime);

  // Year-month-day-hour-minute
  expect_epoch("2025-07-26 00:49", 1753490940, F::YearMonthDayHourMinute);
  expect_epoch("2025/07/26 00:49", 1753490940, F::YearMonthDayHourMinute);
  expect_epoch("07/26/2025 00:49", 1753490940, F::YearMonthDayHourMinute);

  // leap years
  expect_epoch("2024-02-29 12:00:00", 1709208000, F::SimpleDateTime);
  expect_epoch("2020-02-29 12:00:00", 1582977600, F::SimpleDateTime);
  expect_epoch("2000-02-29 12:00:00", 951825600, F::SimpleDateTime);

  // calendar rollover is rejected, not corrected
  for (const char* s : {"2025-02-29 12:00:00", "2025-02-30 12:00:00", "2025-04-31 12:00:00",
                        "2025-06-31 12:00:00", "2025-09-31 12:00:00", "2025-11-31 12:00:00",
                        "1900-02-29 12:00:00", "2025-13-01 12:00:00", "2025-00-10 12:00:00",
                        "2025-07-26 24:00:00", "2025-07-26 12:60:00", "2025-07-26 12:00:60",
                        "2025-02-30T00:00:00Z", "04/31/2025 10:00", "2025-04-31 10:00"}) {
    expect_error(s, E::SemanticMismatch);
  }

  // empty / garbage
  expect_error("", E::EmptyInput);
  expect_error("   \t ", E::EmptyInput);
  expect_error("yesterday", E::UnrecognizedFormat);
  expect_error("2025-07-26", E::UnrecognizedFormat);
  expect_error("2025-07-26T00:49:16.Z", E::UnrecognizedFormat);
  expect_error("2025-07-26T00:49:16+24:00", E::UnrecognizedFormat);
  expect_error("2025-07-26T00:49:16ZZ", E::UnrecognizedFormat);
  expect_error("2025-07/26 00:49:16", E::UnrecognizedFormat);
  expect_error("2025-07-26T00:49", E::UnrecognizedFormat);

  // surrounding whitespace is trimmed for matching, kept in original_input
  {
    auto t = tw::parse_time("  2025-07-26T00:49:16Z\t");
    check(t && t->epoch_seconds == 1753490956, "trimmed ISO");
    check(t && t->original_input == "  2025-07-26T00:49:16Z\t", "original_input verbatim");
  }

  // adversarial inputs fail fast
  std::string rep;
  for (int i = 0; i < 1000; ++i) rep += "invalid-";
  rep += "timestamp";
  std::string ones(50, '1');
  std::string thirteen;
  for (int i = 0; i < 20; ++i) thirteen += "-13";
  const std::vector<std::string> slow = {
    rep,
    "2025-07-26T00:49:16." + ones + "ZZZZ",
    "2025" + thirteen + "-26 12:00:00",
    std::string(100, 'T') + "2025-07-26T00:49:16Z",
    std::string(1000, '1'),
    std::string(1000, '/'),
  };
  for (const auto& s : slow) {
    auto t0 = std::chrono::steady_clock::now();
    tw::Error err;
    auto t = tw::parse_time(s, &err);
    auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    check(!t, "adversarial input parsed: " + s.substr(0, 30));
    check(ms < 100.0, "adversarial input took " + std::to_string(ms) + "ms");
  }

  check(tw::to_string(F::Iso8601) == "ISO 8601", "format name");
  check(tw::to_string(F::UnixMillis) == "Unix timestamp (milliseconds)", "format name millis");

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] time_parser\n";
  return 0;
}
