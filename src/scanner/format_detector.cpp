#include "time_window/format_detector.hpp"
#include "time_window/parse_policy.hpp"
#include <algorithm>
#include <utility>

namespace tw {

std::string_view to_string(Layout l) noexcept {
  switch (l) {
    case Layout::SingleColumnUniform:   return "SingleColumnUniform";
    case Layout::TimestampPlusDuration: return "TimestampPlusDuration";
    case Layout::StartAndEnd:           return "StartAndEnd";
    case Layout::Mixed:                 return "Mixed";
    case Layout::Unknown:               return "Unknown";
  }
  return "Unknown";
}

FormatDetector::FormatDetector() : FormatDetector(Config{}) {}
FormatDetector::FormatDetector(Config cfg) : cfg_(std::move(cfg)) {}

Layout FormatDetector::classify_line(std::string_view line) const {
  CsvFsm csv(cfg_.csv);
  RecordView rv;
  if (!csv.feed(line, rv)) return Layout::Unknown;

  if (rv.size() == 1) return Layout::SingleColumnUniform;
  if (rv.size() != 2) return Layout::Unknown;

  DurationPolicy dp;
  dp.max_seconds = cfg_.max_duration_seconds;
  auto v = dp.parse_number(rv.at(1));
  if (v && dp.in_bounds(*v)) return Layout::TimestampPlusDuration;
  return Layout::StartAndEnd;
}

Layout FormatDetector::detect(const std::vector<TabularRow>& rows) const {
  const std::size_t n = std::min(cfg_.sample_rows, rows.size());
  if (n == 0) return Layout::Unknown;

  Layout first = classify_line(rows[0].raw_text);
  bool disagree = false;
  bool saw_unknown = (first == Layout::Unknown);
  for (std::size_t i = 1; i < n; ++i) {
    Layout l = classify_line(rows[i].raw_text);
    if (l == Layout::Unknown) saw_unknown = true;
    if (l != first) disagree = true;
  }

  if (!disagree) return first;
  return saw_unknown ? Layout::Unknown : Layout::Mixed;
}

std::string layout_guide() {
  return
    "CSV Input Format Guide\n"
    "\n"
    "Three row layouts are supported. All rows of one input must use the same one.\n"
    "\n"
    "FORMAT 1: Single column with a uniform time span\n"
    "  Requires a window in seconds from the caller (--time-in-seconds).\n"
    "    2025-07-26T00:49:16Z\n"
    "    2025-07-26T07:01:03Z\n"
    "    1753490956\n"
    "\n"
    "FORMAT 2: Timestamp and time span in seconds (0 < span <= 3600)\n"
    "    2025-07-26T00:49:16Z,5\n"
    "    2025-07-26T07:01:03Z,10\n"
    "    1753490956,2\n"
    "\n"
    "FORMAT 3: Start and end timestamps (at most 3600 seconds apart)\n"
    "    2025-07-26T00:49:16Z,2025-07-26T00:49:21Z\n"
    "    1753490956,1753490966\n"
    "\n"
    "Notes:\n"
    "  - Lines starting with # and empty lines are ignored\n"
    "  - Quoted fields are supported: \"2025-07-26 00:49:16\",\"5\"\n"
    "  - Spans are centered on the timestamp in formats 1 and 2\n"
    "  - Timestamps without Z or an offset are read as UTC\n";
}

}
