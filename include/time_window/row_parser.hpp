#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "time_window/errors.hpp"
#include "time_window/format_detector.hpp"
#include "time_window/time_range.hpp"
#include "time_window/token_csv_fsm.hpp"

namespace tw {

// Result for one input row: either `range` or `error` is set.
struct RowOutcome {
  std::size_t row_number = 0;
  std::string raw_text;
  std::optional<TimeRange> range;
  Error error;
  std::string description;  // "<ts> ±2s" or "<start> → <end> (5s)"

  bool ok() const noexcept { return range.has_value(); }
};

struct BatchSummary {
  std::size_t total_rows = 0;
  std::size_t valid_entries = 0;
  std::size_t error_count = 0;
  std::optional<std::int64_t> uniform_window;
};

struct BatchResult {
  Layout layout = Layout::Unknown;
  std::vector<RowOutcome> rows;  // in input order
  BatchSummary summary;
  Error batch_error;             // set when the whole batch is rejected

  bool ok() const noexcept { return !batch_error; }
  std::vector<TimeRange> ranges() const;
};

// Parses a batch of rows against the layout detected from its first rows.
// Row failures are recorded and parsing continues; the batch itself fails
// on Mixed/Unknown layout, a missing uniform window, or zero valid rows.
class RowParser {
public:
  struct Config {
    std::optional<std::int64_t> uniform_window;  // required for single-column input
    RangeBounds range_bounds{1, 3600};
    std::int64_t max_duration_seconds = 3600;
    std::size_t sample_rows = 3;
    CsvConfig csv;
  };

  RowParser();
  explicit RowParser(Config cfg);

  BatchResult parse(const std::vector<TabularRow>& rows) const;

  // Parse a batch whose layout the caller already knows (e.g. plain-text
  // input, which is always single-column).
  BatchResult parse_as(Layout layout, const std::vector<TabularRow>& rows) const;

  const Config& config() const noexcept { return cfg_; }

private:
  RowOutcome parse_row(CsvFsm& csv, Layout layout, const TabularRow& row) const;

  Config cfg_;
};

// Split raw text into rows: CR stripped, trimmed, blank and '#' lines dropped,
// each row numbered by its 1-based source line.
std::vector<TabularRow> collect_rows(std::string_view content);

// First `max_shown` row errors verbatim, then "... and N more errors".
std::vector<std::string> summarize_errors(const BatchResult& r, std::size_t max_shown = 3);

}
