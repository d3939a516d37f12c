#include "time_window/row_parser.hpp"
#include "time_window/parse_policy.hpp"
#include "time_window/time_parser.hpp"
#include <string>
#include <utility>

namespace tw {

namespace {

std::string row_prefix(std::size_t n) { return "Row " + std::to_string(n) + ": "; }

const char* layout_label(Layout l) {
  switch (l) {
    case Layout::SingleColumnUniform:   return "Format 1";
    case Layout::TimestampPlusDuration: return "Format 2";
    case Layout::StartAndEnd:           return "Format 3";
    case Layout::Mixed:                 return "mixed input";
    case Layout::Unknown:               return "unknown input";
  }
  return "unknown input";
}

std::size_t expected_columns(Layout l) { return l == Layout::SingleColumnUniform ? 1 : 2; }

// Reject every row of the batch with one error.
BatchResult reject(BatchResult r, ErrorCode code, std::string message) {
  r.summary.error_count = r.summary.total_rows;
  r.batch_error = Error{code, std::move(message)};
  return r;
}

}

std::vector<TimeRange> BatchResult::ranges() const {
  std::vector<TimeRange> out;
  out.reserve(summary.valid_entries);
  for (const auto& row : rows)
    if (row.range) out.push_back(*row.range);
  return out;
}

RowParser::RowParser() : RowParser(Config{}) {}
RowParser::RowParser(Config cfg) : cfg_(std::move(cfg)) {}

BatchResult RowParser::parse(const std::vector<TabularRow>& rows) const {
  FormatDetector::Config dcfg;
  dcfg.sample_rows = cfg_.sample_rows;
  dcfg.max_duration_seconds = cfg_.max_duration_seconds;
  dcfg.csv = cfg_.csv;
  return parse_as(FormatDetector(dcfg).detect(rows), rows);
}

BatchResult RowParser::parse_as(Layout layout, const std::vector<TabularRow>& rows) const {
  BatchResult r;
  r.layout = layout;
  r.summary.total_rows = rows.size();

  if (rows.empty())
    return reject(std::move(r), ErrorCode::NoValidRows, "No valid CSV data found");
  if (layout == Layout::Unknown)
    return reject(std::move(r), ErrorCode::UnknownLayout,
                  "Unable to detect CSV format. See the format guide for supported layouts.");
  if (layout == Layout::Mixed)
    return reject(std::move(r), ErrorCode::MixedLayout,
                  "Mixed or unsupported CSV format detected");

  if (layout == Layout::SingleColumnUniform) {
    if (!cfg_.uniform_window)
      return reject(std::move(r), ErrorCode::MissingWindow,
                    "A uniform time window is required for single-column input");
    const std::int64_t w = *cfg_.uniform_window;
    if (w < 1 || w > cfg_.max_duration_seconds)
      return reject(std::move(r), ErrorCode::DurationOutOfBounds,
                    "Invalid time span: " + std::to_string(w) + ". Must be between 1 and "
                    + std::to_string(cfg_.max_duration_seconds) + " seconds.");
    r.summary.uniform_window = w;
  }

  CsvFsm csv(cfg_.csv);
  r.rows.reserve(rows.size());
  for (const auto& row : rows) {
    r.rows.push_back(parse_row(csv, layout, row));
    if (r.rows.back().ok()) ++r.summary.valid_entries;
    else ++r.summary.error_count;
  }

  if (r.summary.valid_entries == 0)
    r.batch_error = Error{ErrorCode::NoValidRows, "No valid timestamp entries found"};
  return r;
}

RowOutcome RowParser::parse_row(CsvFsm& csv, Layout layout, const TabularRow& row) const {
  RowOutcome out;
  out.row_number = row.row_number;
  out.raw_text = row.raw_text;

  auto row_fail = [&](const Error& e) {
    out.error = Error{e.code, row_prefix(row.row_number) + e.message};
    return out;
  };

  Error e;
  RecordView rv;
  if (!csv.feed(row.raw_text, rv, &e)) return row_fail(e);

  const std::size_t want = expected_columns(layout);
  if (rv.size() != want) {
    return row_fail(Error{ErrorCode::ColumnCountMismatch,
                          "Expected " + std::to_string(want) + (want == 1 ? " column" : " columns")
                          + " for " + layout_label(layout) + ", got "
                          + std::to_string(rv.size())});
  }

  auto first = parse_time(rv.at(0), &e);
  if (!first) return row_fail(e);

  switch (layout) {
    case Layout::SingleColumnUniform: {
      const std::int64_t w = *cfg_.uniform_window;
      auto range = centered_window(*first, w, &e);
      if (!range) return row_fail(e);
      out.range = *range;
      out.description = first->original_input + " ±" + std::to_string(w / 2) + "s";
      break;
    }
    case Layout::TimestampPlusDuration: {
      DurationPolicy dp;
      dp.max_seconds = cfg_.max_duration_seconds;
      auto span = dp.parse_seconds(rv.at(1), &e);
      if (!span) return row_fail(e);
      auto range = centered_window(*first, *span, &e);
      if (!range) return row_fail(e);
      out.range = *range;
      out.description = first->original_input + " ±" + std::to_string(*span / 2) + "s";
      break;
    }
    case Layout::StartAndEnd: {
      auto second = parse_time(rv.at(1), &e);
      if (!second) return row_fail(e);
      auto range = explicit_range(*first, *second, cfg_.range_bounds, &e);
      if (!range) return row_fail(e);
      out.range = *range;
      out.description = first->original_input + " → " + second->original_input + " ("
                        + std::to_string(range->duration_seconds) + "s)";
      break;
    }
    case Layout::Mixed:
    case Layout::Unknown:
      return row_fail(Error{ErrorCode::UnknownLayout, "no row layout to parse against"});
  }
  return out;
}

std::vector<TabularRow> collect_rows(std::string_view content) {
  std::vector<TabularRow> rows;
  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos <= content.size()) {
    std::size_t nl = content.find('\n', pos);
    if (nl == std::string_view::npos) nl = content.size();
    std::string_view line = trim(content.substr(pos, nl - pos));
    ++line_no;
    if (!line.empty() && line.front() != '#')
      rows.push_back(TabularRow{line_no, std::string(line)});
    pos = nl + 1;
  }
  return rows;
}

std::vector<std::string> summarize_errors(const BatchResult& r, std::size_t max_shown) {
  std::vector<std::string> out;
  std::size_t total = 0;
  if (r.batch_error && r.batch_error.code != ErrorCode::NoValidRows) {
    out.push_back(r.batch_error.message);
    return out;
  }
  for (const auto& row : r.rows) {
    if (row.ok()) continue;
    if (total++ < max_shown) out.push_back(row.error.message);
  }
  if (total > max_shown)
    out.push_back("... and " + std::to_string(total - max_shown) + " more errors");
  return out;
}

}
