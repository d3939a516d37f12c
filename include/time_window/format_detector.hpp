#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "time_window/token_csv_fsm.hpp"

namespace tw {

enum class Layout {
  SingleColumnUniform,    // timestamp            (+ caller window)
  TimestampPlusDuration,  // timestamp,seconds
  StartAndEnd,            // start,end
  Mixed,
  Unknown
};

std::string_view to_string(Layout l) noexcept;

// One pre-trimmed, non-comment input row and its 1-based source line.
struct TabularRow {
  std::size_t row_number = 0;
  std::string raw_text;
};

// Classifies a batch from its leading rows. Column 2 of a two-column row is
// only shape-checked here; whether it really is a timestamp is left to the
// row parser.
class FormatDetector {
public:
  struct Config {
    std::size_t sample_rows = 3;
    std::int64_t max_duration_seconds = 3600;
    CsvConfig csv;
  };

  FormatDetector();
  explicit FormatDetector(Config cfg);

  // Candidate layout of a single row (never Mixed).
  Layout classify_line(std::string_view line) const;

  // Layout of the batch, from at most `sample_rows` leading rows.
  Layout detect(const std::vector<TabularRow>& rows) const;

  const Config& config() const noexcept { return cfg_; }

private:
  Config cfg_;
};

// Guide shown when a batch is rejected as Mixed or Unknown.
std::string layout_guide();

}
