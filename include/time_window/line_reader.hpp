#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "time_window/format_detector.hpp"

namespace tw {

// Reads a text file in fixed-size chunks and hands out trimmed lines together
// with their 1-based line numbers.
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;  // 64 KiB
    std::size_t max_record_bytes = 64 * 1024;  // guard per line
    bool        strip_cr         = true;       // trim trailing '\r' (CRLF)
    bool        drop_oversize    = true;       // drop lines exceeding guard, else keep their first max_record_bytes
    bool        skip_blank       = true;
    bool        skip_comments    = true;
    char        comment_prefix   = '#';
  };

  explicit LineReader(std::string path);
  LineReader(std::string path, Config cfg);
  ~LineReader();
  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  using LineCallback = std::function<void(std::size_t line_no, std::string_view line)>;

  // False if the file could not be opened or read; see last_error().
  bool for_each_line(const LineCallback& cb);

  // Convenience: every surviving line as a TabularRow.
  bool read_rows(std::vector<TabularRow>& out);

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_dropped() const noexcept;  // oversize lines dropped, not truncated ones

private:
  struct Impl; Impl* p_;
};

}
