#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "time_window/errors.hpp"
#include "time_window/record_view.hpp"

namespace tw {

struct CsvConfig {
  char delimiter   = ',';
  char quote       = '"';
  bool trim_fields = true;  // drop blanks around each field (outside quotes)
};

// Single-line CSV tokenizer. A quote anywhere in a field opens a quoted run in
// which delimiters are literal; the next lone quote closes it and the field
// goes on. A doubled quote inside a run is a literal quote. Only an
// unterminated run is malformed.
class CsvFsm {
public:
  explicit CsvFsm(const CsvConfig& cfg = CsvConfig{});
  ~CsvFsm();
  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // Tokenize `line` into `out`. On failure sets error() and, if given, `*err`
  // (MalformedRow).
  bool feed(std::string_view line, RecordView& out, Error* err = nullptr);

  const std::string& error() const { return err_; }
  std::uint64_t rows() const { return rows_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
  std::string err_;
};

}
