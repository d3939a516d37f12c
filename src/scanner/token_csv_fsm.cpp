#include "time_window/token_csv_fsm.hpp"
#include "time_window/time_parser.hpp"
#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

namespace tw {

struct CsvFsm::Impl {
  CsvConfig cfg;
  std::string buf;                                   // unescaped field bytes
  std::vector<std::pair<std::size_t, std::size_t>> spans;
  std::vector<std::string_view> fields;

  // Returns nullptr on success, else a description of the fault.
  const char* parse_line(std::string_view line) {
    buf.clear();
    spans.clear();
    fields.clear();
    buf.reserve(line.size());

    enum class Mode { FieldStart, Unquoted, Quoted, QuoteSeen } mode = Mode::FieldStart;
    std::size_t start = 0;
    std::size_t kept = 0;  // end of the last quoted run; tail trim stops here
    auto emit = [&]() {
      std::size_t end = buf.size();
      if (cfg.trim_fields) {
        const std::size_t floor = std::max(start, kept);
        while (end > floor && is_blank(buf[end - 1])) --end;
      }
      spans.emplace_back(start, end - start);
      buf.resize(end);
      start = kept = buf.size();
    };

    for (char c : line) {
      switch (mode) {
        case Mode::FieldStart:
          if (c == cfg.delimiter) { emit(); }
          else if (c == cfg.quote) { mode = Mode::Quoted; }
          else if (cfg.trim_fields && is_blank(c)) { /* leading blank */ }
          else { buf.push_back(c); mode = Mode::Unquoted; }
          break;
        case Mode::Unquoted:
          if (c == cfg.delimiter) { emit(); mode = Mode::FieldStart; }
          else if (c == cfg.quote) { mode = Mode::Quoted; }
          else buf.push_back(c);
          break;
        case Mode::Quoted:
          if (c == cfg.quote) { kept = buf.size(); mode = Mode::QuoteSeen; }
          else buf.push_back(c);
          break;
        case Mode::QuoteSeen:
          if (c == cfg.quote) { buf.push_back(c); mode = Mode::Quoted; }       // "" escape
          else if (c == cfg.delimiter) { emit(); mode = Mode::FieldStart; }
          else { buf.push_back(c); mode = Mode::Unquoted; }                   // field goes on
          break;
      }
    }

    if (mode == Mode::Quoted) return "unterminated quoted field";
    emit();

    // Views are taken only once `buf` has stopped growing.
    fields.reserve(spans.size());
    for (const auto& sp : spans) fields.emplace_back(buf.data() + sp.first, sp.second);
    return nullptr;
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg) : p_(new Impl{cfg, {}, {}, {}}) {}
CsvFsm::~CsvFsm() { delete p_; }

bool CsvFsm::feed(std::string_view line, RecordView& out, Error* err) {
  if (const char* why = p_->parse_line(line)) {
    err_ = std::string("CSV parse error (") + why + ")";
    out = RecordView{};
    return fail(err, ErrorCode::MalformedRow, err_);
  }
  err_.clear();
  out = RecordView(&p_->fields);
  ++rows_;
  return true;
}

}
