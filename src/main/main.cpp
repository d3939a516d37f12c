#include "time_window/errors.hpp"
#include "time_window/format_detector.hpp"
#include "time_window/line_reader.hpp"
#include "time_window/path_utils.hpp"
#include "time_window/row_parser.hpp"
#include "time_window/time_parser.hpp"
#include "time_window/time_range.hpp"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string file_in;
  std::string time_from;
  std::string time_to;
  std::string time_at;
  std::optional<std::int64_t> window;  // --time-in-seconds
  std::int64_t max_span = 3600;        // 0 = no ceiling
  std::size_t show_errors = 3;
  bool format_guide = false;
  std::string bad_arg;
};

void usage(std::ostream& o) {
  o <<
    "Usage: time-window --file-in <FILE> [--time-in-seconds <N>] [--show-errors=N]\n"
    "       time-window --time-from <TIME> --time-to <TIME> [--max-span=N]\n"
    "       time-window --time-at <TIME> --time-in-seconds <N>\n"
    "       time-window --format-guide\n"
    "\n"
    "TIME accepts ISO 8601 (Z or +HH:MM), Unix seconds or milliseconds,\n"
    "YYYY-MM-DD HH:MM[:SS], YYYY/MM/DD HH:MM[:SS] and MM/DD/YYYY HH:MM[:SS].\n"
    "--max-span=0 removes the upper bound on --time-from/--time-to ranges.\n";
}

bool to_int(const std::string& s, std::int64_t& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // Accept both "--flag value" and "--flag=value".
    auto eat = [&](const char* name, std::string* out) {
      const std::string flag(name);
      if (a == flag && i + 1 < argc) { *out = argv[++i]; return true; }
      if (a.rfind(flag + "=", 0) == 0) { *out = a.substr(flag.size() + 1); return true; }
      return false;
    };
    std::string v;
    if (eat("--file-in", &c.file_in)) continue;
    if (eat("--time-from", &c.time_from)) continue;
    if (eat("--time-to", &c.time_to)) continue;
    if (eat("--time-at", &c.time_at)) continue;
    if (eat("--time-in-seconds", &v)) {
      std::int64_t w = 0;
      if (!to_int(v, w)) { c.bad_arg = a; break; }
      c.window = w;
      continue;
    }
    if (eat("--max-span", &v)) {
      if (!to_int(v, c.max_span) || c.max_span < 0) { c.bad_arg = a; break; }
      continue;
    }
    if (eat("--show-errors", &v)) {
      std::int64_t n = 0;
      if (!to_int(v, n) || n < 0) { c.bad_arg = a; break; }
      c.show_errors = static_cast<std::size_t>(n);
      continue;
    }
    if (a == "--format-guide") { c.format_guide = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    c.bad_arg = a;
    break;
  }
  return c;
}

void print_range(const tw::TimeRange& r, const std::string& description) {
  std::cout << r.start_epoch_seconds << ' ' << r.end_epoch_seconds << ' '
            << r.duration_seconds;
  if (!description.empty()) std::cout << "  " << description;
  std::cout << '\n';
}

std::optional<tw::ParsedTime> parse_arg(const char* flag, const std::string& s) {
  tw::Error err;
  auto t = tw::parse_time(s, &err);
  if (!t) std::cerr << "[range] " << flag << ": " << err.message << "\n";
  return t;
}

int run_file(const Cli& cli) {
  tw::LineReader reader(cli.file_in);
  std::vector<tw::TabularRow> rows;
  if (!reader.read_rows(rows)) {
    std::cerr << "[input] failed to read " << cli.file_in << ": "
              << std::strerror(reader.last_error()) << "\n";
    return 2;
  }
  if (reader.lines_dropped() > 0)
    std::cerr << "[input] dropped " << reader.lines_dropped() << " oversize line(s)\n";

  tw::RowParser::Config cfg;
  cfg.uniform_window = cli.window;
  tw::RowParser parser(cfg);

  const bool tabular = tw::detect_input_kind(cli.file_in, rows) == tw::InputKind::Tabular;
  tw::BatchResult result = tabular ? parser.parse(rows)
                                   : parser.parse_as(tw::Layout::SingleColumnUniform, rows);

  std::cerr << "[csv] " << cli.file_in << ": layout=" << tw::to_string(result.layout)
            << " rows=" << result.summary.total_rows
            << " valid=" << result.summary.valid_entries
            << " errors=" << result.summary.error_count << "\n";

  for (const auto& line : tw::summarize_errors(result, cli.show_errors))
    std::cerr << "[csv]    " << line << "\n";

  if (result.batch_error.code == tw::ErrorCode::MixedLayout
      || result.batch_error.code == tw::ErrorCode::UnknownLayout) {
    std::cerr << "\n" << tw::layout_guide();
  }
  if (!result.ok()) {
    std::cerr << "[csv] rejected (" << tw::to_string(result.batch_error.code) << "): "
              << result.batch_error.message << "\n";
    return 1;
  }

  for (const auto& row : result.rows)
    if (row.range) print_range(*row.range, row.description);
  return 0;
}

int run_range(const Cli& cli) {
  auto start = parse_arg("--time-from", cli.time_from);
  auto end = parse_arg("--time-to", cli.time_to);
  if (!start || !end) return 1;

  tw::RangeBounds bounds;
  if (cli.max_span > 0) bounds.max_seconds = cli.max_span;
  tw::Error err;
  auto r = tw::explicit_range(*start, *end, bounds, &err);
  if (!r) {
    std::cerr << "[range] " << tw::to_string(err.code) << ": " << err.message << "\n";
    return 1;
  }
  print_range(*r, cli.time_from + " → " + cli.time_to);
  return 0;
}

int run_center(const Cli& cli) {
  if (!cli.window) {
    std::cerr << "[range] --time-in-seconds is required with --time-at\n";
    return 2;
  }
  auto center = parse_arg("--time-at", cli.time_at);
  if (!center) return 1;
  tw::Error err;
  auto r = tw::centered_window(*center, *cli.window, &err);
  if (!r) {
    std::cerr << "[range] " << tw::to_string(err.code) << ": " << err.message << "\n";
    return 1;
  }
  std::cerr << "[range] " << cli.time_at << " parsed as " << tw::to_string(center->format) << "\n";
  print_range(*r, cli.time_at + " ±" + std::to_string(*cli.window / 2) + "s");
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli = parse_cli(argc, argv);
  if (!cli.bad_arg.empty()) {
    std::cerr << "Invalid argument: " << cli.bad_arg << "\n";
    usage(std::cerr);
    return 2;
  }
  if (cli.format_guide) { std::cout << tw::layout_guide(); return 0; }

  const bool file_mode = !cli.file_in.empty();
  const bool range_mode = !cli.time_from.empty() || !cli.time_to.empty();
  const bool center_mode = !cli.time_at.empty();
  if (int(file_mode) + int(range_mode) + int(center_mode) != 1) {
    std::cerr << "Exactly one of --file-in, --time-from/--time-to or --time-at is required\n";
    usage(std::cerr);
    return 2;
  }
  if (range_mode && (cli.time_from.empty() || cli.time_to.empty())) {
    std::cerr << "Both --time-from and --time-to are required\n";
    return 2;
  }

  if (file_mode) return run_file(cli);
  if (range_mode) return run_range(cli);
  return run_center(cli);
}
