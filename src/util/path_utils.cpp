#include "time_window/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace tw {

static bool has_csv_extension(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".csv";
}

InputKind detect_input_kind(std::string_view path, const std::vector<TabularRow>& rows) {
  if (has_csv_extension(path)) return InputKind::Tabular;
  if (rows.empty()) return InputKind::PlainText;

  const std::size_t n = std::min<std::size_t>(3, rows.size());
  std::size_t cols0 = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const auto& t = rows[i].raw_text;
    std::size_t cols = static_cast<std::size_t>(std::count(t.begin(), t.end(), ',')) + 1;
    if (i == 0) cols0 = cols;
    if (cols < 2 || cols != cols0) return InputKind::PlainText;
  }
  return InputKind::Tabular;
}

}
