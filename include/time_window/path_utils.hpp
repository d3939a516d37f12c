#pragma once
#include <string_view>
#include <vector>

#include "time_window/format_detector.hpp"

namespace tw {

enum class InputKind { Tabular, PlainText };

// Tabular when the path ends in .csv (any case) or the first three rows all
// carry commas with one shared column count above 1; plain text otherwise.
InputKind detect_input_kind(std::string_view path, const std::vector<TabularRow>& rows);

}
