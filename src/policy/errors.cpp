#include "time_window/errors.hpp"
#include <utility>

namespace tw {

std::string_view to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::None:                return "None";
    case ErrorCode::EmptyInput:          return "EmptyInput";
    case ErrorCode::UnrecognizedFormat:  return "UnrecognizedFormat";
    case ErrorCode::SemanticMismatch:    return "SemanticMismatch";
    case ErrorCode::RangeTooShort:       return "RangeTooShort";
    case ErrorCode::RangeTooLong:        return "RangeTooLong";
    case ErrorCode::ColumnCountMismatch: return "ColumnCountMismatch";
    case ErrorCode::DurationOutOfBounds: return "DurationOutOfBounds";
    case ErrorCode::UnknownLayout:       return "UnknownLayout";
    case ErrorCode::MixedLayout:         return "MixedLayout";
    case ErrorCode::MalformedRow:        return "MalformedRow";
    case ErrorCode::MissingWindow:       return "MissingWindow";
    case ErrorCode::NoValidRows:         return "NoValidRows";
  }
  return "Unknown";
}

bool fail(Error* out, ErrorCode code, std::string message) {
  if (out) { out->code = code; out->message = std::move(message); }
  return false;
}

}
