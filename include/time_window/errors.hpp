#pragma once
#include <string>
#include <string_view>

namespace tw {

enum class ErrorCode {
  None,
  EmptyInput,
  UnrecognizedFormat,
  SemanticMismatch,
  RangeTooShort,
  RangeTooLong,
  ColumnCountMismatch,
  DurationOutOfBounds,
  UnknownLayout,
  MixedLayout,
  MalformedRow,   // unbalanced quoting in a row
  MissingWindow,  // single-column batch without a uniform window
  NoValidRows
};

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const noexcept { return code != ErrorCode::None; }
};

// Stable identifier, e.g. "SemanticMismatch".
std::string_view to_string(ErrorCode c) noexcept;

// Fill `*out` if the caller asked for it. Always returns false so that
// fallible functions can `return fail(err, ...)` from a bool context.
bool fail(Error* out, ErrorCode code, std::string message);

}
