#pragma once

#include <string_view>

namespace epsbar::core {

/// Extraction error codes; used with std::expected for failures that reach the caller.
/// Per-label and per-bar problems are absorbed and never show up here.
enum class ExtractError {
  None = 0,
  InvalidImage,
  LoadFailed,
  InvalidConfig,
  ParseError,
};

[[nodiscard]] std::string_view to_string(ExtractError e) noexcept;

}  // namespace epsbar::core
