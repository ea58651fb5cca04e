#pragma once

#include <optional>
#include <string_view>

namespace epsbar::extraction {

/// Parse a figure printed above a bar: "27.85", "$1.05", "-0.40", "1,234.5".
/// Surrounding whitespace, one leading '$' and thousands separators are
/// accepted; anything else makes the whole text non-numeric.
[[nodiscard]] std::optional<double> parse_numeric(std::string_view text);

}  // namespace epsbar::extraction
