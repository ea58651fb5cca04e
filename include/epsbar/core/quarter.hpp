#pragma once

#include <epsbar/core/box.hpp>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace epsbar::core {

/// Fiscal quarter: quarter in 1..4, year as four digits (label "'14" -> 2014).
/// Ordered chronologically by (year, quarter).
struct QuarterId {
  int quarter{1};
  int year{2000};

  /// Canonical key "Q{n}'{yy}", e.g. "Q1'14".
  [[nodiscard]] std::string to_key() const;

  friend bool operator==(const QuarterId&, const QuarterId&) = default;
  friend auto operator<=>(const QuarterId& a, const QuarterId& b) {
    if (auto c = a.year <=> b.year; c != 0) return c;
    return a.quarter <=> b.quarter;
  }
};

/// Parse a canonical key ("Q1'14"; the apostrophe may be missing). nullopt if malformed.
[[nodiscard]] std::optional<QuarterId> parse_quarter_key(std::string_view key);

/// A detection from the bottom band of the chart that reads as a quarter label.
struct QuarterLabel {
  QuarterId id{};
  Box box{};
  std::string source_text;
};

}  // namespace epsbar::core
