#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace epsbar::app {

/// Report date encoded in a chart file name: "20161209-6.png" -> 2016-12-09.
/// The stem must start with eight digits forming a valid calendar date.
[[nodiscard]] std::optional<std::chrono::year_month_day> report_date_from_filename(
    std::string_view filename);

/// "YYYY-MM-DD".
[[nodiscard]] std::string format_date(std::chrono::year_month_day date);
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_date(std::string_view text);

}  // namespace epsbar::app
