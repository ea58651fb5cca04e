#pragma once

#include <epsbar/core/error.hpp>
#include <epsbar/core/report_record.hpp>
#include <epsbar/report/report_table.hpp>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace epsbar::app {

/// Shortest text that reads back as \p value, always with a decimal part ("28.0", "27.85").
[[nodiscard]] std::string format_value(double value);

/// Wide table: "Report_Date,Q1'14,Q2'14,..." then one row per report, oldest
/// first. Estimates carry \p estimate_marker as suffix; missing quarters are empty.
void write_estimates_csv(const report::ReportTable& table,
                         std::ostream& out,
                         std::string_view estimate_marker = "*");

/// "Report_Date,Confidence" with one decimal.
void write_confidence_csv(const report::ReportTable& table, std::ostream& out);

/// "<dir>/<stem>_confidence.csv" next to the estimates table.
[[nodiscard]] std::filesystem::path confidence_path_for(
    const std::filesystem::path& estimates_path);

/// Write both tables. ExtractError::LoadFailed if a file cannot be written.
[[nodiscard]] std::expected<void, core::ExtractError> write_table_csv(
    const report::ReportTable& table,
    const std::filesystem::path& estimates_path,
    std::string_view estimate_marker = "*");

/// Read back tables written by write_table_csv so a run can extend them.
/// The confidence table is optional (confidence 0 when absent).
/// ExtractError::LoadFailed if the estimates table cannot be opened,
/// ExtractError::ParseError on a malformed header, date or value.
[[nodiscard]] std::expected<std::vector<core::ReportRecord>, core::ExtractError>
read_table_csv(const std::filesystem::path& estimates_path,
               std::string_view estimate_marker = "*");

}  // namespace epsbar::app
