#include <epsbar/app/table_csv.hpp>
#include <epsbar/app/report_date.hpp>
#include <epsbar/extraction/numeric_parser.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <ostream>

namespace epsbar::app {

namespace {

constexpr std::string_view kDateColumn = "Report_Date";
constexpr std::string_view kConfidenceColumn = "Confidence";

std::vector<std::string_view> split_commas(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  return fields;
}

std::string_view strip_cr(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

std::optional<core::QuarterEntry> parse_cell(std::string_view cell,
                                             std::string_view marker) {
  bool estimate = false;
  if (!marker.empty() && cell.size() > marker.size() && cell.ends_with(marker)) {
    cell.remove_suffix(marker.size());
    estimate = true;
  }
  const auto value = extraction::parse_numeric(cell);
  if (!value) return std::nullopt;
  return core::QuarterEntry{*value, estimate};
}

// Confidence per date from the companion table; empty if it does not exist.
std::expected<std::map<std::chrono::year_month_day, double>, core::ExtractError>
read_confidences(const std::filesystem::path& path) {
  std::map<std::chrono::year_month_day, double> out;
  std::ifstream f(path);
  if (!f) return out;

  std::string line;
  if (!std::getline(f, line)) return out;
  while (std::getline(f, line)) {
    const auto fields = split_commas(strip_cr(line));
    if (fields.size() == 1 && fields[0].empty()) continue;
    if (fields.size() != 2) return std::unexpected(core::ExtractError::ParseError);
    const auto date = parse_date(fields[0]);
    const auto value = extraction::parse_numeric(fields[1]);
    if (!date || !value) return std::unexpected(core::ExtractError::ParseError);
    out[*date] = *value;
  }
  return out;
}

}  // namespace

std::string format_value(double value) {
  std::string s = fmt::format("{}", value);
  if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
  return s;
}

void write_estimates_csv(const report::ReportTable& table,
                         std::ostream& out,
                         std::string_view estimate_marker) {
  const auto columns = table.quarter_columns();
  out << kDateColumn;
  for (const auto& id : columns) {
    out << ',' << id.to_key();
  }
  out << '\n';

  for (const auto& record : table.records()) {
    out << format_date(record.report_date);
    for (const auto& id : columns) {
      out << ',';
      auto it = record.quarters.find(id);
      if (it == record.quarters.end()) continue;
      out << format_value(it->second.value);
      if (it->second.is_estimate) out << estimate_marker;
    }
    out << '\n';
  }
}

void write_confidence_csv(const report::ReportTable& table, std::ostream& out) {
  out << kDateColumn << ',' << kConfidenceColumn << '\n';
  for (const auto& record : table.records()) {
    out << format_date(record.report_date) << ','
        << fmt::format("{:.1f}", record.confidence) << '\n';
  }
}

std::filesystem::path confidence_path_for(const std::filesystem::path& estimates_path) {
  auto out = estimates_path;
  out.replace_filename(estimates_path.stem().string() + "_confidence.csv");
  return out;
}

std::expected<void, core::ExtractError> write_table_csv(
    const report::ReportTable& table,
    const std::filesystem::path& estimates_path,
    std::string_view estimate_marker) {
  std::ofstream estimates(estimates_path);
  if (!estimates) {
    spdlog::error("cannot write {}", estimates_path.string());
    return std::unexpected(core::ExtractError::LoadFailed);
  }
  write_estimates_csv(table, estimates, estimate_marker);

  const auto conf_path = confidence_path_for(estimates_path);
  std::ofstream confidence(conf_path);
  if (!confidence) {
    spdlog::error("cannot write {}", conf_path.string());
    return std::unexpected(core::ExtractError::LoadFailed);
  }
  write_confidence_csv(table, confidence);

  if (!estimates.flush() || !confidence.flush()) {
    return std::unexpected(core::ExtractError::LoadFailed);
  }
  spdlog::info("Results saved to {} and {}", estimates_path.string(), conf_path.string());
  return {};
}

std::expected<std::vector<core::ReportRecord>, core::ExtractError>
read_table_csv(const std::filesystem::path& estimates_path,
               std::string_view estimate_marker) {
  std::ifstream f(estimates_path);
  if (!f) {
    return std::unexpected(core::ExtractError::LoadFailed);
  }

  std::string line;
  if (!std::getline(f, line)) return std::vector<core::ReportRecord>{};
  const auto header = split_commas(strip_cr(line));
  if (header.empty() || header[0] != kDateColumn) {
    return std::unexpected(core::ExtractError::ParseError);
  }
  std::vector<core::QuarterId> columns;
  for (std::size_t i = 1; i < header.size(); ++i) {
    auto id = core::parse_quarter_key(header[i]);
    if (!id) return std::unexpected(core::ExtractError::ParseError);
    columns.push_back(*id);
  }

  auto confidences = read_confidences(confidence_path_for(estimates_path));
  if (!confidences) return std::unexpected(confidences.error());

  std::vector<core::ReportRecord> records;
  while (std::getline(f, line)) {
    const auto fields = split_commas(strip_cr(line));
    if (fields.size() == 1 && fields[0].empty()) continue;
    if (fields.size() != columns.size() + 1) {
      return std::unexpected(core::ExtractError::ParseError);
    }
    const auto date = parse_date(fields[0]);
    if (!date) return std::unexpected(core::ExtractError::ParseError);

    core::ReportRecord record;
    record.report_date = *date;
    for (std::size_t i = 0; i < columns.size(); ++i) {
      const std::string_view cell = fields[i + 1];
      if (cell.empty()) continue;
      auto entry = parse_cell(cell, estimate_marker);
      if (!entry) return std::unexpected(core::ExtractError::ParseError);
      record.quarters.emplace(columns[i], *entry);
    }
    if (auto it = confidences->find(*date); it != confidences->end()) {
      record.confidence = it->second;
    }
    records.push_back(std::move(record));
  }
  return records;
}

}  // namespace epsbar::app
