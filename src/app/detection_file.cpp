#include <epsbar/app/detection_file.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <stdexcept>

namespace epsbar::app {

namespace {

std::vector<std::string_view> split_tabs(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto tab = line.find('\t', start);
    if (tab == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return fields;
}

std::optional<float> to_float(std::string_view field) {
  try {
    const std::string s(field);
    std::size_t used = 0;
    const float v = std::stof(s, &used);
    if (used != s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace

std::optional<core::TextDetection> parse_detection_line(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  const auto fields = split_tabs(line);
  if (fields.size() != 5 && fields.size() != 6) return std::nullopt;
  if (fields[0].empty()) return std::nullopt;

  std::array<float, 4> coords{};
  for (std::size_t i = 0; i < coords.size(); ++i) {
    auto v = to_float(fields[i + 1]);
    if (!v) return std::nullopt;
    coords[i] = *v;
  }
  if (coords[2] < coords[0] || coords[3] < coords[1]) return std::nullopt;

  core::TextDetection d;
  d.text = std::string(fields[0]);
  d.box = {coords[0], coords[1], coords[2], coords[3]};
  d.ocr_confidence = 1.f;
  if (fields.size() == 6) {
    auto conf = to_float(fields[5]);
    if (!conf || *conf < 0.f || *conf > 1.f) return std::nullopt;
    d.ocr_confidence = *conf;
  }
  return d;
}

std::expected<std::vector<core::TextDetection>, core::ExtractError>
load_detections(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(core::ExtractError::LoadFailed);
  }

  std::vector<core::TextDetection> out;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (line.empty() || line == "\r" || line[0] == '#') continue;
    if (auto d = parse_detection_line(line)) {
      out.push_back(std::move(*d));
    } else {
      spdlog::warn("{}:{}: skipping malformed detection", path, line_no);
    }
  }
  return out;
}

}  // namespace epsbar::app
