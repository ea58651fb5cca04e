#include <epsbar/app/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace epsbar::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T, typename Parse>
void assign_number(T& target, const std::string& key, const std::string& value, Parse parse) {
  try {
    std::size_t used = 0;
    const auto parsed = parse(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    target = static_cast<T>(parsed);
  } catch (const std::invalid_argument&) {
    spdlog::warn("config: ignoring non-numeric value for {}: '{}'", key, value);
  } catch (const std::out_of_range&) {
    spdlog::warn("config: ignoring out-of-range value for {}: '{}'", key, value);
  }
}

void assign_float(float& target, const std::string& key, const std::string& value) {
  assign_number(target, key, value,
                [](const std::string& v, std::size_t* used) { return std::stof(v, used); });
}

void assign_double(double& target, const std::string& key, const std::string& value) {
  assign_number(target, key, value,
                [](const std::string& v, std::size_t* used) { return std::stod(v, used); });
}

void assign_int(int& target, const std::string& key, const std::string& value) {
  assign_number(target, key, value,
                [](const std::string& v, std::size_t* used) { return std::stoi(v, used); });
}

}  // namespace

ExtractionConfig default_config() {
  ExtractionConfig c;
  c.matcher = extraction::MatcherConfig{};
  c.classifier = vision::ClassifierConfig{};
  c.scorer = report::ScorerConfig{};
  c.estimate_marker = "*";
  c.num_workers = 0;
  c.log_level = "info";
  return c;
}

ExtractionConfig load_config(const std::string& path) {
  ExtractionConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot open {}, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "bottom_fraction") assign_float(c.matcher.bottom_fraction, key, value);
    else if (key == "x_tolerance") assign_float(c.matcher.x_tolerance, key, value);
    else if (key == "y_tolerance") assign_float(c.matcher.y_tolerance, key, value);
    else if (key == "x_weight") assign_float(c.matcher.x_weight, key, value);
    else if (key == "y_weight") assign_float(c.matcher.y_weight, key, value);
    else if (key == "year_cutoff") assign_double(c.matcher.year_cutoff, key, value);
    else if (key == "adaptive_block_size") assign_int(c.classifier.adaptive_block_size, key, value);
    else if (key == "adaptive_c") assign_double(c.classifier.adaptive_c, key, value);
    else if (key == "closing_kernel_size") assign_int(c.classifier.closing_kernel_size, key, value);
    else if (key == "relative_tolerance") assign_double(c.scorer.relative_tolerance, key, value);
    else if (key == "bar_weight") assign_double(c.scorer.bar_weight, key, value);
    else if (key == "estimate_marker") c.estimate_marker = value;
    else if (key == "num_workers") {
      int workers = 0;
      assign_int(workers, key, value);
      if (workers >= 0) c.num_workers = static_cast<std::size_t>(workers);
    }
    else if (key == "log_level") c.log_level = value;
    else spdlog::debug("config: unknown key {}", key);
  }
  return c;
}

std::expected<void, core::ExtractError> validate_config(const ExtractionConfig& c) {
  const auto invalid = [](std::string_view what) {
    spdlog::error("config: invalid {}", what);
    return std::unexpected(core::ExtractError::InvalidConfig);
  };

  if (!(c.matcher.bottom_fraction > 0.f && c.matcher.bottom_fraction <= 1.f)) {
    return invalid("bottom_fraction (expected 0 < f <= 1)");
  }
  if (c.matcher.x_tolerance < 0.f || c.matcher.y_tolerance < 0.f) {
    return invalid("tolerance (expected >= 0)");
  }
  if (c.classifier.adaptive_block_size < 3 || c.classifier.adaptive_block_size % 2 == 0) {
    return invalid("adaptive_block_size (expected odd >= 3)");
  }
  if (c.classifier.closing_kernel_size < 1) {
    return invalid("closing_kernel_size (expected >= 1)");
  }
  if (c.scorer.relative_tolerance < 0.0) {
    return invalid("relative_tolerance (expected >= 0)");
  }
  if (c.scorer.bar_weight < 0.0 || c.scorer.bar_weight > 1.0) {
    return invalid("bar_weight (expected 0..1)");
  }
  return {};
}

}  // namespace epsbar::app
