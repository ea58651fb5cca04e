#include <epsbar/extraction/quarter_normalizer.hpp>
#include <epsbar/extraction/numeric_parser.hpp>
#include <cctype>
#include <cstddef>

namespace epsbar::extraction {

namespace {

// Longest prefix the template can consume: Q, quarter digit, two year digits.
constexpr std::size_t kTemplateWindow = 4;

std::string_view confusion_class(char c) noexcept {
  if (kQuarterConfusables.find(c) != std::string_view::npos) return kQuarterConfusables;
  if (kOneConfusables.find(c) != std::string_view::npos) return kOneConfusables;
  return {};
}

bool is_digit(char c) noexcept {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// "0.14" is a figure, not a mangled "Q1'4". "Q1.14" is a label read with a dot.
bool is_decimal_figure(std::string_view text) {
  return text.find('.') != std::string_view::npos && parse_numeric(text).has_value();
}

struct TemplateMatch {
  core::QuarterId id;
  int year_digits;
};

/// Q<1-4><year digits>, anchored at the start.
std::optional<TemplateMatch> match_template(std::string_view s) {
  if (s.size() < 3 || s[0] != 'Q') return std::nullopt;
  if (s[1] < '1' || s[1] > '4') return std::nullopt;
  if (!is_digit(s[2])) return std::nullopt;

  int yy = s[2] - '0';
  int digits = 1;
  if (s.size() > 3 && is_digit(s[3])) {
    yy = yy * 10 + (s[3] - '0');
    digits = 2;
  }
  return TemplateMatch{core::QuarterId{s[1] - '0', 2000 + yy}, digits};
}

}  // namespace

std::vector<std::string> expand_confusables(std::string_view text) {
  std::vector<std::string> out{std::string(text)};
  for (std::size_t i = 0; i < text.size(); ++i) {
    const std::string_view cls = confusion_class(text[i]);
    if (cls.empty()) continue;

    const std::size_t base = out.size();
    for (const char alt : cls) {
      if (alt == text[i]) continue;
      for (std::size_t k = 0; k < base; ++k) {
        std::string variant = out[k];
        variant[i] = alt;
        out.push_back(std::move(variant));
      }
    }
  }
  return out;
}

std::string label_skeleton(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c))) out.push_back(c);
  }
  return out;
}

std::optional<core::QuarterId> normalize_quarter_text(std::string_view text) {
  if (is_decimal_figure(text)) return std::nullopt;

  const std::string skeleton = label_skeleton(text);
  const std::string_view window =
      std::string_view(skeleton).substr(0, kTemplateWindow);
  if (window.size() < 3) return std::nullopt;

  // A two-digit year beats a one-digit reading of the same label
  // ("Q11I" is Q1'11, not Q1'01 followed by noise).
  std::optional<core::QuarterId> short_year;
  for (const auto& variant : expand_confusables(window)) {
    auto m = match_template(variant);
    if (!m) continue;
    if (m->year_digits == 2) return m->id;
    if (!short_year) short_year = m->id;
  }
  return short_year;
}

std::optional<core::QuarterLabel> to_quarter_label(
    const core::TextDetection& detection,
    float image_height,
    float bottom_fraction) {
  const float band_top = (1.f - bottom_fraction) * image_height;
  if (detection.box.y0 < band_top) return std::nullopt;

  auto id = normalize_quarter_text(detection.text);
  if (!id) return std::nullopt;
  return core::QuarterLabel{*id, detection.box, detection.text};
}

}  // namespace epsbar::extraction
