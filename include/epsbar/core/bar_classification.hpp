#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace epsbar::core {

/// Binarization strategies of the bar ensemble. Closed set.
enum class BarMethod : std::uint8_t {
  AdaptiveThreshold,
  MorphologicalClosing,
  InvertedOtsu,
};

/// Dark = solidly filled bar (actual figure); Light = partially filled (estimate).
enum class BarShade : std::uint8_t {
  Dark,
  Light,
};

/// One method's verdict on one bar.
struct BarVote {
  BarMethod method{BarMethod::AdaptiveThreshold};
  double white_pixel_ratio{0.0};
  BarShade vote{BarShade::Light};
};

/// Ensemble outcome for one bar.
struct ClassificationResult {
  std::vector<BarVote> votes;
  int agreement_count{0};
  BarShade final_shade{BarShade::Light};
  int tier_confidence{33};  // 100, 67 or 33

  [[nodiscard]] bool is_estimate() const noexcept {
    return final_shade == BarShade::Light;
  }
};

[[nodiscard]] std::string_view to_string(BarMethod m) noexcept;
[[nodiscard]] std::string_view to_string(BarShade s) noexcept;

}  // namespace epsbar::core
