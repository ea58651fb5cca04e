#pragma once

#include <epsbar/core/bar_classification.hpp>
#include <epsbar/core/error.hpp>
#include <epsbar/core/frame.hpp>
#include <epsbar/core/quarter_value_pair.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace epsbar::vision {

/// Binarization parameters of the ensemble.
struct ClassifierConfig {
  int adaptive_block_size{11};  // odd, > 1
  double adaptive_c{2.0};
  int closing_kernel_size{5};
};

/// Voting rule of one method: white ratio above threshold -> shade_above,
/// otherwise the opposite shade.
struct BarMethodRule {
  core::BarMethod method;
  double threshold;
  core::BarShade shade_above;
};

/// Adaptive and inverted Otsu react to solidly filled bars. Closing fills the
/// gaps of hatched bars, so its polarity is reversed: a mostly white result
/// after closing means a light (estimate) bar.
inline constexpr std::array<BarMethodRule, 3> kBarMethodRules{{
    {core::BarMethod::AdaptiveThreshold, 0.7, core::BarShade::Dark},
    {core::BarMethod::MorphologicalClosing, 0.5, core::BarShade::Light},
    {core::BarMethod::InvertedOtsu, 0.7, core::BarShade::Dark},
}};

[[nodiscard]] constexpr const BarMethodRule& rule_for(core::BarMethod method) noexcept {
  switch (method) {
    case core::BarMethod::AdaptiveThreshold:
      return kBarMethodRules[0];
    case core::BarMethod::MorphologicalClosing:
      return kBarMethodRules[1];
    case core::BarMethod::InvertedOtsu:
      return kBarMethodRules[2];
  }
  return kBarMethodRules[0];
}

/// Vote of \p method for a region whose binarized white ratio is \p white_ratio.
[[nodiscard]] constexpr core::BarShade vote_for(core::BarMethod method,
                                                double white_ratio) noexcept {
  const BarMethodRule& rule = rule_for(method);
  if (white_ratio > rule.threshold) return rule.shade_above;
  return rule.shade_above == core::BarShade::Dark ? core::BarShade::Light
                                                  : core::BarShade::Dark;
}

/// Confidence tier for the number of votes agreeing with the majority.
[[nodiscard]] constexpr int tier_confidence(int agreement_count) noexcept {
  if (agreement_count >= 3) return 100;
  if (agreement_count == 2) return 67;
  return 33;
}

/// Majority vote. Dark wins only with strictly more votes than Light.
[[nodiscard]] core::ClassificationResult tally(std::span<const core::BarVote> votes);

/// Pixel rectangle of the bar between a figure and its label; may be empty.
struct BarRegion {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }
};

/// Horizontally the union of both boxes, vertically from the bottom of the
/// figure to the top of the label; clipped to the image.
[[nodiscard]] BarRegion bar_region(const core::QuarterValuePair& pair,
                                   std::uint32_t image_width,
                                   std::uint32_t image_height);

/// Classifies matched bars as dark (actual) or light (estimate) by majority
/// vote of three binarizations of the grayscale bar region.
class BarClassifier {
 public:
  BarClassifier() = default;
  explicit BarClassifier(ClassifierConfig config);

  /// Fails only with ExtractError::InvalidImage; empty or uniform regions still vote.
  [[nodiscard]] std::expected<core::ClassificationResult, core::ExtractError> classify(
      const core::Frame& frame,
      const core::QuarterValuePair& pair) const;

  /// One result per pair, in pair order.
  [[nodiscard]] std::expected<std::vector<core::ClassificationResult>, core::ExtractError>
  classify_all(const core::Frame& frame,
               std::span<const core::QuarterValuePair> pairs) const;

  [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

 private:
  ClassifierConfig config_{};
};

}  // namespace epsbar::vision
