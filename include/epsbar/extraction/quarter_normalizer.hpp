#pragma once

#include <epsbar/core/quarter.hpp>
#include <epsbar/core/text_detection.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epsbar::extraction {

/// OCR confusion classes applied to quarter labels. Any member of a class may
/// stand for any other member.
inline constexpr std::string_view kQuarterConfusables = "QO0";
inline constexpr std::string_view kOneConfusables = "1Il";

/// Every spelling of \p text reachable by swapping characters within their
/// confusion class. The input spelling comes first; characters outside the
/// classes are kept as is. Result size is the product of the class sizes of
/// the confusable characters, so callers pass short windows.
[[nodiscard]] std::vector<std::string> expand_confusables(std::string_view text);

/// Keep only ASCII letters and digits ("Q1'14" -> "Q114").
[[nodiscard]] std::string label_skeleton(std::string_view text);

/// Read a quarter label such as "Q1'14", "Q1 14", "0114" or "Q1I4".
/// The skeleton must start with a Q-equivalent followed by a quarter digit
/// 1-4 and a one- or two-digit year; trailing characters are ignored.
/// Text that reads as a decimal figure ("0.14") is never a label; a dot
/// standing in for the apostrophe ("Q1.14") is fine.
[[nodiscard]] std::optional<core::QuarterId> normalize_quarter_text(
    std::string_view text);

/// Label for \p detection when it lies in the bottom band of the image
/// (y0 >= (1 - bottom_fraction) * image_height) and its text reads as a quarter.
[[nodiscard]] std::optional<core::QuarterLabel> to_quarter_label(
    const core::TextDetection& detection,
    float image_height,
    float bottom_fraction);

}  // namespace epsbar::extraction
