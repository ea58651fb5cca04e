#pragma once

#include <epsbar/core/error.hpp>
#include <epsbar/core/text_detection.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epsbar::app {

/// One line of a detection file: text<TAB>x0<TAB>y0<TAB>x1<TAB>y1[<TAB>confidence].
/// Confidence defaults to 1. nullopt if the line is malformed or holds a
/// non-finite number.
[[nodiscard]] std::optional<core::TextDetection> parse_detection_line(std::string_view line);

/// Read the OCR output stored next to a chart image. Blank lines and lines
/// starting with '#' are skipped; malformed lines are logged and skipped.
/// Returns ExtractError::LoadFailed if the file cannot be opened.
[[nodiscard]] std::expected<std::vector<core::TextDetection>, core::ExtractError>
load_detections(const std::string& path);

}  // namespace epsbar::app
