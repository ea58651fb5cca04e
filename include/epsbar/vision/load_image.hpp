#pragma once

#include <epsbar/core/error.hpp>
#include <epsbar/core/frame.hpp>
#include <expected>
#include <string>

namespace epsbar::vision {

/// Load a chart image file into a Frame (BGR8 or Grayscale8).
/// Returns ExtractError::LoadFailed when the file cannot be decoded.
[[nodiscard]] std::expected<epsbar::core::Frame, epsbar::core::ExtractError>
load_frame_from_image(const std::string& path);

}  // namespace epsbar::vision
