#pragma once

namespace epsbar::core {

/// Axis-aligned rectangle in pixel coordinates. Origin is the top-left corner
/// of the source image; y grows downward.
struct Box {
  float x0{0.f};
  float y0{0.f};
  float x1{0.f};
  float y1{0.f};

  [[nodiscard]] float width() const noexcept { return x1 - x0; }
  [[nodiscard]] float height() const noexcept { return y1 - y0; }
  [[nodiscard]] float center_x() const noexcept { return 0.5f * (x0 + x1); }
  [[nodiscard]] float center_y() const noexcept { return 0.5f * (y0 + y1); }
};

}  // namespace epsbar::core
