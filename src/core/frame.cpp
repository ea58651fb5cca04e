#include <epsbar/core/frame.hpp>
#include <cstddef>

namespace epsbar::core {

std::size_t Frame::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channels(format);
}

bool Frame::is_valid() const noexcept {
  if (width_ == 0 || height_ == 0) return false;
  if (channels(format_) == 0) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

std::span<std::byte> Frame::row(std::uint32_t y) noexcept {
  if (y >= height_ || !is_valid()) return {};
  return std::span<std::byte>(buffer_).subspan(y * row_bytes(), row_bytes());
}

std::span<const std::byte> Frame::row(std::uint32_t y) const noexcept {
  if (y >= height_ || !is_valid()) return {};
  return std::span<const std::byte>(buffer_).subspan(y * row_bytes(), row_bytes());
}

}  // namespace epsbar::core
