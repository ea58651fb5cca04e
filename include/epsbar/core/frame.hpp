#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace epsbar::core {

/// Channel layout of a decoded chart image; every format is 8 bits per channel.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Decoded chart image. Rows are stored top to bottom with no padding, so
/// row y starts at byte y * row_bytes(). The extraction stages only read
/// frames, which lets one Frame serve concurrent analyses.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept { return buffer_; }
  [[nodiscard]] std::span<const std::byte> data() const noexcept { return buffer_; }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Bytes per row: width * channels.
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(width_) * channels(format_);
  }

  /// Row \p y of a valid frame. Empty span when y is out of range or the
  /// frame is not valid.
  [[nodiscard]] std::span<std::byte> row(std::uint32_t y) noexcept;
  [[nodiscard]] std::span<const std::byte> row(std::uint32_t y) const noexcept;

  /// Non-zero size, known format, and a buffer holding every row.
  [[nodiscard]] bool is_valid() const noexcept;

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace epsbar::core
