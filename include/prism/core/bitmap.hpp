#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace prism::core {

/// @brief Packed 0xAARRGGBB framebuffer, stored top row first
struct Bitmap {
  Bitmap(std::size_t width, std::size_t height);

  std::size_t width() const { return width_; }
  std::size_t height() const { return height_; }
  std::size_t size() const { return buffer_.size(); }

  /// @brief Write cursor for column x, row y counted from the bottom
  /// @return nullptr when (x, y) lies outside the image
  std::uint32_t *pixel(std::size_t x, std::size_t y);
  const std::uint32_t *pixel(std::size_t x, std::size_t y) const;

  /// @brief Overwrite the entry under a window position (top-down y) with opaque white
  /// @details Unlike pixel(), y is not flipped: the marker lands under the pointer.
  /// @return false when out of range
  bool mark(std::size_t x, std::size_t y);

  std::uint32_t *data() { return buffer_.data(); }
  const std::uint32_t *data() const { return buffer_.data(); }
  const std::vector<std::uint32_t> &buffer() const { return buffer_; }

private:
  std::size_t width_;
  std::size_t height_;
  std::vector<std::uint32_t> buffer_;
};

} // namespace prism::core
