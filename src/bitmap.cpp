#include <prism/core/bitmap.hpp>
#include <prism/log/logger.hpp>
#include <stdexcept>

namespace prism::core {

Bitmap::Bitmap(std::size_t width, std::size_t height)
    : width_(width), height_(height) {
  if (width == 0 || height == 0) {
    PLOG_ERROR("Bitmap: invalid dimensions {}x{}", width, height);
    throw std::invalid_argument("Bitmap: width and height must be > 0");
  }
  buffer_.resize(width * height, 0u);
}

std::uint32_t *Bitmap::pixel(std::size_t x, std::size_t y) {
  if (x >= width_ || y >= height_)
    return nullptr;
  return &buffer_[(height_ - y - 1) * width_ + x];
}

const std::uint32_t *Bitmap::pixel(std::size_t x, std::size_t y) const {
  if (x >= width_ || y >= height_)
    return nullptr;
  return &buffer_[(height_ - y - 1) * width_ + x];
}

bool Bitmap::mark(std::size_t x, std::size_t y) {
  if (x >= width_ || y >= height_)
    return false;
  buffer_[y * width_ + x] = 0xFFFFFFFFu;
  return true;
}

} // namespace prism::core
