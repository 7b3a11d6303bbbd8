#pragma once
#include <cstddef>
#include <cstdint>
#include <prism/core/bitmap.hpp>
#include <prism/core/camera.hpp>
#include <prism/core/world.hpp>
#include <prism/math/rng.hpp>
#include <random>

namespace prism::core {

struct RenderConfig {
  std::uint64_t seed = std::random_device{}();
  std::size_t n_threads = 1; // 0 selects hardware concurrency
  unsigned aa_samples = 100;
  unsigned max_bounces = 50;
  bool jitter = true; // false pins every sample to the pixel's lower-left corner

  const World *world{nullptr};
  const Camera *camera{nullptr};

  RenderConfig(const World *w = nullptr, const Camera *c = nullptr);
  RenderConfig(std::uint64_t s, const World *w = nullptr, const Camera *c = nullptr);
};

/// @brief Average linear radiance of pixel (x, y), y counted from the bottom
Vec3 shade_pixel(const RenderConfig &config, std::size_t x, std::size_t y,
                 std::size_t width, std::size_t height, Rng &rng);

/// @brief Gamma-2 correct, quantize and pack, keeping the alpha byte of previous
std::uint32_t pack_pixel(const Vec3 &linear, std::uint32_t previous);

void render_frame(const RenderConfig &config, Bitmap &bitmap);

void render_frame_parallel(const RenderConfig &config, Bitmap &bitmap);

} // namespace prism::core
