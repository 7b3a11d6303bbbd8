#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <prism/core/integrator.hpp>
#include <prism/core/render.hpp>
#include <prism/core/worker_group.hpp>
#include <prism/log/logger.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

namespace prism::core {

using prism::math::Rng;
using prism::math::mix_seed;

RenderConfig::RenderConfig(const World *w, const Camera *c)
    : world(w), camera(c) {}

RenderConfig::RenderConfig(std::uint64_t s, const World *w, const Camera *c)
    : seed(s), world(w), camera(c) {}

namespace {

void validate(const RenderConfig &config) {
  if (!config.world || !config.camera) {
    PLOG_ERROR("render: world and camera must be set");
    throw std::invalid_argument("RenderConfig: missing world or camera");
  }
  if (config.aa_samples == 0) {
    PLOG_ERROR("render: aa_samples must be > 0");
    throw std::invalid_argument("RenderConfig: aa_samples must be > 0");
  }
}

// stop, when set, is polled once per row
void render_rows(const RenderConfig &config, Bitmap &bitmap, std::size_t row_begin, std::size_t row_end, Rng &rng,
                 const std::atomic<bool> *stop = nullptr) {
  const std::size_t width = bitmap.width();
  const std::size_t height = bitmap.height();

  for (std::size_t y = row_begin; y < row_end; ++y) {
    if (stop && stop->load(std::memory_order_relaxed))
      return;
    for (std::size_t x = 0; x < width; ++x) {
      std::uint32_t *p = bitmap.pixel(x, y);
      if (!p)
        continue;
      *p = pack_pixel(shade_pixel(config, x, y, width, height, rng), *p);
    }
  }
}

} // namespace

Vec3 shade_pixel(const RenderConfig &config, std::size_t x, std::size_t y,
                 std::size_t width, std::size_t height, Rng &rng) {
  Vec3 sum{0, 0, 0};
  for (unsigned s = 0; s < config.aa_samples; ++s) {
    const float du = config.jitter ? rng.uniform() : 0.0f;
    const float dv = config.jitter ? rng.uniform() : 0.0f;
    const float u = (static_cast<float>(x) + du) / static_cast<float>(width);
    const float v = (static_cast<float>(y) + dv) / static_cast<float>(height);
    sum += color(config.camera->ray(u, v), *config.world, config.max_bounces, rng);
  }
  return sum / static_cast<float>(config.aa_samples);
}

std::uint32_t pack_pixel(const Vec3 &linear, std::uint32_t previous) {
  auto channel = [](float c) -> std::uint32_t {
    const float g = std::clamp(std::sqrt(std::max(c, 0.0f)), 0.0f, 1.0f);
    return static_cast<std::uint32_t>(g * 255.0f);
  };
  return (previous & 0xFF000000u) | channel(linear.x) << 16 | channel(linear.y) << 8 | channel(linear.z);
}

void render_frame(const RenderConfig &config, Bitmap &bitmap) {
  validate(config);
  Rng rng(config.seed);
  const auto start = std::chrono::steady_clock::now();

  render_rows(config, bitmap, 0, bitmap.height(), rng);

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
  PLOG_INFO("Rendered {}x{} ({} spp) in {:.1f} ms", bitmap.width(), bitmap.height(), config.aa_samples, elapsed.count());
}

void render_frame_parallel(const RenderConfig &config, Bitmap &bitmap) {
  validate(config);

  // Determine number of threads to use
  std::size_t n_threads = config.n_threads;
  if (n_threads == 0)
    n_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (n_threads > bitmap.height())
    n_threads = bitmap.height();

  const std::size_t base = bitmap.height() / n_threads;
  const std::size_t rem = bitmap.height() % n_threads;

  PLOG_INFO("Rendering {}x{} with {} threads, {} spp, depth {}", bitmap.width(), bitmap.height(), n_threads,
            config.aa_samples, config.max_bounces);
  const auto start = std::chrono::steady_clock::now();

  // Launch threads, each owning a contiguous band of rows
  WorkerGroup workers(n_threads);

  std::atomic<bool> any_error{false};
  std::exception_ptr thread_exception = nullptr;

  std::size_t row = 0;
  try {
    for (std::size_t t = 0; t < n_threads; ++t) {
      const std::size_t row_begin = row;
      const std::size_t row_end = row_begin + base + (t < rem ? 1u : 0u);
      row = row_end;

      workers.spawn([&, t, row_begin, row_end]() {
        try {
          const std::uint64_t thread_seed = mix_seed(config.seed, static_cast<std::uint64_t>(t));
          Rng rng(thread_seed);

          prism::log::Logger::set_thread_tag(fmt::format("w{}", t));
          PLOG_DEBUG("Thread {} rows [{}, {}) seed {}", t, row_begin, row_end, thread_seed);

          render_rows(config, bitmap, row_begin, row_end, rng, &any_error);
        } catch (...) {
          if (!any_error.exchange(true))
            thread_exception = std::current_exception();
        }
      });
    }
  } catch (...) {
    // Could not start every worker: stop the running ones and report
    any_error = true;
    PLOG_ERROR("render: started only {} of {} worker threads", workers.size(), n_threads);
    workers.join();
    throw;
  }

  // Join threads
  workers.join();
  if (any_error && thread_exception) {
    std::rethrow_exception(thread_exception);
  }

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
  PLOG_INFO("Parallel render finished in {:.1f} ms", elapsed.count());
}

} // namespace prism::core
