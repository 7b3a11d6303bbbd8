#include <cstdint>
#include <cstdlib>
#include <exception>
#include <prism/core/bitmap.hpp>
#include <prism/core/render.hpp>
#include <prism/core/scene.hpp>
#include <prism/log/logger.hpp>
#include <string>

using namespace prism::core;

// usage: prism_render [width] [height] [samples] [threads] [seed]
int main(int argc, char **argv) {
  if (const char *lv = std::getenv("PRISM_LOG_LEVEL"))
    prism::log::Logger::instance().set_level(prism::log::parse_level(lv));

  try {
    const std::size_t width = argc > 1 ? std::stoul(argv[1]) : 200;
    const std::size_t height = argc > 2 ? std::stoul(argv[2]) : 100;

    const World world = make_default_world();
    const Camera camera = make_default_camera(static_cast<float>(width) / static_cast<float>(height));

    RenderConfig config(&world, &camera);
    if (argc > 3)
      config.aa_samples = static_cast<unsigned>(std::stoul(argv[3]));
    config.n_threads = argc > 4 ? std::stoul(argv[4]) : 0;
    if (argc > 5)
      config.seed = std::stoull(argv[5]);

    Bitmap bitmap(width, height);
    render_frame_parallel(config, bitmap);

    // Average display value, a cheap fingerprint of the frame
    std::uint64_t sum[3] = {0, 0, 0};
    for (const std::uint32_t p : bitmap.buffer()) {
      sum[0] += (p >> 16) & 0xFF;
      sum[1] += (p >> 8) & 0xFF;
      sum[2] += p & 0xFF;
    }
    const double n = static_cast<double>(bitmap.size());
    PLOG_INFO("Mean RGB: ({:.2f}, {:.2f}, {:.2f})", sum[0] / n, sum[1] / n, sum[2] / n);
  } catch (const std::exception &e) {
    PLOG_ERROR("prism_render: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
