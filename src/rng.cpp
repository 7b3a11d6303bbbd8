#include <prism/math/rng.hpp>

namespace prism::math {

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t tid) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (tid + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

float Rng::uniform() {
  return uni(gen);
}

float Rng::uniform(float lo, float hi) {
  return lo + (hi - lo) * uniform();
}

Vec3 random_in_unit_sphere(Rng &rng) {
  // Acceptance ratio is pi/6, so ~1.91 draws on average.
  while (true) {
    const Vec3 p{rng.uniform(-1.0f, 1.0f), rng.uniform(-1.0f, 1.0f), rng.uniform(-1.0f, 1.0f)};
    if (squared_length(p) < 1.0f)
      return p;
  }
}

} // namespace prism::math
