#pragma once
#include <cstdint>
#include <prism/math/vec.hpp>
#include <random>

namespace prism::math {

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t tid);

struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<float> uni{0.0f, 1.0f};

  explicit Rng(uint64_t seed = std::random_device{}()) : gen(seed) {}

  float uniform();
  float uniform(float lo, float hi);
};

// Uniform point strictly inside the unit ball (rejection sampling).
Vec3 random_in_unit_sphere(Rng &rng);

} // namespace prism::math
