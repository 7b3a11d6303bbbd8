#pragma once
#include <prism/core/ray.hpp>
#include <prism/core/world.hpp>
#include <prism/math/rng.hpp>

using namespace prism::math;

namespace prism::core {

// Lower bound of the hit interval, keeps secondary rays off their own surface
constexpr float kShadowEpsilon = 0.001f;

// Vertical sky gradient from white (down) to light blue (up)
Vec3 background(const Ray &ray);

/// @brief Radiance arriving along ray
/// @param bounces_remaining Path depth budget, 0 returns black
Vec3 color(const Ray &ray, const World &world, unsigned bounces_remaining, Rng &rng);

} // namespace prism::core
