#pragma once
#include <memory>
#include <optional>
#include <prism/core/ray.hpp>
#include <prism/math/vec.hpp>

using namespace prism::math;

namespace prism::core {

class Material;

/// @brief Intersection of a ray with a primitive
struct Hit {
  float t{0.0f};      ///< Ray parameter at the intersection
  Vec3 position;      ///< World-space hit point
  Vec3 normal;        ///< Outward unit normal at position
};

/// @brief Analytic sphere primitive
struct Sphere {
  Vec3 center;
  float radius{1.0f};
  std::shared_ptr<const Material> material;

  Sphere() = default;
  Sphere(const Vec3 &center, float radius, std::shared_ptr<const Material> material);

  /// @brief Nearest intersection with t in the open interval (t_min, t_max)
  std::optional<Hit> hit(const Ray &ray, float t_min, float t_max) const;
};

std::optional<Hit> hit_sphere(const Vec3 &center, float radius, const Ray &ray, float t_min, float t_max);

} // namespace prism::core
