#pragma once
#include <cstddef>
#include <optional>
#include <prism/core/material.hpp>
#include <prism/core/ray.hpp>
#include <prism/core/sphere.hpp>
#include <vector>

namespace prism::core {

struct WorldHit {
  Hit hit;
  const Material *material{nullptr};
};

/// @brief Ordered collection of spheres, read-only while rendering
struct World {
  std::vector<Sphere> spheres{};

  World() = default;
  explicit World(std::vector<Sphere> spheres);

  /// @brief Append a sphere; throws std::invalid_argument without material or with radius <= 0
  void add(Sphere sphere);
  std::size_t size() const;
  bool empty() const;

  /// @brief Nearest hit over all spheres in (t_min, t_max)
  /// @details Linear scan in insertion order; on exact ties the earlier sphere wins.
  std::optional<WorldHit> hit(const Ray &ray, float t_min, float t_max) const;
};

} // namespace prism::core
