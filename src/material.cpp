#include <algorithm>
#include <prism/core/material.hpp>

namespace prism::core {

Diffuse::Diffuse(const Vec3 &albedo) : albedo(albedo) {}

std::optional<ScatterRecord> Diffuse::scatter(const Ray &, const Hit &hit, Rng &rng) const {
  const Vec3 target = hit.position + hit.normal + random_in_unit_sphere(rng);
  return ScatterRecord{albedo, Ray(hit.position, target - hit.position)};
}

Metal::Metal(const Vec3 &albedo, float fuzz)
    : albedo(albedo), fuzz(std::clamp(fuzz, 0.0f, 1.0f)) {}

std::optional<ScatterRecord> Metal::scatter(const Ray &incoming, const Hit &hit, Rng &rng) const {
  const Vec3 reflected = reflect(unit_vector(incoming.direction), hit.normal);
  const Vec3 direction = reflected + fuzz * random_in_unit_sphere(rng);

  // Fuzzed below the surface: absorbed
  if (dot(direction, hit.normal) <= 0.0f)
    return std::nullopt;

  return ScatterRecord{albedo, Ray(hit.position, direction)};
}

} // namespace prism::core
