#include <cmath>
#include <utility>
#include <prism/core/sphere.hpp>

namespace prism::core {

Sphere::Sphere(const Vec3 &center, float radius, std::shared_ptr<const Material> material)
    : center(center), radius(radius), material(std::move(material)) {}

std::optional<Hit> Sphere::hit(const Ray &ray, float t_min, float t_max) const {
  return hit_sphere(center, radius, ray, t_min, t_max);
}

std::optional<Hit> hit_sphere(const Vec3 &center, float radius, const Ray &ray, float t_min, float t_max) {
  // a*t^2 + 2b*t + c = 0 with the factor 2 folded into b
  const Vec3 oc = ray.origin - center;
  const float a = dot(ray.direction, ray.direction);
  const float b = dot(oc, ray.direction);
  const float c = dot(oc, oc) - radius * radius;
  const float discriminant = b * b - a * c;

  if (discriminant < 0.0f)
    return std::nullopt;

  const float root = std::sqrt(discriminant);
  for (const float t : {(-b - root) / a, (-b + root) / a}) {
    if (t > t_min && t < t_max) {
      Hit hit;
      hit.t = t;
      hit.position = ray.point_at_parameter(t);
      hit.normal = (hit.position - center) / radius;
      return hit;
    }
  }
  return std::nullopt;
}

} // namespace prism::core
