#include <prism/core/ray.hpp>

namespace prism::core {

Ray::Ray(const Vec3 &origin, const Vec3 &direction)
    : origin(origin), direction(direction) {}

Vec3 Ray::point_at_parameter(float t) const {
  return origin + direction * t;
}

} // namespace prism::core
