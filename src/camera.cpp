#include <cmath>
#include <prism/core/camera.hpp>

namespace prism::core {

Camera::Camera(const Vec3 &origin, const Vec3 &look_at, const Vec3 &up, float vfov_deg, float aspect)
    : origin(origin) {
  const float theta = vfov_deg * static_cast<float>(M_PI) / 180.0f;
  const float half_height = std::tan(theta / 2.0f);
  const float half_width = aspect * half_height;

  const Vec3 w = unit_vector(origin - look_at);
  const Vec3 u = unit_vector(cross(up, w));
  const Vec3 v = cross(w, u);

  lower_left_corner = origin - half_width * u - half_height * v - w;
  horizontal = 2.0f * half_width * u;
  vertical = 2.0f * half_height * v;
}

Ray Camera::ray(float s, float t) const {
  return Ray(origin, lower_left_corner + s * horizontal + t * vertical - origin);
}

} // namespace prism::core
