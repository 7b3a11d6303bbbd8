#include <algorithm>
#include <prism/math/vec.hpp>

namespace prism::math {

float dot(const Vec3 &a, const Vec3 &b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {
    a.y * b.z - a.z * b.y,
    a.z * b.x - a.x * b.z,
    a.x * b.y - a.y * b.x
  };
}

float squared_length(const Vec3 &v) {
  return dot(v, v);
}

float length(const Vec3 &v) {
  return std::sqrt(squared_length(v));
}

Vec3 unit_vector(const Vec3 &v) {
  return v / length(v);
}

Vec3 lerp(const Vec3 &from, const Vec3 &to, float t) {
  const float s = std::clamp(t, 0.0f, 1.0f);
  return from * (1.0f - s) + to * s;
}

Vec3 reflect(const Vec3 &v, const Vec3 &n) {
  return v - n * (2.0f * dot(v, n));
}

} // namespace prism::math
