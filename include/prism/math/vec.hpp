#pragma once
#include <cmath>
#include <cstddef>

namespace prism::math {

struct Vec3 {
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};

  Vec3() = default;
  Vec3(float x, float y, float z) : x(x), y(y), z(z) {}

  float &operator[](std::size_t i) { return i == 0 ? x : (i == 1 ? y : z); }
  float operator[](std::size_t i) const { return i == 0 ? x : (i == 1 ? y : z); }
};

inline Vec3 operator+(const Vec3 &a, const Vec3 &b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}
inline Vec3 operator-(const Vec3 &a, const Vec3 &b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}
inline Vec3 operator-(const Vec3 &a) { return {-a.x, -a.y, -a.z}; }

// Component-wise product and quotient
inline Vec3 operator*(const Vec3 &a, const Vec3 &b) {
  return {a.x * b.x, a.y * b.y, a.z * b.z};
}
inline Vec3 operator/(const Vec3 &a, const Vec3 &b) {
  return {a.x / b.x, a.y / b.y, a.z / b.z};
}

inline Vec3 operator*(const Vec3 &a, float s) { return {a.x * s, a.y * s, a.z * s}; }
inline Vec3 operator*(float s, const Vec3 &a) { return a * s; }
inline Vec3 operator/(const Vec3 &a, float s) { return {a.x / s, a.y / s, a.z / s}; }

inline Vec3 &operator+=(Vec3 &a, const Vec3 &b) {
  a.x += b.x;
  a.y += b.y;
  a.z += b.z;
  return a;
}

float dot(const Vec3 &a, const Vec3 &b);
Vec3 cross(const Vec3 &a, const Vec3 &b);
float squared_length(const Vec3 &v);
float length(const Vec3 &v);

// Undefined for the zero vector.
Vec3 unit_vector(const Vec3 &v);

// Linear interpolation, t is clamped to [0, 1]
Vec3 lerp(const Vec3 &from, const Vec3 &to, float t);

// Mirror v about the plane with normal n (n unit length)
Vec3 reflect(const Vec3 &v, const Vec3 &n);

} // namespace prism::math
