#pragma once
#include <optional>
#include <prism/core/ray.hpp>
#include <prism/core/sphere.hpp>
#include <prism/math/rng.hpp>
#include <prism/math/vec.hpp>

using namespace prism::math;

namespace prism::core {

struct ScatterRecord {
  Vec3 attenuation;
  Ray scattered;
};

class Material {
public:
  virtual ~Material() = default;

  // std::nullopt means the ray was absorbed.
  virtual std::optional<ScatterRecord> scatter(const Ray &incoming, const Hit &hit, Rng &rng) const = 0;
};

// Approximate Lambertian: target is a random point in the unit sphere
// tangent to the surface at the hit point.
class Diffuse : public Material {
public:
  explicit Diffuse(const Vec3 &albedo);
  std::optional<ScatterRecord> scatter(const Ray &incoming, const Hit &hit, Rng &rng) const override;

  Vec3 albedo;
};

class Metal : public Material {
public:
  Metal(const Vec3 &albedo, float fuzz);
  std::optional<ScatterRecord> scatter(const Ray &incoming, const Hit &hit, Rng &rng) const override;

  Vec3 albedo;
  float fuzz; // clamped to [0, 1]
};

} // namespace prism::core
