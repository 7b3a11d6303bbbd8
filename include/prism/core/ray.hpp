#pragma once
#include <prism/math/vec.hpp>

using namespace prism::math;

namespace prism::core {

struct Ray {
  Vec3 origin{0, 0, 0};
  Vec3 direction{0, 0, -1}; // not necessarily unit length

  Ray() = default;
  Ray(const Vec3 &origin, const Vec3 &direction);

  Vec3 point_at_parameter(float t) const;
};

} // namespace prism::core
