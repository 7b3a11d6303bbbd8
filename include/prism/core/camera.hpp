#pragma once
#include <prism/core/ray.hpp>
#include <prism/math/vec.hpp>

using namespace prism::math;

namespace prism::core {

/// @brief Pinhole camera with a look-at basis
/// @details look_at == origin or up parallel to the view axis is not supported.
struct Camera {
  Vec3 origin;
  Vec3 lower_left_corner;
  Vec3 horizontal;
  Vec3 vertical;

  /// @param origin Eye position
  /// @param look_at Point the camera faces
  /// @param up World up hint
  /// @param vfov_deg Vertical field of view (degrees)
  /// @param aspect Width / height
  Camera(const Vec3 &origin, const Vec3 &look_at, const Vec3 &up, float vfov_deg, float aspect);

  /// @brief Ray through normalized image coordinates, (0,0) is the bottom-left corner
  Ray ray(float s, float t) const;
};

} // namespace prism::core
