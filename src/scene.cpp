#include <memory>
#include <prism/core/material.hpp>
#include <prism/core/scene.hpp>

namespace prism::core {

World make_default_world() {
  World world;
  world.add(Sphere({0.0f, 0.0f, -1.0f}, 0.5f, std::make_shared<Diffuse>(Vec3(0.8f, 0.3f, 0.3f))));
  world.add(Sphere({0.0f, -100.5f, -1.0f}, 100.0f, std::make_shared<Diffuse>(Vec3(0.8f, 0.8f, 0.0f))));
  world.add(Sphere({1.0f, 0.0f, -1.0f}, 0.5f, std::make_shared<Metal>(Vec3(0.8f, 0.6f, 0.2f), 0.3f)));
  world.add(Sphere({-1.0f, 0.0f, -1.0f}, 0.5f, std::make_shared<Metal>(Vec3(0.8f, 0.8f, 0.8f), 1.0f)));
  return world;
}

Camera make_default_camera(float aspect) {
  return Camera({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}, {0.0f, 1.0f, 0.0f}, 90.0f, aspect);
}

} // namespace prism::core
