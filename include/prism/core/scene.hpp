#pragma once
#include <prism/core/camera.hpp>
#include <prism/core/world.hpp>

namespace prism::core {

// Ground, a diffuse sphere flanked by two metal spheres, centred on (0, 0, -1)
World make_default_world();

// Eye at the origin looking down -z, 90 degree vertical FOV
Camera make_default_camera(float aspect);

} // namespace prism::core
