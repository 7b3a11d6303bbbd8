#include <catch2/catch.hpp>
#include <memory>
#include <prism/core/integrator.hpp>
#include <prism/core/material.hpp>
#include <prism/core/scene.hpp>
#include <prism/core/world.hpp>

using namespace prism::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("Background gradient", "[core][integrator]") {
  const Vec3 up = background(Ray({0, 0, 0}, {0.0f, 3.0f, 0.0f}));
  REQUIRE_THAT(up.x, WithinAbs(0.5, 1e-6));
  REQUIRE_THAT(up.y, WithinAbs(0.7, 1e-6));
  REQUIRE_THAT(up.z, WithinAbs(1.0, 1e-6));

  const Vec3 down = background(Ray({0, 0, 0}, {0.0f, -1.0f, 0.0f}));
  REQUIRE(down.x == 1.0f);
  REQUIRE(down.y == 1.0f);
  REQUIRE(down.z == 1.0f);
}

TEST_CASE("color in an empty world is the background", "[core][integrator]") {
  const World world;
  Rng rng(1);
  const Vec3 dirs[] = {{0.0f, 0.0f, -1.0f}, {1.0f, 2.0f, -3.0f}, {-0.2f, -0.9f, 0.1f}};
  for (const Vec3 &d : dirs) {
    const Ray ray({0.0f, 0.0f, 0.0f}, d);
    const Vec3 c = color(ray, world, 50, rng);
    const Vec3 bg = background(ray);
    REQUIRE(c.x == bg.x);
    REQUIRE(c.y == bg.y);
    REQUIRE(c.z == bg.z);
  }
}

TEST_CASE("color with no bounces left is black", "[core][integrator]") {
  const World world = make_default_world();
  const World empty;
  Rng rng(3);
  for (const World *w : {&world, &empty}) {
    const Vec3 c = color(Ray({0, 0, 0}, {0.0f, 0.0f, -1.0f}), *w, 0, rng);
    REQUIRE(c.x == 0.0f);
    REQUIRE(c.y == 0.0f);
    REQUIRE(c.z == 0.0f);
  }
}

TEST_CASE("color attenuates by albedo per bounce", "[core][integrator]") {
  World world;
  world.add(Sphere({0.0f, 0.0f, 0.0f}, 1.0f, std::make_shared<Metal>(Vec3(0.5f, 0.5f, 0.5f), 0.0f)));
  Rng rng(8);
  const Ray ray({0.0f, 0.0f, 2.0f}, {0.0f, 0.0f, -1.0f});

  // mirrored straight back along +z, where the gradient is at its midpoint
  const Vec3 c = color(ray, world, 50, rng);
  REQUIRE_THAT(c.x, WithinAbs(0.375, 1e-5));
  REQUIRE_THAT(c.y, WithinAbs(0.425, 1e-5));
  REQUIRE_THAT(c.z, WithinAbs(0.5, 1e-5));

  // the scattered ray needs a second unit of budget to reach the sky
  const Vec3 cut = color(ray, world, 1, rng);
  REQUIRE(cut.x == 0.0f);
  REQUIRE(cut.z == 0.0f);
}

TEST_CASE("color is absorbed inside a closed mirror", "[core][integrator]") {
  World world;
  world.add(Sphere({0.0f, 0.0f, 0.0f}, 10.0f, std::make_shared<Metal>(Vec3(0.9f, 0.9f, 0.9f), 0.0f)));
  Rng rng(4);
  const Vec3 c = color(Ray({0, 0, 0}, {0.3f, 0.5f, -1.0f}), world, 20, rng);
  REQUIRE(c.x == 0.0f);
  REQUIRE(c.y == 0.0f);
  REQUIRE(c.z == 0.0f);
}

TEST_CASE("color of the stock scene stays in [0, 1]", "[core][integrator]") {
  const World world = make_default_world();
  const Camera cam = make_default_camera(2.0f);
  Rng rng(17);
  for (int i = 0; i < 500; ++i) {
    const Vec3 c = color(cam.ray(rng.uniform(), rng.uniform()), world, 50, rng);
    for (std::size_t k = 0; k < 3; ++k) {
      REQUIRE(c[k] >= 0.0f);
      REQUIRE(c[k] <= 1.0f);
    }
  }
}
