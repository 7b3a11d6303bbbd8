#include <prism/core/world.hpp>
#include <prism/log/logger.hpp>
#include <stdexcept>
#include <utility>

namespace prism::core {

namespace {

void validate(const Sphere &sphere) {
  if (!sphere.material) {
    PLOG_ERROR("World: sphere at ({}, {}, {}) has no material", sphere.center.x, sphere.center.y, sphere.center.z);
    throw std::invalid_argument("World: sphere without material");
  }
  if (!(sphere.radius > 0.0f)) {
    PLOG_ERROR("World: sphere radius must be positive, got {}", sphere.radius);
    throw std::invalid_argument("World: non-positive sphere radius");
  }
}

} // namespace

World::World(std::vector<Sphere> spheres) : spheres(std::move(spheres)) {
  for (const Sphere &sphere : this->spheres)
    validate(sphere);
}

void World::add(Sphere sphere) {
  validate(sphere);
  spheres.push_back(std::move(sphere));
}

std::size_t World::size() const {
  return spheres.size();
}

bool World::empty() const {
  return spheres.empty();
}

std::optional<WorldHit> World::hit(const Ray &ray, float t_min, float t_max) const {
  std::optional<WorldHit> closest;
  float closest_t = t_max;

  for (const Sphere &sphere : spheres) {
    if (auto h = sphere.hit(ray, t_min, closest_t)) {
      closest_t = h->t;
      closest = WorldHit{*h, sphere.material.get()};
    }
  }
  return closest;
}

} // namespace prism::core
