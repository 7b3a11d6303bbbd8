#include <cfloat>
#include <prism/core/integrator.hpp>

namespace prism::core {

Vec3 background(const Ray &ray) {
  const Vec3 unit_direction = unit_vector(ray.direction);
  const float t = 0.5f * (unit_direction.y + 1.0f);
  return lerp(Vec3(1.0f, 1.0f, 1.0f), Vec3(0.5f, 0.7f, 1.0f), t);
}

Vec3 color(const Ray &ray, const World &world, unsigned bounces_remaining, Rng &rng) {
  // Iterative form of attenuation * color(scattered, depth - 1)
  Vec3 throughput{1.0f, 1.0f, 1.0f};
  Ray current = ray;

  for (; bounces_remaining > 0; --bounces_remaining) {
    const auto hit = world.hit(current, kShadowEpsilon, FLT_MAX);
    if (!hit)
      return throughput * background(current);

    const auto scatter = hit->material->scatter(current, hit->hit, rng);
    if (!scatter)
      return Vec3(0, 0, 0);

    throughput = throughput * scatter->attenuation;
    current = scatter->scattered;
  }
  return Vec3(0, 0, 0);
}

} // namespace prism::core
