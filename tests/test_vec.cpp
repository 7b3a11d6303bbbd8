#include <catch2/catch.hpp>
#include <cmath>
#include <prism/math/vec.hpp>

using namespace prism::math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Vec3 arithmetic", "[math][vec]") {
  const Vec3 a(1.0f, 2.0f, 3.0f);
  const Vec3 b(4.0f, 5.0f, 6.0f);

  SECTION("Addition and subtraction") {
    const Vec3 sum = a + b;
    REQUIRE(sum.x == 5.0f);
    REQUIRE(sum.y == 7.0f);
    REQUIRE(sum.z == 9.0f);

    const Vec3 diff = b - a;
    REQUIRE(diff.x == 3.0f);
    REQUIRE(diff.y == 3.0f);
    REQUIRE(diff.z == 3.0f);

    const Vec3 neg = -a;
    REQUIRE(neg.x == -1.0f);
    REQUIRE(neg.y == -2.0f);
    REQUIRE(neg.z == -3.0f);
  }

  SECTION("Component-wise and scalar products") {
    const Vec3 prod = a * b;
    REQUIRE(prod.x == 4.0f);
    REQUIRE(prod.y == 10.0f);
    REQUIRE(prod.z == 18.0f);

    const Vec3 quot = b / a;
    REQUIRE_THAT(quot.x, WithinAbs(4.0, 1e-6));
    REQUIRE_THAT(quot.y, WithinAbs(2.5, 1e-6));
    REQUIRE_THAT(quot.z, WithinAbs(2.0, 1e-6));

    const Vec3 scaled = 2.0f * a;
    REQUIRE(scaled.z == 6.0f);
    const Vec3 halved = a / 2.0f;
    REQUIRE(halved.y == 1.0f);
  }

  SECTION("Dot and cross product") {
    REQUIRE(dot(a, b) == 32.0f);

    const Vec3 c = cross(a, b);
    REQUIRE(c.x == -3.0f);
    REQUIRE(c.y == 6.0f);
    REQUIRE(c.z == -3.0f);

    // right-handed: x cross y = z
    const Vec3 z = cross(Vec3(1, 0, 0), Vec3(0, 1, 0));
    REQUIRE(z.x == 0.0f);
    REQUIRE(z.y == 0.0f);
    REQUIRE(z.z == 1.0f);
  }

  SECTION("Index access") {
    REQUIRE(a[0] == 1.0f);
    REQUIRE(a[1] == 2.0f);
    REQUIRE(a[2] == 3.0f);
  }
}

TEST_CASE("Vec3 length and normalization", "[math][vec]") {
  const Vec3 v(3.0f, 4.0f, 12.0f);
  REQUIRE(squared_length(v) == 169.0f);
  REQUIRE_THAT(length(v), WithinAbs(13.0, 1e-6));
  REQUIRE_THAT(length(v), WithinAbs(std::sqrt(squared_length(v)), 1e-6));

  const Vec3 samples[] = {
    {1.0f, 0.0f, 0.0f}, {0.0f, -7.5f, 0.0f}, {1e-3f, 2e-3f, -3e-3f},
    {123.0f, -456.0f, 789.0f}, {0.3f, 0.3f, 0.3f}};
  for (const Vec3 &s : samples) {
    REQUIRE_THAT(length(unit_vector(s)), WithinAbs(1.0, 1e-5));
  }
}

TEST_CASE("lerp clamps its parameter", "[math][vec]") {
  const Vec3 from(1.0f, 1.0f, 1.0f);
  const Vec3 to(0.5f, 0.7f, 1.0f);

  const Vec3 mid = lerp(from, to, 0.5f);
  REQUIRE_THAT(mid.x, WithinAbs(0.75, 1e-6));
  REQUIRE_THAT(mid.y, WithinAbs(0.85, 1e-6));
  REQUIRE_THAT(mid.z, WithinAbs(1.0, 1e-6));

  const Vec3 below = lerp(from, to, -3.0f);
  REQUIRE(below.x == 1.0f);
  const Vec3 above = lerp(from, to, 7.0f);
  REQUIRE(above.x == 0.5f);
  REQUIRE_THAT(above.y, WithinAbs(0.7, 1e-6));
}

TEST_CASE("reflect mirrors about the normal", "[math][vec]") {
  const Vec3 n(0.0f, 1.0f, 0.0f);
  const Vec3 r = reflect(Vec3(1.0f, -1.0f, 0.0f), n);
  REQUIRE(r.x == 1.0f);
  REQUIRE(r.y == 1.0f);
  REQUIRE(r.z == 0.0f);
}
