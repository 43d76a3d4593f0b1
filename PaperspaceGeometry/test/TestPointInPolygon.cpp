#include <PaperspaceGeometry/PointInPolygon.h>
#include <PaperspaceNativeTests/RandomPolygon.h>
#include <PaperspaceUtility/Math.h>

#include <doctest/doctest.h>
#include <glm/ext/vector_double3.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <vector>

using namespace PaperspaceGeometry;
using namespace PaperspaceNativeTests;
using namespace PaperspaceUtility;

namespace {
const std::vector<glm::dvec3> square{
    glm::dvec3(0.0, 0.0, 0.0),
    glm::dvec3(10.0, 0.0, 0.0),
    glm::dvec3(10.0, 10.0, 0.0),
    glm::dvec3(0.0, 10.0, 0.0)};

// A five-pointed star drawn in one stroke. Its center is wound twice.
std::vector<glm::dvec3> pentagram() {
  std::vector<glm::dvec3> result;
  for (int i = 0; i < 5; ++i) {
    const double angle = Math::PiOverTwo + 2.0 * Math::TwoPi * i / 5.0;
    result.emplace_back(10.0 * std::cos(angle), 10.0 * std::sin(angle), 0.0);
  }
  return result;
}

std::vector<glm::dvec3> reversed(std::vector<glm::dvec3> polygon) {
  std::reverse(polygon.begin(), polygon.end());
  return polygon;
}
} // namespace

TEST_CASE("PointInPolygon::contains") {
  SUBCASE("classifies interior and exterior points") {
    CHECK(PointInPolygon::contains(glm::dvec3(5.0, 5.0, 0.0), square));
    CHECK(!PointInPolygon::contains(glm::dvec3(15.0, 5.0, 0.0), square));
    CHECK(!PointInPolygon::contains(glm::dvec3(-1.0, 5.0, 0.0), square));
    CHECK(!PointInPolygon::contains(glm::dvec3(5.0, 11.0, 0.0), square));
  }

  SUBCASE("ignores the Z coordinate") {
    CHECK(PointInPolygon::contains(glm::dvec3(5.0, 5.0, 100.0), square));
  }

  SUBCASE("is independent of the winding direction") {
    const std::vector<glm::dvec3> clockwise = reversed(square);
    CHECK(PointInPolygon::contains(glm::dvec3(5.0, 5.0, 0.0), clockwise));
    CHECK(!PointInPolygon::contains(glm::dvec3(15.0, 5.0, 0.0), clockwise));
  }

  SUBCASE("counts the left edge as inside and the right edge as outside") {
    CHECK(PointInPolygon::contains(glm::dvec3(0.0, 5.0, 0.0), square));
    CHECK(!PointInPolygon::contains(glm::dvec3(10.0, 5.0, 0.0), square));
  }

  SUBCASE("counts a ray through a vertex once") {
    const std::vector<glm::dvec3> diamond{
        glm::dvec3(0.0, -5.0, 0.0),
        glm::dvec3(5.0, 0.0, 0.0),
        glm::dvec3(0.0, 5.0, 0.0),
        glm::dvec3(-5.0, 0.0, 0.0)};
    CHECK(PointInPolygon::contains(glm::dvec3(0.0, 0.0, 0.0), diamond));
    CHECK(!PointInPolygon::contains(glm::dvec3(-6.0, 0.0, 0.0), diamond));
  }

  SUBCASE("rejects degenerate polygons") {
    const std::vector<glm::dvec3> segment{
        glm::dvec3(0.0, 0.0, 0.0),
        glm::dvec3(1.0, 1.0, 0.0)};
    CHECK_THROWS_AS(
        PointInPolygon::contains(glm::dvec3(0.0), segment),
        std::invalid_argument);
    CHECK_THROWS_AS(
        PointInPolygon::windingNumber(glm::dvec3(0.0), segment),
        std::invalid_argument);
    CHECK_THROWS_AS(
        PointInPolygon::containsWithTolerance(glm::dvec3(0.0), {}, 1e-9),
        std::invalid_argument);
  }
}

TEST_CASE("PointInPolygon::windingNumber") {
  const glm::dvec3 center(5.0, 5.0, 0.0);
  CHECK(PointInPolygon::windingNumber(center, square) == 1);
  CHECK(
      PointInPolygon::windingNumber(center, reversed(square)) ==
      -1);
  CHECK(
      PointInPolygon::windingNumber(
          glm::dvec3(20.0, 5.0, 0.0),
          square) == 0);

  CHECK(PointInPolygon::containsByWindingNumber(
      glm::dvec3(0.0, 5.0, 0.0),
      square));
  CHECK(!PointInPolygon::containsByWindingNumber(
      glm::dvec3(10.0, 5.0, 0.0),
      square));
}

TEST_CASE("PointInPolygon::containsWithTolerance") {
  const glm::dvec3 onRightEdge(10.0, 5.0, 0.0);

  SUBCASE("accepts a point on the boundary") {
    CHECK(PointInPolygon::containsWithTolerance(
        onRightEdge,
        square,
        1e-9));
  }

  SUBCASE("accepts a point that drifted just outside") {
    CHECK(PointInPolygon::containsWithTolerance(
        glm::dvec3(10.0 + 1e-10, 5.0, 0.0),
        square,
        1e-9));
  }

  SUBCASE("rejects a point well outside") {
    CHECK(!PointInPolygon::containsWithTolerance(
        glm::dvec3(10.1, 5.0, 0.0),
        square,
        1e-9));
  }

  SUBCASE("a negligible tolerance performs only the exact test") {
    CHECK(!PointInPolygon::containsWithTolerance(
        onRightEdge,
        square,
        1e-13));
    CHECK(!PointInPolygon::containsWithTolerance(
        onRightEdge,
        square,
        0.0));
  }

  SUBCASE("rejects a negative tolerance") {
    CHECK_THROWS_AS(
        PointInPolygon::containsWithTolerance(
            glm::dvec3(5.0, 5.0, 0.0),
            square,
            -1e-9),
        std::invalid_argument);
  }
}

TEST_CASE("PointInPolygon rules differ for self-intersecting polygons") {
  const std::vector<glm::dvec3> star = pentagram();
  const glm::dvec3 center(0.0, 0.0, 0.0);

  CHECK(std::abs(PointInPolygon::windingNumber(center, star)) == 2);
  CHECK(!PointInPolygon::contains(center, star));
  CHECK(PointInPolygon::containsByWindingNumber(center, star));

  SUBCASE("the offset points use the selected rule") {
    CHECK(!PointInPolygon::containsWithTolerance(center, star, 1e-9));
    CHECK(!PointInPolygon::containsWithTolerance(
        center,
        star,
        1e-9,
        PointInPolygon::Rule::EvenOdd));
    CHECK(PointInPolygon::containsWithTolerance(
        center,
        star,
        1e-9,
        PointInPolygon::Rule::NonZero));
  }

  SUBCASE("a negligible tolerance uses the selected rule too") {
    CHECK(PointInPolygon::containsWithTolerance(
        center,
        star,
        0.0,
        PointInPolygon::Rule::NonZero));
  }

  SUBCASE("both rules agree on a star point") {
    const glm::dvec3 tip(0.0, 8.0, 0.0);
    CHECK(PointInPolygon::containsWithTolerance(
        tip,
        star,
        1e-9,
        PointInPolygon::Rule::EvenOdd));
    CHECK(PointInPolygon::containsWithTolerance(
        tip,
        star,
        1e-9,
        PointInPolygon::Rule::NonZero));
  }
}

TEST_CASE("Ray casting agrees with the winding number for simple polygons") {
  RandomSimplePolygonGenerator generator;

  int inside = 0;
  int outside = 0;
  for (int polygonIndex = 0; polygonIndex < 25; ++polygonIndex) {
    const std::vector<glm::dvec3> polygon = generator(3, 24);

    for (int pointIndex = 0; pointIndex < 1000; ++pointIndex) {
      const glm::dvec3 point = generator.pointNear(polygon);
      const bool byRayCast = PointInPolygon::contains(point, polygon);
      const bool byWinding =
          PointInPolygon::containsByWindingNumber(point, polygon);
      if (byRayCast != byWinding) {
        FAIL(
            "Polygon " << polygonIndex << " disagrees at (" << point.x << ", "
                       << point.y << ")");
      }
      if (byRayCast) {
        ++inside;
      } else {
        ++outside;
      }
    }
  }

  CHECK(inside > 0);
  CHECK(outside > 0);
}
