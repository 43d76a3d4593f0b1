#pragma once

#include <PaperspaceUtility/Math.h>

#include <glm/common.hpp>
#include <glm/vec3.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace PaperspaceNativeTests {

// Produces random simple polygons in the XY plane. Use a constant seed in
// order to get a repeatable stream of polygons that can then be debugged!
//
// Each polygon is star-shaped about its center: vertex i sits at a jittered
// angle in the i-th of n equal sectors with a random radius. Consecutive
// vertices are less than pi apart as seen from the center, so edges never
// cross.
struct RandomSimplePolygonGenerator {
  std::mt19937 gen;
  std::uniform_real_distribution<double> unit;

  RandomSimplePolygonGenerator() : unit(0.0, 1.0) { gen.seed(42); }

  std::vector<glm::dvec3> operator()(size_t minVertices, size_t maxVertices) {
    std::uniform_int_distribution<size_t> countDistribution(
        minVertices,
        maxVertices);
    const size_t count = countDistribution(gen);

    const glm::dvec3 center(
        (unit(gen) - 0.5) * 200.0,
        (unit(gen) - 0.5) * 200.0,
        0.0);

    const double sector = PaperspaceUtility::Math::TwoPi / double(count);
    std::vector<double> angles(count);
    for (size_t i = 0; i < count; ++i) {
      angles[i] = (double(i) + 0.4 * unit(gen)) * sector;
    }

    // Reverse half of the polygons so both windings are covered.
    if (unit(gen) < 0.5) {
      std::reverse(angles.begin(), angles.end());
    }

    std::vector<glm::dvec3> polygon;
    polygon.reserve(count);
    for (double angle : angles) {
      const double radius = 1.0 + unit(gen) * 49.0;
      polygon.emplace_back(
          center.x + radius * std::cos(angle),
          center.y + radius * std::sin(angle),
          0.0);
    }

    return polygon;
  }

  // A random point in the bounding square of a polygon, grown by a quarter
  // on each side so that a good share of the points fall outside.
  glm::dvec3 pointNear(const std::vector<glm::dvec3>& polygon) {
    glm::dvec3 min = polygon.front();
    glm::dvec3 max = polygon.front();
    for (const glm::dvec3& vertex : polygon) {
      min = glm::min(min, vertex);
      max = glm::max(max, vertex);
    }
    const glm::dvec3 margin = (max - min) * 0.25;
    min -= margin;
    max += margin;
    return glm::dvec3(
        min.x + unit(gen) * (max.x - min.x),
        min.y + unit(gen) * (max.y - min.y),
        0.0);
  }
};

} // namespace PaperspaceNativeTests
