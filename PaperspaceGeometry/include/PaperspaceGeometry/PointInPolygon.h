#pragma once

#include <PaperspaceGeometry/Library.h>

#include <glm/vec3.hpp>

#include <vector>

namespace PaperspaceGeometry {

/**
 * @brief Point containment tests against a closed polygon in the XY plane.
 *
 * The polygon is an ordered list of vertices where vertex `i` connects to
 * vertex `(i + 1) % n`. Z coordinates are ignored. All functions throw
 * `std::invalid_argument` if the polygon has fewer than 3 vertices.
 */
class PAPERSPACEGEOMETRY_API PointInPolygon final {
public:
  /**
   * @brief The rule deciding which points a polygon contains.
   */
  enum class Rule {
    /** @brief Inside when a ray toward +X crosses an odd number of edges. */
    EvenOdd,

    /** @brief Inside when the winding number is nonzero. */
    NonZero
  };

  /**
   * @brief Determines whether a point is inside a polygon by casting a ray
   * toward +X and counting the edges it crosses.
   *
   * An edge is crossed when the point's Y lies in the half-open interval
   * between the edge's endpoint Y values, excluding the lower end and
   * including the upper end, and the edge's X at that height is strictly
   * greater than the point's X. A ray through a vertex shared by two edges is
   * therefore counted once.
   *
   * @param point The point to test.
   * @param polygon The polygon vertices, in order.
   * @return Whether the point is inside the polygon.
   */
  static bool
  contains(const glm::dvec3& point, const std::vector<glm::dvec3>& polygon);

  /**
   * @brief Computes the winding number of the polygon around a point.
   *
   * Upward edges (`y1 <= y < y2`) with the point strictly to their left add
   * one; downward edges (`y2 <= y < y1`) with the point strictly to their
   * right subtract one.
   *
   * @param point The point to test.
   * @param polygon The polygon vertices, in order.
   * @return The winding number. Zero means the point is outside.
   */
  static int windingNumber(
      const glm::dvec3& point,
      const std::vector<glm::dvec3>& polygon);

  /**
   * @brief Determines whether a point is inside a polygon using the nonzero
   * winding rule. For simple polygons this agrees with {@link contains}.
   */
  static bool containsByWindingNumber(
      const glm::dvec3& point,
      const std::vector<glm::dvec3>& polygon);

  /**
   * @brief Determines whether a point, or any of four points offset from it
   * by `tolerance` along +X, -X, +Y and -Y, is inside a polygon.
   *
   * This absorbs the small drift introduced when footprint vertices are
   * computed through a chain of rotations and scales. A tolerance smaller
   * than 1e-12 performs only the exact test.
   *
   * @param point The point to test.
   * @param polygon The polygon vertices, in order.
   * @param tolerance The offset distance. Must not be negative.
   * @param rule The rule each tested point is classified with.
   * @return Whether any tested point is inside the polygon.
   * @throws std::invalid_argument if `tolerance` is negative.
   */
  static bool containsWithTolerance(
      const glm::dvec3& point,
      const std::vector<glm::dvec3>& polygon,
      double tolerance,
      Rule rule = Rule::EvenOdd);
};

} // namespace PaperspaceGeometry
