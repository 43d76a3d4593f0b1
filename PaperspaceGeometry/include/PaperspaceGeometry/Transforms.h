#pragma once

#include <PaperspaceGeometry/Library.h>

#include <glm/fwd.hpp>

namespace PaperspaceGeometry {

/**
 * @brief Affine matrix construction helpers.
 *
 * All matrices are column-major `glm::dmat4` and act on column vectors, so
 * `a * b` applies `b` first.
 */
struct PAPERSPACEGEOMETRY_API Transforms final {
  /**
   * @brief Creates the matrix that maps coordinates in a plane, given by its
   * normal, into world coordinates.
   *
   * The in-plane axes are chosen with the arbitrary axis algorithm: when the
   * normal lies close to the world Z axis (both its X and Y components are
   * smaller than 1/64), the plane's X axis is `WorldY x N`, otherwise it is
   * `WorldZ x N`. The plane's Y axis is `N x X`. A normal of (0, 0, 1)
   * produces the identity.
   *
   * @param normal The plane normal. It does not need to be normalized.
   * @throws std::invalid_argument if the normal has zero length or is not
   * finite.
   */
  static glm::dmat4 createPlaneToWorldMatrix(const glm::dvec3& normal);

  /**
   * @brief Creates a matrix that rotates about an axis passing through a
   * pivot point.
   *
   * @param angle The angle in radians, counter-clockwise when looking down
   * the axis toward the pivot.
   * @param axis The rotation axis. It does not need to be normalized.
   * @param pivot The point the axis passes through.
   * @throws std::invalid_argument if the axis has zero length.
   */
  static glm::dmat4 createRotationMatrix(
      double angle,
      const glm::dvec3& axis,
      const glm::dvec3& pivot);

  /**
   * @brief Creates a matrix that scales uniformly about a pivot point.
   *
   * @param factor The scale factor.
   * @param pivot The point that stays fixed.
   */
  static glm::dmat4
  createScaleMatrix(double factor, const glm::dvec3& pivot) noexcept;

  /**
   * @brief Creates a translation matrix.
   */
  static glm::dmat4 createTranslationMatrix(const glm::dvec3& offset) noexcept;

  /**
   * @brief Applies an affine matrix to a position.
   */
  static glm::dvec3
  transformPosition(
      const glm::dmat4& matrix,
      const glm::dvec3& position) noexcept;
};

} // namespace PaperspaceGeometry
