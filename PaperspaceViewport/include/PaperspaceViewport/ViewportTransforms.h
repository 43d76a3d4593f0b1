#pragma once

#include <PaperspaceViewport/Library.h>

#include <glm/fwd.hpp>

namespace PaperspaceViewport {

struct ViewportDescriptor;

/**
 * @brief Builds the matrices that carry sheet coordinates inside a viewport
 * into world coordinates.
 *
 * The matrices depend only on the stored viewport parameters, so they can be
 * built for any number of viewports without activating them. The full
 * mapping is `createCameraToWorldMatrix(v) * createSheetToCameraMatrix(v)`;
 * the order matters.
 */
struct PAPERSPACEVIEWPORT_API ViewportTransforms final {
  /**
   * @brief Creates the matrix from sheet coordinates to camera coordinates.
   *
   * Sheet points are scaled by `1 / customScale` about the viewport's center
   * point, then translated by the offset from the center point to the view
   * center.
   *
   * @param viewport The viewport.
   * @throws std::invalid_argument if the custom scale is zero or any
   * parameter is not finite.
   */
  static glm::dmat4
  createSheetToCameraMatrix(const ViewportDescriptor& viewport);

  /**
   * @brief Creates the matrix from camera coordinates to world coordinates.
   *
   * Camera points are first expressed in the world basis of the plane whose
   * normal is the view direction, then translated by the view target, then
   * rotated by the negated twist angle about the view direction through the
   * view target.
   *
   * @param viewport The viewport.
   * @throws std::invalid_argument if the view direction has zero length or
   * any parameter is not finite.
   */
  static glm::dmat4
  createCameraToWorldMatrix(const ViewportDescriptor& viewport);

  /**
   * @brief Composes two transforms. The result applies `second` first and
   * then `first`.
   */
  static glm::dmat4
  compose(const glm::dmat4& first, const glm::dmat4& second) noexcept;

  /**
   * @brief Creates the matrix from sheet coordinates straight to world
   * coordinates.
   */
  static glm::dmat4
  createSheetToWorldMatrix(const ViewportDescriptor& viewport);
};

} // namespace PaperspaceViewport
