#pragma once

#include <PaperspaceViewport/Library.h>
#include <PaperspaceViewport/ObjectId.h>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <optional>

namespace PaperspaceViewport {

/**
 * @brief A snapshot of the stored parameters of a viewport on a sheet.
 *
 * Everything needed to map the viewport into world coordinates is captured
 * here, so that footprints can be computed for any viewport without making it
 * the current one.
 */
struct PAPERSPACEVIEWPORT_API ViewportDescriptor final {
  /**
   * @brief The id of the viewport itself. Only used to key caches.
   */
  ObjectId id;

  /**
   * @brief The center of the viewport window, in sheet coordinates.
   */
  glm::dvec2 centerPoint{0.0, 0.0};

  /**
   * @brief The width of the viewport window, in sheet units.
   */
  double width = 0.0;

  /**
   * @brief The height of the viewport window, in sheet units.
   */
  double height = 0.0;

  /**
   * @brief The center of the view, in camera coordinates.
   */
  glm::dvec2 viewCenter{0.0, 0.0};

  /**
   * @brief The point the camera looks at, in world coordinates.
   */
  glm::dvec3 viewTarget{0.0, 0.0, 0.0};

  /**
   * @brief The viewing direction, in world coordinates. It does not need to
   * be normalized but must not have zero length.
   */
  glm::dvec3 viewDirection{0.0, 0.0, 1.0};

  /**
   * @brief The twist of the view about the viewing direction, in radians.
   */
  double twistAngle = 0.0;

  /**
   * @brief The number of sheet units per camera unit. Must not be zero.
   */
  double customScale = 1.0;

  /**
   * @brief Whether the viewport is clipped to a non-rectangular boundary.
   */
  bool nonRectangularClip = false;

  /**
   * @brief The entity describing the clip boundary, if any.
   */
  std::optional<ObjectId> clipBoundaryId;

  /**
   * @brief Returns true if the footprint must be taken from the clip boundary
   * rather than from the viewport rectangle.
   */
  bool hasClipBoundary() const noexcept {
    return this->nonRectangularClip && this->clipBoundaryId &&
           this->clipBoundaryId->isValid();
  }
};

} // namespace PaperspaceViewport
