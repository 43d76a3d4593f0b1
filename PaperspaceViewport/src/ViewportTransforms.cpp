#include <PaperspaceGeometry/Transforms.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportTransforms.h>

#include <glm/ext/matrix_double4x4.hpp>
#include <glm/ext/vector_double2.hpp>
#include <glm/ext/vector_double3.hpp>

#include <cmath>
#include <stdexcept>

using namespace PaperspaceGeometry;

namespace PaperspaceViewport {

namespace {
bool isFinite(const glm::dvec2& v) {
  return std::isfinite(v.x) && std::isfinite(v.y);
}

bool isFinite(const glm::dvec3& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
} // namespace

glm::dmat4 ViewportTransforms::createSheetToCameraMatrix(
    const ViewportDescriptor& viewport) {
  if (viewport.customScale == 0.0) {
    throw std::invalid_argument("Viewport custom scale must not be zero.");
  }

  if (!std::isfinite(viewport.customScale) ||
      !isFinite(viewport.centerPoint) || !isFinite(viewport.viewCenter)) {
    throw std::invalid_argument(
        "Viewport center, view center and custom scale must be finite.");
  }

  const glm::dvec3 centerPoint(viewport.centerPoint, 0.0);
  const glm::dvec3 centerToViewCenter(
      viewport.viewCenter - viewport.centerPoint,
      0.0);

  return Transforms::createTranslationMatrix(centerToViewCenter) *
         Transforms::createScaleMatrix(1.0 / viewport.customScale, centerPoint);
}

glm::dmat4 ViewportTransforms::createCameraToWorldMatrix(
    const ViewportDescriptor& viewport) {
  if (!std::isfinite(viewport.twistAngle) || !isFinite(viewport.viewTarget)) {
    throw std::invalid_argument(
        "Viewport view target and twist angle must be finite.");
  }

  // Validates the view direction.
  const glm::dmat4 planeToWorld =
      Transforms::createPlaneToWorldMatrix(viewport.viewDirection);

  return Transforms::createRotationMatrix(
             -viewport.twistAngle,
             viewport.viewDirection,
             viewport.viewTarget) *
         Transforms::createTranslationMatrix(viewport.viewTarget) *
         planeToWorld;
}

glm::dmat4 ViewportTransforms::compose(
    const glm::dmat4& first,
    const glm::dmat4& second) noexcept {
  return first * second;
}

glm::dmat4 ViewportTransforms::createSheetToWorldMatrix(
    const ViewportDescriptor& viewport) {
  return ViewportTransforms::compose(
      ViewportTransforms::createCameraToWorldMatrix(viewport),
      ViewportTransforms::createSheetToCameraMatrix(viewport));
}

} // namespace PaperspaceViewport
