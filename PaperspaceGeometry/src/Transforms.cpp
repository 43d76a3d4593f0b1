#include <PaperspaceGeometry/Transforms.h>

#include <glm/ext/matrix_double4x4.hpp>
#include <glm/ext/matrix_transform.hpp>
#include <glm/ext/vector_double3.hpp>
#include <glm/ext/vector_double4.hpp>
#include <glm/geometric.hpp>

#include <cmath>
#include <stdexcept>

namespace PaperspaceGeometry {

namespace {
// Threshold of the arbitrary axis algorithm.
constexpr double ARBITRARY_AXIS_LIMIT = 1.0 / 64.0;

bool isFinite(const glm::dvec3& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
} // namespace

glm::dmat4 Transforms::createPlaneToWorldMatrix(const glm::dvec3& normal) {
  if (!isFinite(normal)) {
    throw std::invalid_argument("Plane normal must be finite.");
  }

  const double length = glm::length(normal);
  if (length == 0.0) {
    throw std::invalid_argument("Plane normal must not have zero length.");
  }

  const glm::dvec3 zAxis = normal / length;

  glm::dvec3 xAxis;
  if (std::abs(zAxis.x) < ARBITRARY_AXIS_LIMIT &&
      std::abs(zAxis.y) < ARBITRARY_AXIS_LIMIT) {
    xAxis = glm::normalize(glm::cross(glm::dvec3(0.0, 1.0, 0.0), zAxis));
  } else {
    xAxis = glm::normalize(glm::cross(glm::dvec3(0.0, 0.0, 1.0), zAxis));
  }

  const glm::dvec3 yAxis = glm::cross(zAxis, xAxis);

  return glm::dmat4(
      glm::dvec4(xAxis, 0.0),
      glm::dvec4(yAxis, 0.0),
      glm::dvec4(zAxis, 0.0),
      glm::dvec4(0.0, 0.0, 0.0, 1.0));
}

glm::dmat4 Transforms::createRotationMatrix(
    double angle,
    const glm::dvec3& axis,
    const glm::dvec3& pivot) {
  const double length = glm::length(axis);
  if (length == 0.0 || !std::isfinite(length)) {
    throw std::invalid_argument("Rotation axis must be finite and non-zero.");
  }

  const glm::dmat4 identity(1.0);
  return glm::translate(identity, pivot) *
         glm::rotate(identity, angle, axis / length) *
         glm::translate(identity, -pivot);
}

glm::dmat4
Transforms::createScaleMatrix(double factor, const glm::dvec3& pivot) noexcept {
  const glm::dmat4 identity(1.0);
  return glm::translate(identity, pivot) *
         glm::scale(identity, glm::dvec3(factor)) *
         glm::translate(identity, -pivot);
}

glm::dmat4
Transforms::createTranslationMatrix(const glm::dvec3& offset) noexcept {
  return glm::translate(glm::dmat4(1.0), offset);
}

glm::dvec3 Transforms::transformPosition(
    const glm::dmat4& matrix,
    const glm::dvec3& position) noexcept {
  return glm::dvec3(matrix * glm::dvec4(position, 1.0));
}

} // namespace PaperspaceGeometry
