#include <PaperspaceGeometry/PointInPolygon.h>
#include <PaperspaceUtility/Math.h>

#include <glm/ext/vector_double3.hpp>

#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

using namespace PaperspaceUtility;

namespace PaperspaceGeometry {

namespace {
void validatePolygon(const std::vector<glm::dvec3>& polygon) {
  if (polygon.size() < 3) {
    throw std::invalid_argument("Polygon must have at least 3 vertices.");
  }
}

// Positive if (x, y) is left of the directed edge, negative if right, zero if
// on the line through it.
double isLeft(
    double x1,
    double y1,
    double x2,
    double y2,
    double x,
    double y) noexcept {
  return (x2 - x1) * (y - y1) - (x - x1) * (y2 - y1);
}

bool rayCast(
    double x,
    double y,
    const std::vector<glm::dvec3>& polygon) noexcept {
  const size_t count = polygon.size();
  bool inside = false;

  for (size_t i = 0; i < count; ++i) {
    const glm::dvec3& current = polygon[i];
    const glm::dvec3& next = polygon[(i + 1) % count];

    const double x1 = current.x;
    const double y1 = current.y;
    const double x2 = next.x;
    const double y2 = next.y;

    // The interval test guarantees y1 != y2 before the division.
    if (((y1 < y && y <= y2) || (y2 < y && y <= y1)) &&
        (x < x1 + ((y - y1) / (y2 - y1)) * (x2 - x1))) {
      inside = !inside;
    }
  }

  return inside;
}

int winding(
    double x,
    double y,
    const std::vector<glm::dvec3>& polygon) noexcept {
  const size_t count = polygon.size();
  int result = 0;

  for (size_t i = 0; i < count; ++i) {
    const glm::dvec3& current = polygon[i];
    const glm::dvec3& next = polygon[(i + 1) % count];

    if (current.y <= y) {
      if (next.y > y &&
          isLeft(current.x, current.y, next.x, next.y, x, y) > 0.0) {
        ++result;
      }
    } else if (
        next.y <= y &&
        isLeft(current.x, current.y, next.x, next.y, x, y) < 0.0) {
      --result;
    }
  }

  return result;
}

bool classify(
    double x,
    double y,
    const std::vector<glm::dvec3>& polygon,
    PointInPolygon::Rule rule) noexcept {
  if (rule == PointInPolygon::Rule::NonZero) {
    return winding(x, y, polygon) != 0;
  }
  return rayCast(x, y, polygon);
}
} // namespace

bool PointInPolygon::contains(
    const glm::dvec3& point,
    const std::vector<glm::dvec3>& polygon) {
  validatePolygon(polygon);
  return rayCast(point.x, point.y, polygon);
}

int PointInPolygon::windingNumber(
    const glm::dvec3& point,
    const std::vector<glm::dvec3>& polygon) {
  validatePolygon(polygon);
  return winding(point.x, point.y, polygon);
}

bool PointInPolygon::containsByWindingNumber(
    const glm::dvec3& point,
    const std::vector<glm::dvec3>& polygon) {
  return PointInPolygon::windingNumber(point, polygon) != 0;
}

bool PointInPolygon::containsWithTolerance(
    const glm::dvec3& point,
    const std::vector<glm::dvec3>& polygon,
    double tolerance,
    Rule rule) {
  validatePolygon(polygon);

  if (tolerance < 0.0) {
    throw std::invalid_argument("Tolerance must not be negative.");
  }

  if (tolerance < Math::Epsilon12) {
    return classify(point.x, point.y, polygon, rule);
  }

  const std::array<glm::dvec3, 5> samples{
      point,
      glm::dvec3(point.x + tolerance, point.y, point.z),
      glm::dvec3(point.x - tolerance, point.y, point.z),
      glm::dvec3(point.x, point.y + tolerance, point.z),
      glm::dvec3(point.x, point.y - tolerance, point.z)};

  for (const glm::dvec3& sample : samples) {
    if (classify(sample.x, sample.y, polygon, rule)) {
      return true;
    }
  }

  return false;
}

} // namespace PaperspaceGeometry
