#pragma once

#include <PaperspaceGeometry/Library.h>

#include <glm/vec3.hpp>

#include <optional>
#include <vector>

namespace PaperspaceGeometry {

/**
 * @brief The axis-aligned bounds of a footprint in world coordinates.
 */
class PAPERSPACEGEOMETRY_API AxisAlignedBox final {
public:
  constexpr AxisAlignedBox(
      const glm::dvec3& minimum,
      const glm::dvec3& maximum) noexcept
      : _minimum(minimum), _maximum(maximum) {}

  constexpr const glm::dvec3& getMinimum() const noexcept {
    return this->_minimum;
  }

  constexpr const glm::dvec3& getMaximum() const noexcept {
    return this->_maximum;
  }

  /**
   * @brief Creates the tightest box containing all of the given positions.
   *
   * @param positions The positions, for example the vertices of a viewport
   * footprint.
   * @returns The box, or `std::nullopt` if `positions` is empty.
   */
  static std::optional<AxisAlignedBox>
  fromPositions(const std::vector<glm::dvec3>& positions);

private:
  glm::dvec3 _minimum;
  glm::dvec3 _maximum;
};

} // namespace PaperspaceGeometry
