#include <PaperspaceGeometry/AxisAlignedBox.h>

#include <glm/common.hpp>
#include <glm/ext/vector_double3.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace PaperspaceGeometry {
/*static*/ std::optional<AxisAlignedBox>
AxisAlignedBox::fromPositions(const std::vector<glm::dvec3>& positions) {
  if (positions.empty()) {
    return std::nullopt;
  }

  glm::dvec3 min = positions[0];
  glm::dvec3 max = positions[0];

  for (size_t i = 1; i < positions.size(); i++) {
    min = glm::min(min, positions[i]);
    max = glm::max(max, positions[i]);
  }

  return AxisAlignedBox(min, max);
}
} // namespace PaperspaceGeometry
