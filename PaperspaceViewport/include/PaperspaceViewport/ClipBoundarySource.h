#pragma once

#include <PaperspaceViewport/ObjectId.h>

#include <glm/vec3.hpp>

#include <string>
#include <variant>
#include <vector>

namespace PaperspaceViewport {

/**
 * @brief A polyline that stores its vertex positions inline.
 */
struct LightweightPolyline {
  /**
   * @brief The vertex positions in sheet coordinates, in stored order.
   */
  std::vector<glm::dvec3> vertices;
};

/**
 * @brief A legacy 2D polyline whose vertices are separate records.
 */
struct Polyline2d {
  /**
   * @brief The ids of the vertex records, in stored order.
   */
  std::vector<ObjectId> vertexIds;
};

/**
 * @brief A 3D polyline whose vertices are separate records.
 */
struct Polyline3d {
  /**
   * @brief The ids of the vertex records, in stored order.
   */
  std::vector<ObjectId> vertexIds;
};

/**
 * @brief A clip boundary entity of a shape that cannot bound a viewport.
 */
struct UnsupportedClipEntity {
  /**
   * @brief The name of the entity's type, as reported by the object store.
   */
  std::string entityType;
};

/**
 * @brief The entity a clipped viewport uses as its boundary.
 *
 * Consumers must handle every alternative, including
 * {@link UnsupportedClipEntity}.
 */
using ClipBoundarySource = std::variant<
    LightweightPolyline,
    Polyline2d,
    Polyline3d,
    UnsupportedClipEntity>;

} // namespace PaperspaceViewport
