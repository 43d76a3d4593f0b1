#pragma once

#include <PaperspaceViewport/ClipBoundarySource.h>
#include <PaperspaceViewport/Library.h>
#include <PaperspaceViewport/ObjectId.h>

#include <glm/vec3.hpp>

#include <optional>

namespace PaperspaceViewport {

/**
 * @brief Read-only access to the records of an object store.
 *
 * A session is released when it is destroyed. Implementations may throw any
 * exception derived from `std::exception` when a record cannot be read.
 */
class PAPERSPACEVIEWPORT_API IReadSession {
public:
  virtual ~IReadSession() = default;

  /**
   * @brief Resolves the clip boundary entity with the given id.
   *
   * @param id The id of the entity.
   * @return The entity's shape. Entities of other types are returned as
   * {@link UnsupportedClipEntity}.
   */
  virtual ClipBoundarySource resolveClipBoundary(ObjectId id) = 0;

  /**
   * @brief Resolves the position of a polyline vertex record.
   *
   * @param id The id of the vertex record.
   * @return The vertex position in sheet coordinates, or `std::nullopt` if
   * the record exists but is not a vertex.
   */
  virtual std::optional<glm::dvec3> resolveVertexPosition(ObjectId id) = 0;
};

} // namespace PaperspaceViewport
