#pragma once

#include <PaperspaceGeometry/AxisAlignedBox.h>
#include <PaperspaceViewport/Library.h>
#include <PaperspaceViewport/ViewportFootprintOptions.h>

#include <glm/fwd.hpp>
#include <glm/vec3.hpp>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <vector>

namespace PaperspaceViewport {

class IObjectStore;
class IReadSession;
struct ViewportDescriptor;

/**
 * @brief Computes the polygon a viewport exposes in world coordinates.
 *
 * The extractor holds no per-call state; one instance may be shared by any
 * number of threads as long as the object store can open concurrent
 * sessions, or each caller supplies its own session.
 */
class PAPERSPACEVIEWPORT_API ViewportFootprintExtractor final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param pObjectStore The store used to read clip boundaries when the
   * caller does not supply a session. May be `nullptr` if every clipped
   * viewport is extracted with a caller-supplied session.
   * @param options The options.
   * @param pLogger The logger.
   * @throws std::invalid_argument if the containment tolerance is negative.
   */
  ViewportFootprintExtractor(
      std::shared_ptr<IObjectStore> pObjectStore,
      const ViewportFootprintOptions& options,
      const std::shared_ptr<spdlog::logger>& pLogger);

  /**
   * @brief Gets the options.
   */
  const ViewportFootprintOptions& getOptions() const noexcept {
    return this->_options;
  }

  /**
   * @brief Computes the world-space footprint of a viewport.
   *
   * A viewport without a usable clip boundary yields its four corners in the
   * order bottom-left, top-left, top-right, bottom-right. A clipped viewport
   * yields the clip boundary's vertices in their stored order.
   *
   * If `pSession` is `nullptr` and the clip boundary must be read, a session
   * is opened from the object store and released before this method returns.
   * A supplied session is only borrowed.
   *
   * @param viewport The viewport.
   * @param pSession An open read session to use, or `nullptr`.
   * @return The footprint vertices in world coordinates.
   * @throws std::invalid_argument if the viewport parameters are invalid.
   * @throws UnsupportedGeometryException if the clip boundary has an
   * unsupported shape.
   * @throws TransformFailureException, with the cause nested, if the clip
   * boundary cannot be read.
   */
  std::vector<glm::dvec3> extract(
      const ViewportDescriptor& viewport,
      IReadSession* pSession = nullptr) const;

  /**
   * @brief Computes the bounding box of a viewport's footprint.
   *
   * Throws the same exceptions as {@link extract}.
   *
   * @return The box, or `std::nullopt` if the footprint has no vertices.
   */
  std::optional<PaperspaceGeometry::AxisAlignedBox> computeBounds(
      const ViewportDescriptor& viewport,
      IReadSession* pSession = nullptr) const;

  /**
   * @brief Determines whether a world-space point lies within a viewport's
   * footprint, using the configured containment tolerance.
   *
   * Throws the same exceptions as {@link extract}.
   *
   * @return Whether the point is inside. Always false for a footprint with
   * fewer than three vertices.
   */
  bool isPointInViewport(
      const ViewportDescriptor& viewport,
      const glm::dvec3& point,
      IReadSession* pSession = nullptr) const;

  /**
   * @brief Determines whether a world-space point lies within an already
   * computed footprint, using the configured containment tolerance.
   *
   * @return Whether the point is inside. Always false for a footprint with
   * fewer than three vertices.
   */
  bool isPointInFootprint(
      const std::vector<glm::dvec3>& footprint,
      const glm::dvec3& point) const;

private:
  std::vector<glm::dvec3> extractClipBoundary(
      const ViewportDescriptor& viewport,
      const glm::dmat4& sheetToWorld,
      IReadSession* pSession) const;

  std::shared_ptr<IObjectStore> _pObjectStore;
  ViewportFootprintOptions _options;
  std::shared_ptr<spdlog::logger> _pLogger;
};

} // namespace PaperspaceViewport
