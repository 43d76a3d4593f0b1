#include <PaperspaceGeometry/AxisAlignedBox.h>
#include <PaperspaceGeometry/PointInPolygon.h>
#include <PaperspaceGeometry/Transforms.h>
#include <PaperspaceViewport/ClipBoundarySource.h>
#include <PaperspaceViewport/IObjectStore.h>
#include <PaperspaceViewport/IReadSession.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportExceptions.h>
#include <PaperspaceViewport/ViewportFootprintExtractor.h>
#include <PaperspaceViewport/ViewportTransforms.h>

#include <glm/ext/matrix_double4x4.hpp>
#include <glm/ext/vector_double2.hpp>
#include <glm/ext/vector_double3.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

using namespace PaperspaceGeometry;

namespace PaperspaceViewport {

namespace {
// Sheet space is planar, so clip vertices are flattened onto it.
glm::dvec3 onSheet(const glm::dvec3& position) {
  return glm::dvec3(position.x, position.y, 0.0);
}

std::vector<glm::dvec3> readVertexRecords(
    IReadSession& session,
    const std::vector<ObjectId>& vertexIds) {
  std::vector<glm::dvec3> result;
  result.reserve(vertexIds.size());

  for (const ObjectId& vertexId : vertexIds) {
    // Records that are not vertices, such as the end-of-sequence marker, are
    // skipped.
    std::optional<glm::dvec3> maybePosition =
        session.resolveVertexPosition(vertexId);
    if (maybePosition) {
      result.emplace_back(onSheet(*maybePosition));
    }
  }

  return result;
}

std::vector<glm::dvec3> readClipVertices(
    IReadSession& session,
    const ClipBoundarySource& source) {
  struct Operation {
    IReadSession& session;

    std::vector<glm::dvec3> operator()(const LightweightPolyline& polyline) {
      std::vector<glm::dvec3> result;
      result.reserve(polyline.vertices.size());
      for (const glm::dvec3& vertex : polyline.vertices) {
        result.emplace_back(onSheet(vertex));
      }
      return result;
    }

    std::vector<glm::dvec3> operator()(const Polyline2d& polyline) {
      return readVertexRecords(session, polyline.vertexIds);
    }

    std::vector<glm::dvec3> operator()(const Polyline3d& polyline) {
      return readVertexRecords(session, polyline.vertexIds);
    }

    std::vector<glm::dvec3> operator()(const UnsupportedClipEntity& entity) {
      throw UnsupportedGeometryException(entity.entityType);
    }
  };

  return std::visit(Operation{session}, source);
}
} // namespace

ViewportFootprintExtractor::ViewportFootprintExtractor(
    std::shared_ptr<IObjectStore> pObjectStore,
    const ViewportFootprintOptions& options,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _pObjectStore(std::move(pObjectStore)),
      _options(options),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()) {
  if (!(this->_options.containmentTolerance >= 0.0)) {
    throw std::invalid_argument(
        "Containment tolerance must be zero or positive.");
  }
}

std::vector<glm::dvec3> ViewportFootprintExtractor::extract(
    const ViewportDescriptor& viewport,
    IReadSession* pSession) const {
  const glm::dmat4 sheetToWorld =
      ViewportTransforms::createSheetToWorldMatrix(viewport);

  if (viewport.hasClipBoundary()) {
    return this->extractClipBoundary(viewport, sheetToWorld, pSession);
  }

  const double halfWidth = viewport.width * 0.5;
  const double halfHeight = viewport.height * 0.5;
  const glm::dvec2& center = viewport.centerPoint;

  // Counter-clockwise from the bottom-left corner.
  const std::array<glm::dvec3, 4> corners{
      glm::dvec3(center.x - halfWidth, center.y - halfHeight, 0.0),
      glm::dvec3(center.x - halfWidth, center.y + halfHeight, 0.0),
      glm::dvec3(center.x + halfWidth, center.y + halfHeight, 0.0),
      glm::dvec3(center.x + halfWidth, center.y - halfHeight, 0.0)};

  std::vector<glm::dvec3> footprint;
  footprint.reserve(corners.size());
  for (const glm::dvec3& corner : corners) {
    footprint.emplace_back(Transforms::transformPosition(sheetToWorld, corner));
  }

  return footprint;
}

std::vector<glm::dvec3> ViewportFootprintExtractor::extractClipBoundary(
    const ViewportDescriptor& viewport,
    const glm::dmat4& sheetToWorld,
    IReadSession* pSession) const {
  const ObjectId clipBoundaryId = *viewport.clipBoundaryId;

  try {
    std::vector<glm::dvec3> sheetVertices;

    if (pSession) {
      sheetVertices = readClipVertices(
          *pSession,
          pSession->resolveClipBoundary(clipBoundaryId));
    } else {
      if (!this->_pObjectStore) {
        throw std::runtime_error(
            "No object store is available to read the clip boundary.");
      }

      // Released when this scope exits, whether or not reading succeeds.
      std::unique_ptr<IReadSession> pOwnedSession =
          this->_pObjectStore->beginReadSession();
      if (!pOwnedSession) {
        throw std::runtime_error("The object store did not open a session.");
      }

      sheetVertices = readClipVertices(
          *pOwnedSession,
          pOwnedSession->resolveClipBoundary(clipBoundaryId));
    }

    std::vector<glm::dvec3> footprint;
    footprint.reserve(sheetVertices.size());
    for (const glm::dvec3& vertex : sheetVertices) {
      footprint.emplace_back(
          Transforms::transformPosition(sheetToWorld, vertex));
    }

    SPDLOG_LOGGER_TRACE(
        this->_pLogger,
        "Viewport {} clip boundary {} produced {} footprint vertices",
        viewport.id.handle,
        clipBoundaryId.handle,
        footprint.size());

    return footprint;
  } catch (const UnsupportedGeometryException&) {
    throw;
  } catch (...) {
    std::throw_with_nested(TransformFailureException(fmt::format(
        "Failed to compute the footprint of viewport {} from clip boundary {}.",
        viewport.id.handle,
        clipBoundaryId.handle)));
  }
}

std::optional<AxisAlignedBox> ViewportFootprintExtractor::computeBounds(
    const ViewportDescriptor& viewport,
    IReadSession* pSession) const {
  return AxisAlignedBox::fromPositions(this->extract(viewport, pSession));
}

bool ViewportFootprintExtractor::isPointInViewport(
    const ViewportDescriptor& viewport,
    const glm::dvec3& point,
    IReadSession* pSession) const {
  return this->isPointInFootprint(this->extract(viewport, pSession), point);
}

bool ViewportFootprintExtractor::isPointInFootprint(
    const std::vector<glm::dvec3>& footprint,
    const glm::dvec3& point) const {
  if (footprint.size() < 3) {
    return false;
  }

  return PointInPolygon::containsWithTolerance(
      point,
      footprint,
      this->_options.containmentTolerance,
      this->_options.useWindingNumber ? PointInPolygon::Rule::NonZero
                                      : PointInPolygon::Rule::EvenOdd);
}

} // namespace PaperspaceViewport
