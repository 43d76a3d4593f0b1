#pragma once

#include <PaperspaceUtility/Result.h>
#include <PaperspaceViewport/Library.h>
#include <PaperspaceViewport/ObjectId.h>

#include <glm/vec3.hpp>
#include <spdlog/fwd.h>

#include <memory>
#include <vector>

namespace PaperspaceViewport {

class IReadSession;
class ViewportFootprintExtractor;
struct ViewportDescriptor;

/**
 * @brief An annotation placed in the scene, such as a note leader or a
 * tagged block.
 */
struct PAPERSPACEVIEWPORT_API SheetAnnotation {
  /**
   * @brief The id of the annotation record.
   */
  ObjectId id;

  /**
   * @brief The annotation's anchor point, in world coordinates.
   */
  glm::dvec3 location{0.0, 0.0, 0.0};
};

/**
 * @brief The annotations found inside one viewport's footprint.
 */
struct PAPERSPACEVIEWPORT_API ViewportAnnotations {
  /**
   * @brief The id of the viewport.
   */
  ObjectId viewportId;

  /**
   * @brief The annotations inside the viewport, in input order.
   */
  std::vector<SheetAnnotation> annotations;
};

/**
 * @brief Decides which annotations each viewport on a sheet shows.
 */
class PAPERSPACEVIEWPORT_API AnnotationLocator final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param pExtractor The extractor that computes footprints and performs
   * the containment tests.
   * @param pLogger The logger.
   */
  AnnotationLocator(
      std::shared_ptr<const ViewportFootprintExtractor> pExtractor,
      const std::shared_ptr<spdlog::logger>& pLogger);

  /**
   * @brief Returns the annotations whose location lies inside a footprint.
   *
   * A footprint with fewer than three vertices contains nothing.
   */
  std::vector<SheetAnnotation> filterInFootprint(
      const std::vector<SheetAnnotation>& annotations,
      const std::vector<glm::dvec3>& footprint) const;

  /**
   * @brief Finds the annotations inside each of a set of viewports.
   *
   * A viewport whose clip boundary has an unsupported shape is skipped with a
   * warning. A viewport whose footprint cannot be computed is skipped with an
   * error describing the cause. Invalid viewport parameters are programming
   * errors and propagate as `std::invalid_argument`.
   *
   * @param viewports The viewports.
   * @param annotations The annotations to locate.
   * @param pSession An open read session to use for clip boundaries, or
   * `nullptr`.
   * @return One entry per viewport that could be processed, in input order.
   * The value is always present.
   */
  PaperspaceUtility::Result<std::vector<ViewportAnnotations>> locate(
      const std::vector<ViewportDescriptor>& viewports,
      const std::vector<SheetAnnotation>& annotations,
      IReadSession* pSession = nullptr) const;

private:
  std::shared_ptr<const ViewportFootprintExtractor> _pExtractor;
  std::shared_ptr<spdlog::logger> _pLogger;
};

} // namespace PaperspaceViewport
