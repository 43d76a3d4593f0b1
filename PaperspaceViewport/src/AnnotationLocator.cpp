#include <PaperspaceUtility/ErrorList.h>
#include <PaperspaceUtility/Result.h>
#include <PaperspaceViewport/AnnotationLocator.h>
#include <PaperspaceViewport/IReadSession.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportExceptions.h>
#include <PaperspaceViewport/ViewportFootprintExtractor.h>

#include <glm/ext/vector_double3.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace PaperspaceUtility;

namespace PaperspaceViewport {

AnnotationLocator::AnnotationLocator(
    std::shared_ptr<const ViewportFootprintExtractor> pExtractor,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _pExtractor(std::move(pExtractor)),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()) {
  if (!this->_pExtractor) {
    throw std::invalid_argument("A footprint extractor is required.");
  }
}

std::vector<SheetAnnotation> AnnotationLocator::filterInFootprint(
    const std::vector<SheetAnnotation>& annotations,
    const std::vector<glm::dvec3>& footprint) const {
  std::vector<SheetAnnotation> result;

  if (footprint.size() < 3) {
    SPDLOG_LOGGER_WARN(
        this->_pLogger,
        "Footprint with {} vertices cannot contain annotations",
        footprint.size());
    return result;
  }

  for (const SheetAnnotation& annotation : annotations) {
    if (this->_pExtractor->isPointInFootprint(footprint, annotation.location)) {
      result.emplace_back(annotation);
    }
  }

  SPDLOG_LOGGER_DEBUG(
      this->_pLogger,
      "{} of {} annotations are inside the footprint",
      result.size(),
      annotations.size());

  return result;
}

Result<std::vector<ViewportAnnotations>> AnnotationLocator::locate(
    const std::vector<ViewportDescriptor>& viewports,
    const std::vector<SheetAnnotation>& annotations,
    IReadSession* pSession) const {
  std::vector<ViewportAnnotations> located;
  located.reserve(viewports.size());
  ErrorList errors;

  for (const ViewportDescriptor& viewport : viewports) {
    std::vector<glm::dvec3> footprint;
    try {
      footprint = this->_pExtractor->extract(viewport, pSession);
    } catch (const UnsupportedGeometryException& e) {
      errors.emplaceWarning(fmt::format(
          "Skipped viewport {}: {}",
          viewport.id.handle,
          e.what()));
      continue;
    } catch (const TransformFailureException& e) {
      errors.emplaceError(fmt::format(
          "Skipped viewport {}: {}",
          viewport.id.handle,
          formatNestedException(e)));
      continue;
    }

    located.emplace_back(ViewportAnnotations{
        viewport.id,
        this->filterInFootprint(annotations, footprint)});
  }

  errors.log(
      this->_pLogger,
      "Problems while locating annotations in viewports");

  SPDLOG_LOGGER_INFO(
      this->_pLogger,
      "Located annotations in {} of {} viewports",
      located.size(),
      viewports.size());

  return Result<std::vector<ViewportAnnotations>>(
      std::move(located),
      std::move(errors));
}

} // namespace PaperspaceViewport
