#include <PaperspaceViewport/IReadSession.h>
#include <PaperspaceViewport/ViewportBoundaryCache.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportFootprintExtractor.h>

#include <glm/ext/vector_double3.hpp>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace PaperspaceViewport {

namespace {
bool hasSameFootprintParameters(
    const ViewportDescriptor& a,
    const ViewportDescriptor& b) noexcept {
  return a.centerPoint == b.centerPoint && a.width == b.width &&
         a.height == b.height && a.viewCenter == b.viewCenter &&
         a.viewTarget == b.viewTarget && a.viewDirection == b.viewDirection &&
         a.twistAngle == b.twistAngle && a.customScale == b.customScale &&
         a.nonRectangularClip == b.nonRectangularClip &&
         a.clipBoundaryId == b.clipBoundaryId;
}
} // namespace

ViewportBoundaryCache::ViewportBoundaryCache(
    std::shared_ptr<const ViewportFootprintExtractor> pExtractor,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _pExtractor(std::move(pExtractor)),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()),
      _mutex(),
      _entries() {
  if (!this->_pExtractor) {
    throw std::invalid_argument("A footprint extractor is required.");
  }
}

std::vector<glm::dvec3> ViewportBoundaryCache::getOrCompute(
    const std::string& layoutName,
    const ViewportDescriptor& viewport,
    IReadSession* pSession) {
  Key key{layoutName, viewport.id.handle};

  std::lock_guard<std::mutex> lock(this->_mutex);

  auto it = this->_entries.find(key);
  if (it != this->_entries.end()) {
    if (hasSameFootprintParameters(it->second.viewport, viewport)) {
      SPDLOG_LOGGER_DEBUG(
          this->_pLogger,
          "Viewport boundary cache hit: {}:{} ({} vertices)",
          layoutName,
          viewport.id.handle,
          it->second.footprint.size());
      return it->second.footprint;
    }

    SPDLOG_LOGGER_DEBUG(
        this->_pLogger,
        "Viewport boundary cache entry invalidated by a parameter change: "
        "{}:{}",
        layoutName,
        viewport.id.handle);
    this->_entries.erase(it);
  } else {
    SPDLOG_LOGGER_DEBUG(
        this->_pLogger,
        "Viewport boundary cache miss: {}:{}",
        layoutName,
        viewport.id.handle);
  }

  const auto start = std::chrono::steady_clock::now();
  std::vector<glm::dvec3> footprint =
      this->_pExtractor->extract(viewport, pSession);
  const std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - start;

  if (footprint.empty()) {
    SPDLOG_LOGGER_WARN(
        this->_pLogger,
        "Viewport {} on layout {} has an empty footprint; not caching it.",
        viewport.id.handle,
        layoutName);
    return footprint;
  }

  this->_entries.emplace(std::move(key), Entry{viewport, footprint});

  SPDLOG_LOGGER_INFO(
      this->_pLogger,
      "Viewport boundary cache stored {}:{} ({} vertices, {:.1f}ms)",
      layoutName,
      viewport.id.handle,
      footprint.size(),
      elapsed.count());

  return footprint;
}

size_t ViewportBoundaryCache::invalidateLayout(const std::string& layoutName) {
  std::lock_guard<std::mutex> lock(this->_mutex);

  size_t removed = 0;
  auto it = this->_entries.lower_bound(Key{layoutName, 0});
  while (it != this->_entries.end() && it->first.first == layoutName) {
    it = this->_entries.erase(it);
    ++removed;
  }

  if (removed > 0) {
    SPDLOG_LOGGER_DEBUG(
        this->_pLogger,
        "Invalidated {} viewport boundary cache entries for layout {}",
        removed,
        layoutName);
  }

  return removed;
}

size_t ViewportBoundaryCache::invalidateViewport(
    const std::string& layoutName,
    ObjectId viewportId) {
  std::lock_guard<std::mutex> lock(this->_mutex);
  const size_t removed =
      this->_entries.erase(Key{layoutName, viewportId.handle});

  if (removed > 0) {
    SPDLOG_LOGGER_DEBUG(
        this->_pLogger,
        "Invalidated viewport boundary cache entry {}:{}",
        layoutName,
        viewportId.handle);
  }

  return removed;
}

void ViewportBoundaryCache::clear() {
  std::lock_guard<std::mutex> lock(this->_mutex);
  const size_t count = this->_entries.size();
  this->_entries.clear();
  SPDLOG_LOGGER_INFO(
      this->_pLogger,
      "Cleared {} viewport boundary cache entries",
      count);
}

ViewportBoundaryCacheStatistics ViewportBoundaryCache::getStatistics() const {
  std::lock_guard<std::mutex> lock(this->_mutex);

  ViewportBoundaryCacheStatistics statistics;
  statistics.totalEntries = this->_entries.size();

  size_t totalVertices = 0;
  for (const auto& [key, entry] : this->_entries) {
    totalVertices += entry.footprint.size();
    ++statistics.entriesPerLayout[key.first];
  }

  if (statistics.totalEntries > 0) {
    statistics.averageVertexCount =
        static_cast<double>(totalVertices) /
        static_cast<double>(statistics.totalEntries);
  }

  return statistics;
}

} // namespace PaperspaceViewport
