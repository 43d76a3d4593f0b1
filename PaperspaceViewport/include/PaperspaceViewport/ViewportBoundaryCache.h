#pragma once

#include <PaperspaceViewport/Library.h>
#include <PaperspaceViewport/ObjectId.h>
#include <PaperspaceViewport/ViewportDescriptor.h>

#include <glm/vec3.hpp>
#include <spdlog/fwd.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace PaperspaceViewport {

class IReadSession;
class ViewportFootprintExtractor;

/**
 * @brief A summary of the contents of a {@link ViewportBoundaryCache}.
 */
struct PAPERSPACEVIEWPORT_API ViewportBoundaryCacheStatistics {
  /**
   * @brief The number of cached footprints.
   */
  size_t totalEntries = 0;

  /**
   * @brief The mean number of vertices per cached footprint, or zero if the
   * cache is empty.
   */
  double averageVertexCount = 0.0;

  /**
   * @brief The number of cached footprints for each layout.
   */
  std::map<std::string, size_t> entriesPerLayout;
};

/**
 * @brief Caches viewport footprints so that sheets with many annotations do
 * not recompute the same footprint for each one.
 *
 * Entries are keyed by layout name and viewport id. An entry is reused only
 * while every viewport parameter that affects the footprint is unchanged;
 * otherwise it is recomputed. All methods are thread-safe.
 */
class PAPERSPACEVIEWPORT_API ViewportBoundaryCache final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param pExtractor The extractor used to compute footprints on a miss.
   * @param pLogger The logger.
   */
  ViewportBoundaryCache(
      std::shared_ptr<const ViewportFootprintExtractor> pExtractor,
      const std::shared_ptr<spdlog::logger>& pLogger);

  /**
   * @brief Gets the footprint of a viewport, computing and storing it if it
   * is not cached or its parameters have changed.
   *
   * Exceptions thrown by {@link ViewportFootprintExtractor::extract}
   * propagate and nothing is stored. Empty footprints are returned but not
   * stored.
   *
   * @param layoutName The name of the layout the viewport is on.
   * @param viewport The viewport.
   * @param pSession An open read session to use on a miss, or `nullptr`.
   * @return A copy of the footprint.
   */
  std::vector<glm::dvec3> getOrCompute(
      const std::string& layoutName,
      const ViewportDescriptor& viewport,
      IReadSession* pSession = nullptr);

  /**
   * @brief Removes every entry of the given layout.
   *
   * @return The number of entries removed.
   */
  size_t invalidateLayout(const std::string& layoutName);

  /**
   * @brief Removes the entry of one viewport.
   *
   * @return The number of entries removed, zero or one.
   */
  size_t invalidateViewport(const std::string& layoutName, ObjectId viewportId);

  /**
   * @brief Removes every entry.
   */
  void clear();

  /**
   * @brief Summarizes the current contents.
   */
  ViewportBoundaryCacheStatistics getStatistics() const;

private:
  struct Entry {
    ViewportDescriptor viewport;
    std::vector<glm::dvec3> footprint;
  };

  using Key = std::pair<std::string, uint64_t>;

  std::shared_ptr<const ViewportFootprintExtractor> _pExtractor;
  std::shared_ptr<spdlog::logger> _pLogger;

  mutable std::mutex _mutex;
  std::map<Key, Entry> _entries;
};

} // namespace PaperspaceViewport
