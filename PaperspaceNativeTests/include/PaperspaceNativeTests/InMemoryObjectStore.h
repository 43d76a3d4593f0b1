#pragma once

#include <PaperspaceViewport/ClipBoundarySource.h>
#include <PaperspaceViewport/IObjectStore.h>
#include <PaperspaceViewport/IReadSession.h>
#include <PaperspaceViewport/ObjectId.h>

#include <glm/vec3.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>

namespace PaperspaceNativeTests {

/**
 * @brief An object store backed by maps, which records how many sessions it
 * has opened and how many are still open.
 *
 * Reading an id that was never added throws `std::out_of_range`. Ids added
 * with {@link addFailingRecord} throw `std::runtime_error` when read.
 * Records added with {@link addNonVertexRecord} resolve as non-vertices.
 */
class InMemoryObjectStore : public PaperspaceViewport::IObjectStore {
public:
  void addClipBoundary(
      PaperspaceViewport::ObjectId id,
      PaperspaceViewport::ClipBoundarySource source);
  void addVertex(PaperspaceViewport::ObjectId id, const glm::dvec3& position);
  void addNonVertexRecord(PaperspaceViewport::ObjectId id);
  void addFailingRecord(PaperspaceViewport::ObjectId id);

  std::unique_ptr<PaperspaceViewport::IReadSession> beginReadSession() override;

  int openSessions() const noexcept { return this->_openSessions; }
  int sessionsOpened() const noexcept { return this->_sessionsOpened; }

private:
  class Session;

  std::map<uint64_t, PaperspaceViewport::ClipBoundarySource> _clipBoundaries;
  std::map<uint64_t, std::optional<glm::dvec3>> _vertices;
  std::set<uint64_t> _failing;
  std::atomic<int> _openSessions{0};
  std::atomic<int> _sessionsOpened{0};
};

} // namespace PaperspaceNativeTests
