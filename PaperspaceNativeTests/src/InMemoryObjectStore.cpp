#include <PaperspaceNativeTests/InMemoryObjectStore.h>

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

using namespace PaperspaceViewport;

namespace PaperspaceNativeTests {

class InMemoryObjectStore::Session : public IReadSession {
public:
  explicit Session(InMemoryObjectStore& store) : _store(store) {
    ++this->_store._openSessions;
    ++this->_store._sessionsOpened;
  }

  ~Session() override { --this->_store._openSessions; }

  ClipBoundarySource resolveClipBoundary(ObjectId id) override {
    this->checkFailing(id);
    auto it = this->_store._clipBoundaries.find(id.handle);
    if (it == this->_store._clipBoundaries.end()) {
      throw std::out_of_range(fmt::format("No record with id {}.", id.handle));
    }
    return it->second;
  }

  std::optional<glm::dvec3> resolveVertexPosition(ObjectId id) override {
    this->checkFailing(id);
    auto it = this->_store._vertices.find(id.handle);
    if (it == this->_store._vertices.end()) {
      throw std::out_of_range(fmt::format("No record with id {}.", id.handle));
    }
    return it->second;
  }

private:
  void checkFailing(ObjectId id) const {
    if (this->_store._failing.count(id.handle) > 0) {
      throw std::runtime_error(
          fmt::format("Record {} could not be read.", id.handle));
    }
  }

  InMemoryObjectStore& _store;
};

void InMemoryObjectStore::addClipBoundary(
    ObjectId id,
    ClipBoundarySource source) {
  this->_clipBoundaries[id.handle] = std::move(source);
}

void InMemoryObjectStore::addVertex(ObjectId id, const glm::dvec3& position) {
  this->_vertices[id.handle] = position;
}

void InMemoryObjectStore::addNonVertexRecord(ObjectId id) {
  this->_vertices[id.handle] = std::nullopt;
}

void InMemoryObjectStore::addFailingRecord(ObjectId id) {
  this->_failing.insert(id.handle);
}

std::unique_ptr<IReadSession> InMemoryObjectStore::beginReadSession() {
  return std::make_unique<Session>(*this);
}

} // namespace PaperspaceNativeTests
