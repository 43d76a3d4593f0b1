#include <PaperspaceNativeTests/InMemoryObjectStore.h>
#include <PaperspaceViewport/ClipBoundarySource.h>
#include <PaperspaceViewport/ViewportBoundaryCache.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportExceptions.h>
#include <PaperspaceViewport/ViewportFootprintExtractor.h>

#include <doctest/doctest.h>
#include <glm/ext/vector_double3.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace PaperspaceNativeTests;
using namespace PaperspaceViewport;

namespace {
ViewportDescriptor createViewport(uint64_t handle, uint64_t clipHandle) {
  ViewportDescriptor viewport;
  viewport.id = ObjectId{handle};
  viewport.width = 10.0;
  viewport.height = 10.0;
  viewport.nonRectangularClip = true;
  viewport.clipBoundaryId = ObjectId{clipHandle};
  return viewport;
}

ViewportDescriptor createRectangularViewport(uint64_t handle) {
  ViewportDescriptor viewport;
  viewport.id = ObjectId{handle};
  viewport.width = 10.0;
  viewport.height = 10.0;
  return viewport;
}

const std::vector<glm::dvec3> triangle{
    glm::dvec3(0.0, 0.0, 0.0),
    glm::dvec3(4.0, 0.0, 0.0),
    glm::dvec3(0.0, 4.0, 0.0)};
} // namespace

TEST_CASE("ViewportBoundaryCache") {
  auto pStore = std::make_shared<InMemoryObjectStore>();
  pStore->addClipBoundary(ObjectId{50}, LightweightPolyline{triangle});

  auto pExtractor = std::make_shared<const ViewportFootprintExtractor>(
      pStore,
      ViewportFootprintOptions(),
      spdlog::default_logger());
  ViewportBoundaryCache cache(pExtractor, spdlog::default_logger());

  SUBCASE("returns the cached footprint without reading the store again") {
    const ViewportDescriptor viewport = createViewport(1, 50);

    const std::vector<glm::dvec3> first =
        cache.getOrCompute("Layout1", viewport);
    const std::vector<glm::dvec3> second =
        cache.getOrCompute("Layout1", viewport);

    CHECK(first == triangle);
    CHECK(second == first);
    CHECK(pStore->sessionsOpened() == 1);
  }

  SUBCASE("keys entries by layout and viewport") {
    cache.getOrCompute("Layout1", createViewport(1, 50));
    cache.getOrCompute("Layout2", createViewport(1, 50));
    cache.getOrCompute("Layout1", createRectangularViewport(2));

    const ViewportBoundaryCacheStatistics statistics = cache.getStatistics();
    CHECK(statistics.totalEntries == 3);
    CHECK(statistics.entriesPerLayout.at("Layout1") == 2);
    CHECK(statistics.entriesPerLayout.at("Layout2") == 1);
    CHECK(statistics.averageVertexCount == doctest::Approx(10.0 / 3.0));
    CHECK(pStore->sessionsOpened() == 2);
  }

  SUBCASE("recomputes when the viewport parameters change") {
    ViewportDescriptor viewport = createRectangularViewport(3);
    const std::vector<glm::dvec3> before =
        cache.getOrCompute("Layout1", viewport);

    viewport.viewTarget = glm::dvec3(100.0, 0.0, 0.0);
    const std::vector<glm::dvec3> after =
        cache.getOrCompute("Layout1", viewport);

    REQUIRE(after.size() == 4);
    CHECK(after[0] == before[0] + glm::dvec3(100.0, 0.0, 0.0));
    CHECK(cache.getStatistics().totalEntries == 1);
  }

  SUBCASE("invalidates single viewports and whole layouts") {
    cache.getOrCompute("Layout1", createRectangularViewport(1));
    cache.getOrCompute("Layout1", createRectangularViewport(2));
    cache.getOrCompute("Layout10", createRectangularViewport(1));
    cache.getOrCompute("Layout2", createRectangularViewport(1));

    CHECK(cache.invalidateViewport("Layout2", ObjectId{1}) == 1);
    CHECK(cache.invalidateViewport("Layout2", ObjectId{1}) == 0);
    CHECK(cache.invalidateLayout("Layout1") == 2);
    CHECK(cache.invalidateLayout("Layout1") == 0);

    const ViewportBoundaryCacheStatistics statistics = cache.getStatistics();
    CHECK(statistics.totalEntries == 1);
    CHECK(statistics.entriesPerLayout.count("Layout10") == 1);

    cache.clear();
    CHECK(cache.getStatistics().totalEntries == 0);
    CHECK(cache.getStatistics().averageVertexCount == 0.0);
  }

  SUBCASE("does not store empty footprints") {
    pStore->addClipBoundary(ObjectId{60}, LightweightPolyline{});
    CHECK(cache.getOrCompute("Layout1", createViewport(4, 60)).empty());
    CHECK(cache.getStatistics().totalEntries == 0);
  }

  SUBCASE("propagates extraction failures without storing anything") {
    pStore->addClipBoundary(ObjectId{70}, UnsupportedClipEntity{"Spline"});
    CHECK_THROWS_AS(
        cache.getOrCompute("Layout1", createViewport(5, 70)),
        UnsupportedGeometryException);
    CHECK_THROWS_AS(
        cache.getOrCompute("Layout1", createViewport(6, 404)),
        TransformFailureException);
    CHECK(cache.getStatistics().totalEntries == 0);
  }

  SUBCASE("can be shared between threads") {
    std::vector<std::thread> threads;
    for (uint64_t i = 1; i <= 4; ++i) {
      threads.emplace_back([&cache, i]() {
        for (int repeat = 0; repeat < 50; ++repeat) {
          cache.getOrCompute("Layout1", createRectangularViewport(i));
        }
      });
    }
    for (std::thread& thread : threads) {
      thread.join();
    }

    CHECK(cache.getStatistics().totalEntries == 4);
  }
}

TEST_CASE("ViewportBoundaryCache requires an extractor") {
  CHECK_THROWS_AS(
      ViewportBoundaryCache(nullptr, spdlog::default_logger()),
      std::invalid_argument);
}
