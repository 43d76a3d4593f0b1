#include <PaperspaceNativeTests/InMemoryObjectStore.h>
#include <PaperspaceUtility/Result.h>
#include <PaperspaceViewport/AnnotationLocator.h>
#include <PaperspaceViewport/ClipBoundarySource.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportFootprintExtractor.h>

#include <doctest/doctest.h>
#include <glm/ext/vector_double3.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PaperspaceNativeTests;
using namespace PaperspaceUtility;
using namespace PaperspaceViewport;

namespace {
ViewportDescriptor createViewport(uint64_t handle, const glm::dvec3& target) {
  ViewportDescriptor viewport;
  viewport.id = ObjectId{handle};
  viewport.width = 10.0;
  viewport.height = 10.0;
  viewport.viewTarget = target;
  return viewport;
}

ViewportDescriptor
createClippedViewport(uint64_t handle, uint64_t clipBoundaryHandle) {
  ViewportDescriptor viewport = createViewport(handle, glm::dvec3(0.0));
  viewport.nonRectangularClip = true;
  viewport.clipBoundaryId = ObjectId{clipBoundaryHandle};
  return viewport;
}

std::vector<uint64_t> handles(const std::vector<SheetAnnotation>& annotations) {
  std::vector<uint64_t> result;
  for (const SheetAnnotation& annotation : annotations) {
    result.emplace_back(annotation.id.handle);
  }
  return result;
}
} // namespace

TEST_CASE("AnnotationLocator") {
  auto pStore = std::make_shared<InMemoryObjectStore>();
  auto pExtractor = std::make_shared<const ViewportFootprintExtractor>(
      pStore,
      ViewportFootprintOptions(),
      spdlog::default_logger());
  AnnotationLocator locator(pExtractor, spdlog::default_logger());

  const std::vector<SheetAnnotation> annotations{
      SheetAnnotation{ObjectId{1}, glm::dvec3(0.0, 0.0, 0.0)},
      SheetAnnotation{ObjectId{2}, glm::dvec3(4.0, 4.0, 0.0)},
      SheetAnnotation{ObjectId{3}, glm::dvec3(100.0, 0.0, 0.0)},
      SheetAnnotation{ObjectId{4}, glm::dvec3(5.0, 0.0, 0.0)},
      SheetAnnotation{ObjectId{5}, glm::dvec3(-9.0, 0.0, 0.0)}};

  SUBCASE("filters annotations by footprint in input order") {
    const std::vector<glm::dvec3> footprint =
        pExtractor->extract(createViewport(10, glm::dvec3(0.0)));

    CHECK(
        handles(locator.filterInFootprint(annotations, footprint)) ==
        std::vector<uint64_t>{1, 2, 4});
  }

  SUBCASE("a degenerate footprint contains no annotations") {
    const std::vector<glm::dvec3> segment{
        glm::dvec3(-10.0, 0.0, 0.0),
        glm::dvec3(10.0, 0.0, 0.0)};
    CHECK(locator.filterInFootprint(annotations, segment).empty());
  }

  SUBCASE("locates annotations in every viewport") {
    const std::vector<ViewportDescriptor> viewports{
        createViewport(10, glm::dvec3(0.0)),
        createViewport(11, glm::dvec3(100.0, 0.0, 0.0))};

    Result<std::vector<ViewportAnnotations>> result =
        locator.locate(viewports, annotations);

    REQUIRE(result.value);
    CHECK(result.errors.errors.empty());
    CHECK(result.errors.warnings.empty());
    REQUIRE(result.value->size() == 2);
    CHECK((*result.value)[0].viewportId == ObjectId{10});
    CHECK(
        handles((*result.value)[0].annotations) ==
        std::vector<uint64_t>{1, 2, 4});
    CHECK((*result.value)[1].viewportId == ObjectId{11});
    CHECK(handles((*result.value)[1].annotations) == std::vector<uint64_t>{3});
  }

  SUBCASE("skips viewports whose footprint cannot be computed") {
    pStore->addClipBoundary(ObjectId{50}, UnsupportedClipEntity{"Circle"});
    pStore->addClipBoundary(
        ObjectId{51},
        LightweightPolyline{
            {glm::dvec3(-10.0, -1.0, 0.0),
             glm::dvec3(-8.0, -1.0, 0.0),
             glm::dvec3(-8.0, 1.0, 0.0),
             glm::dvec3(-10.0, 1.0, 0.0)}});

    const std::vector<ViewportDescriptor> viewports{
        createClippedViewport(20, 50),
        createClippedViewport(21, 404),
        createClippedViewport(22, 51)};

    Result<std::vector<ViewportAnnotations>> result =
        locator.locate(viewports, annotations);

    REQUIRE(result.value);
    REQUIRE(result.value->size() == 1);
    CHECK((*result.value)[0].viewportId == ObjectId{22});
    CHECK(handles((*result.value)[0].annotations) == std::vector<uint64_t>{5});

    REQUIRE(result.errors.warnings.size() == 1);
    CHECK(result.errors.warnings[0].find("Circle") != std::string::npos);
    REQUIRE(result.errors.errors.size() == 1);
    CHECK(result.errors.errors[0].find("404") != std::string::npos);
    CHECK(pStore->openSessions() == 0);
  }

  SUBCASE("invalid viewports are reported to the caller") {
    ViewportDescriptor viewport = createViewport(30, glm::dvec3(0.0));
    viewport.customScale = 0.0;
    CHECK_THROWS_AS(
        locator.locate({viewport}, annotations),
        std::invalid_argument);
  }
}

TEST_CASE("AnnotationLocator requires an extractor") {
  CHECK_THROWS_AS(
      AnnotationLocator(nullptr, spdlog::default_logger()),
      std::invalid_argument);
}
