#include <PaperspaceGeometry/Transforms.h>
#include <PaperspaceUtility/Math.h>
#include <PaperspaceViewport/ViewportDescriptor.h>
#include <PaperspaceViewport/ViewportDiagnostics.h>
#include <PaperspaceViewport/ViewportTransforms.h>

#include <glm/ext/matrix_double4x4.hpp>
#include <glm/ext/vector_double3.hpp>
#include <spdlog/fmt/fmt.h>

#include <exception>
#include <iterator>
#include <string>

using namespace PaperspaceGeometry;
using namespace PaperspaceUtility;

namespace PaperspaceViewport {

std::string ViewportDiagnostics::formatMatrix(const glm::dmat4& matrix) {
  std::string result;
  for (glm::length_t row = 0; row < 4; ++row) {
    fmt::format_to(
        std::back_inserter(result),
        "[{:.3f},{:.3f},{:.3f},{:.3f}]",
        matrix[0][row],
        matrix[1][row],
        matrix[2][row],
        matrix[3][row]);
  }
  return result;
}

std::string ViewportDiagnostics::describe(const ViewportDescriptor& viewport) {
  std::string result;
  auto out = std::back_inserter(result);

  fmt::format_to(
      out,
      "Viewport {} transformation diagnostics:\n",
      viewport.id.handle);
  fmt::format_to(
      out,
      "  Center point (sheet): ({:.3f}, {:.3f})\n",
      viewport.centerPoint.x,
      viewport.centerPoint.y);
  fmt::format_to(
      out,
      "  Size (sheet): {:.3f} x {:.3f}\n",
      viewport.width,
      viewport.height);
  fmt::format_to(
      out,
      "  View center (camera): ({:.3f}, {:.3f})\n",
      viewport.viewCenter.x,
      viewport.viewCenter.y);
  fmt::format_to(
      out,
      "  View target (world): ({:.3f}, {:.3f}, {:.3f})\n",
      viewport.viewTarget.x,
      viewport.viewTarget.y,
      viewport.viewTarget.z);
  fmt::format_to(
      out,
      "  View direction (world): ({:.6f}, {:.6f}, {:.6f})\n",
      viewport.viewDirection.x,
      viewport.viewDirection.y,
      viewport.viewDirection.z);
  fmt::format_to(
      out,
      "  Twist angle: {:.6f} rad ({:.2f} deg)\n",
      viewport.twistAngle,
      Math::radiansToDegrees(viewport.twistAngle));
  fmt::format_to(out, "  Custom scale: {:.6f}\n", viewport.customScale);
  fmt::format_to(
      out,
      "  Non-rectangular clip: {}, clip boundary: {}\n",
      viewport.nonRectangularClip,
      viewport.clipBoundaryId ? fmt::to_string(viewport.clipBoundaryId->handle)
                              : std::string("none"));

  try {
    const glm::dmat4 sheetToCamera =
        ViewportTransforms::createSheetToCameraMatrix(viewport);
    const glm::dmat4 cameraToWorld =
        ViewportTransforms::createCameraToWorldMatrix(viewport);
    const glm::dmat4 sheetToWorld =
        ViewportTransforms::compose(cameraToWorld, sheetToCamera);

    const glm::dvec3 topRight(
        viewport.centerPoint.x + viewport.width * 0.5,
        viewport.centerPoint.y + viewport.height * 0.5,
        0.0);
    const glm::dvec3 topRightWorld =
        Transforms::transformPosition(sheetToWorld, topRight);

    fmt::format_to(out, "  Sheet to camera: {}\n", formatMatrix(sheetToCamera));
    fmt::format_to(out, "  Camera to world: {}\n", formatMatrix(cameraToWorld));
    fmt::format_to(
        out,
        "  Top-right corner: sheet ({:.3f}, {:.3f}, {:.3f}) -> world ({:.3f}, "
        "{:.3f}, {:.3f})\n",
        topRight.x,
        topRight.y,
        topRight.z,
        topRightWorld.x,
        topRightWorld.y,
        topRightWorld.z);
  } catch (const std::exception& e) {
    fmt::format_to(out, "  Cannot build transforms: {}\n", e.what());
  }

  return result;
}

} // namespace PaperspaceViewport
