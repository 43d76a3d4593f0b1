#pragma once

#include <PaperspaceViewport/Library.h>

#include <glm/fwd.hpp>

#include <string>

namespace PaperspaceViewport {

struct ViewportDescriptor;

/**
 * @brief Human-readable dumps of viewport transforms, for debugging.
 */
struct PAPERSPACEVIEWPORT_API ViewportDiagnostics final {
  /**
   * @brief Describes a viewport's parameters, its sheet-to-camera and
   * camera-to-world matrices, and where its top-right sheet corner lands in
   * world coordinates.
   *
   * This never throws on invalid viewport parameters; the problem is
   * reported in the returned text instead.
   */
  static std::string describe(const ViewportDescriptor& viewport);

  /**
   * @brief Formats a matrix as four bracketed rows with three decimals.
   */
  static std::string formatMatrix(const glm::dmat4& matrix);
};

} // namespace PaperspaceViewport
