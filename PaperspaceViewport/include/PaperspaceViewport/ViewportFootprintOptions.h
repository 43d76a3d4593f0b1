#pragma once

#include <PaperspaceViewport/Library.h>

namespace PaperspaceViewport {

/**
 * @brief Options for configuring a {@link ViewportFootprintExtractor}.
 */
struct PAPERSPACEVIEWPORT_API ViewportFootprintOptions {
  /**
   * @brief The offset distance used by
   * {@link ViewportFootprintExtractor::isPointInViewport}, in world units.
   *
   * Points within this distance of the footprint boundary, along X or Y, are
   * considered inside. Zero selects the exact test. Must not be negative.
   */
  double containmentTolerance = 1e-9;

  /**
   * @brief Whether {@link ViewportFootprintExtractor::isPointInViewport} uses
   * the nonzero winding rule instead of ray casting. With a positive
   * {@link containmentTolerance}, every offset point uses the selected rule.
   */
  bool useWindingNumber = false;
};

} // namespace PaperspaceViewport
