#pragma once

#include <PaperspaceViewport/Library.h>

#include <cstdint>

namespace PaperspaceViewport {

/**
 * @brief Identifies a record in the host application's object store.
 *
 * A handle of zero is the null id and never refers to a record.
 */
struct PAPERSPACEVIEWPORT_API ObjectId final {
  /**
   * @brief The raw handle value.
   */
  uint64_t handle = 0;

  /**
   * @brief Returns true if this id is not the null id.
   */
  constexpr bool isValid() const noexcept { return this->handle != 0; }

  constexpr bool operator==(const ObjectId& rhs) const noexcept = default;
};

} // namespace PaperspaceViewport
