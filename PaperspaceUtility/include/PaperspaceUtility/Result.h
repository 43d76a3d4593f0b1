#pragma once

#include <PaperspaceUtility/ErrorList.h>

#include <optional>
#include <utility>

namespace PaperspaceUtility {

/**
 * @brief The outcome of a batch operation: a value, plus the errors and
 * warnings for the items that had to be skipped while producing it.
 *
 * @tparam T The type of value included in the result.
 */
template <typename T> struct Result {
  Result(T value_, ErrorList errors_) noexcept
      : value(std::move(value_)), errors(std::move(errors_)) {}

  /**
   * @brief The value. Empty only if the operation could not produce one at
   * all.
   */
  std::optional<T> value;

  /**
   * @brief The errors and warnings reported for skipped items.
   */
  ErrorList errors;
};

} // namespace PaperspaceUtility
