#pragma once

#include <PaperspaceViewport/Library.h>

#include <exception>
#include <stdexcept>
#include <string>

namespace PaperspaceViewport {

/**
 * @brief Thrown when a viewport's clip boundary is an entity whose shape
 * cannot bound a viewport.
 */
class PAPERSPACEVIEWPORT_API UnsupportedGeometryException
    : public std::runtime_error {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param entityType The type name of the offending clip entity.
   */
  explicit UnsupportedGeometryException(std::string entityType);

  /**
   * @brief The type name of the offending clip entity.
   */
  const std::string& entityType() const noexcept { return this->_entityType; }

private:
  std::string _entityType;
};

/**
 * @brief Thrown when a footprint cannot be computed because the clip boundary
 * could not be read or transformed.
 *
 * This exception is always thrown with `std::throw_with_nested`, so the
 * underlying cause can be recovered with `std::rethrow_if_nested`.
 */
class PAPERSPACEVIEWPORT_API TransformFailureException
    : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Formats an exception and the chain of exceptions nested inside it
 * into a single line, outermost first, separated by " <- ".
 */
PAPERSPACEVIEWPORT_API std::string
formatNestedException(const std::exception& exception);

} // namespace PaperspaceViewport
