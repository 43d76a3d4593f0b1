#pragma once

#include <PaperspaceUtility/Library.h>

#include <glm/gtc/epsilon.hpp>

namespace PaperspaceUtility {

/**
 * @brief Mathematical constants and functions
 */
class PAPERSPACEUTILITY_API Math final {
public:
  /** @brief 0.000000001 */
  static constexpr double Epsilon9 = 1e-9;

  /** @brief 0.000000000001 */
  static constexpr double Epsilon12 = 1e-12;

  static constexpr double OnePi = 3.14159265358979323846;
  static constexpr double TwoPi = OnePi * 2.0;
  static constexpr double PiOverTwo = OnePi / 2.0;

  /**
   * @brief Converts a relative to an absolute epsilon, for the epsilon-equality
   * check between two values.
   *
   * @tparam L The length type.
   * @tparam T value value type.
   * @tparam Q The GLM qualifier type.
   *
   * @param a The first value.
   * @param b The second value.
   * @param relativeEpsilon The relative epsilon.
   * @return The absolute epsilon.
   */
  template <glm::length_t L, typename T, glm::qualifier Q>
  static constexpr glm::vec<L, T, Q> relativeEpsilonToAbsolute(
      const glm::vec<L, T, Q>& a,
      const glm::vec<L, T, Q>& b,
      double relativeEpsilon) noexcept {
    return relativeEpsilon * glm::max(glm::abs(a), glm::abs(b));
  }

  /**
   * @brief Converts a relative to an absolute epsilon, for the epsilon-equality
   * check between two values.
   *
   * @param a The first value.
   * @param b The second value.
   * @param relativeEpsilon The relative epsilon.
   * @return The absolute epsilon.
   */
  static constexpr double relativeEpsilonToAbsolute(
      double a,
      double b,
      double relativeEpsilon) noexcept {
    return relativeEpsilon * glm::max(glm::abs(a), glm::abs(b));
  }

  /**
   * @brief Determines if two values are equal using an absolute or relative
   * tolerance test.
   *
   * The values are first compared using an absolute tolerance test. If that
   * fails, a relative tolerance test is performed.
   *
   * @param left The first value to compare.
   * @param right The other value to compare.
   * @param relativeEpsilon The maximum inclusive delta between `left` and
   * `right` for the relative tolerance test.
   * @param absoluteEpsilon The maximum inclusive delta between `left` and
   * `right` for the absolute tolerance test.
   * @returns `true` if the values are equal within the epsilon; otherwise,
   * `false`.
   */
  static constexpr bool equalsEpsilon(
      double left,
      double right,
      double relativeEpsilon,
      double absoluteEpsilon) noexcept {
    const double diff = glm::abs(left - right);
    return diff <= absoluteEpsilon ||
           diff <= relativeEpsilonToAbsolute(left, right, relativeEpsilon);
  }

  /**
   * @brief Checks whether two values are equal up to a given relative epsilon.
   *
   * @param left The first value.
   * @param right The second value.
   * @param relativeEpsilon The relative epsilon.
   * @return Whether the values are epsilon-equal
   */
  static constexpr bool
  equalsEpsilon(double left, double right, double relativeEpsilon) noexcept {
    return equalsEpsilon(left, right, relativeEpsilon, relativeEpsilon);
  }

  /**
   * @brief Determines if two vectors are equal, component-wise, using an
   * absolute or relative tolerance test.
   *
   * @tparam L The length type.
   * @tparam T value value type.
   * @tparam Q The GLM qualifier type.
   *
   * @param left The first value to compare.
   * @param right The other value to compare.
   * @param relativeEpsilon The maximum inclusive delta between `left` and
   * `right` for the relative tolerance test.
   * @param absoluteEpsilon The maximum inclusive delta between `left` and
   * `right` for the absolute tolerance test.
   * @returns `true` if the values are equal within the epsilon; otherwise,
   * `false`.
   */
  template <glm::length_t L, typename T, glm::qualifier Q>
  static constexpr bool equalsEpsilon(
      const glm::vec<L, T, Q>& left,
      const glm::vec<L, T, Q>& right,
      double relativeEpsilon,
      double absoluteEpsilon) noexcept {
    const glm::vec<L, T, Q> diff = glm::abs(left - right);
    return glm::lessThanEqual(diff, glm::vec<L, T, Q>(absoluteEpsilon)) ==
               glm::vec<L, bool, Q>(true) ||
           glm::lessThanEqual(
               diff,
               relativeEpsilonToAbsolute(left, right, relativeEpsilon)) ==
               glm::vec<L, bool, Q>(true);
  }

  /**
   * @brief Checks whether two vectors are equal up to a given relative
   * epsilon.
   */
  template <glm::length_t L, typename T, glm::qualifier Q>
  static constexpr bool equalsEpsilon(
      const glm::vec<L, T, Q>& left,
      const glm::vec<L, T, Q>& right,
      double relativeEpsilon) noexcept {
    return Math::equalsEpsilon(left, right, relativeEpsilon, relativeEpsilon);
  }

  /**
   * @brief Converts radians to degrees.
   *
   * @param angleRadians The angle to convert in radians.
   * @returns The corresponding angle in degrees.
   */
  static constexpr double radiansToDegrees(double angleRadians) noexcept {
    return angleRadians * 180.0 / OnePi;
  }
};

} // namespace PaperspaceUtility
