#pragma once

#include <PaperspaceUtility/Library.h>

#include <spdlog/fwd.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace PaperspaceUtility {

/**
 * @brief Collects the errors and warnings raised while processing a batch of
 * viewports, so that one bad viewport does not abort the whole batch.
 */
struct PAPERSPACEUTILITY_API ErrorList {
  /**
   * @brief Records a failure that caused an item to be skipped.
   */
  template <typename ErrorStr> void emplaceError(ErrorStr&& error) {
    errors.emplace_back(std::forward<ErrorStr>(error));
  }

  /**
   * @brief Records an expected condition that caused an item to be skipped.
   */
  template <typename WarningStr> void emplaceWarning(WarningStr&& warning) {
    warnings.emplace_back(std::forward<WarningStr>(warning));
  }

  /**
   * @brief Writes every message to a single log entry, at error level if any
   * error was recorded and at warning level otherwise. Nothing is logged for
   * an empty list.
   *
   * @param pLogger The logger to write to.
   * @param prompt The first line of the entry.
   */
  void log(
      const std::shared_ptr<spdlog::logger>& pLogger,
      const std::string& prompt) const;

  /**
   * @brief Formats the prompt followed by one line per error and then one line
   * per warning.
   *
   * @returns The formatted text, or an empty string for an empty list.
   */
  std::string format(const std::string& prompt) const;

  /**
   * @brief The error messages, in the order they were recorded.
   */
  std::vector<std::string> errors;

  /**
   * @brief The warning messages, in the order they were recorded.
   */
  std::vector<std::string> warnings;
};

} // namespace PaperspaceUtility
