#include <PaperspaceUtility/ErrorList.h>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace PaperspaceUtility {

namespace {
void appendLines(
    std::string& out,
    const std::vector<std::string>& messages,
    const char* label) {
  for (const std::string& message : messages) {
    out += "\n- ";
    out += label;
    out += message;
  }
}
} // namespace

void ErrorList::log(
    const std::shared_ptr<spdlog::logger>& pLogger,
    const std::string& prompt) const {
  if (!this->errors.empty()) {
    SPDLOG_LOGGER_ERROR(pLogger, "{}", this->format(prompt));
  } else if (!this->warnings.empty()) {
    SPDLOG_LOGGER_WARN(pLogger, "{}", this->format(prompt));
  }
}

std::string ErrorList::format(const std::string& prompt) const {
  if (this->errors.empty() && this->warnings.empty()) {
    return std::string();
  }

  std::string result = prompt;
  appendLines(result, this->errors, "[Error] ");
  appendLines(result, this->warnings, "[Warning] ");
  return result;
}

} // namespace PaperspaceUtility
