#include <PaperspaceViewport/ViewportExceptions.h>

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <string>
#include <utility>

namespace PaperspaceViewport {

UnsupportedGeometryException::UnsupportedGeometryException(
    std::string entityType)
    : std::runtime_error(fmt::format(
          "Unsupported clip entity type: {}. Only lightweight polylines, 2D "
          "polylines and 3D polylines can bound a viewport.",
          entityType)),
      _entityType(std::move(entityType)) {}

namespace {
void appendNested(const std::exception& exception, std::string& out) {
  out += exception.what();
  try {
    std::rethrow_if_nested(exception);
  } catch (const std::exception& nested) {
    out += " <- ";
    appendNested(nested, out);
  } catch (...) {
    out += " <- unknown exception";
  }
}
} // namespace

std::string formatNestedException(const std::exception& exception) {
  std::string result;
  appendNested(exception, result);
  return result;
}

} // namespace PaperspaceViewport
