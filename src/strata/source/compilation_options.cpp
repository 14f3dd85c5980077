#include "strata/source/compilation_options.hpp"

#include <expected>
#include <format>
#include <string_view>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata {

auto ParseOutputKind(std::string_view text) -> Result<OutputKind> {
  if (text == "library") {
    return OutputKind::kLibrary;
  }
  if (text == "executable") {
    return OutputKind::kExecutable;
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::format(
              "unknown output kind '{}', use 'library' or 'executable'",
              text)));
}

auto ToString(OutputKind kind) -> std::string_view {
  switch (kind) {
    case OutputKind::kLibrary:
      return "library";
    case OutputKind::kExecutable:
      return "executable";
  }
  return "library";
}

}  // namespace strata
