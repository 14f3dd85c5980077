#include "strata/emit/emit_options.hpp"

#include <expected>
#include <format>
#include <string_view>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata::emit {

auto ParseDebugInfoMode(std::string_view text) -> Result<DebugInfoMode> {
  if (text == "none") {
    return DebugInfoMode::kNone;
  }
  if (text == "embedded") {
    return DebugInfoMode::kEmbedded;
  }
  if (text == "separate") {
    return DebugInfoMode::kSeparate;
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::format(
              "unknown debug mode '{}', use 'none', 'embedded' or 'separate'",
              text)));
}

auto ParseEmitPolicy(std::string_view text) -> Result<EmitPolicy> {
  if (text == "fail-closed") {
    return EmitPolicy::kFailClosed;
  }
  if (text == "emit-anyway") {
    return EmitPolicy::kEmitAnyway;
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::format(
              "unknown emit policy '{}', use 'fail-closed' or 'emit-anyway'",
              text)));
}

}  // namespace strata::emit
