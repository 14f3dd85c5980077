#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata::emit {

enum class DebugInfoMode : uint8_t {
  kNone,      // No debug information at all
  kEmbedded,  // Debug section inside the primary image
  kSeparate,  // Written to the debug stream
};

auto ParseDebugInfoMode(std::string_view text) -> Result<DebugInfoMode>;

// Immutable bundle describing what an emit run produces. Captured by the
// ModuleBuildState when it is created and consulted by every later stage.
struct EmitOptions {
  bool include_private_members = true;
  DebugInfoMode debug_info = DebugInfoMode::kNone;
  bool emit_metadata_only = false;
  std::string output_name_override;
  bool emit_test_coverage = false;
  bool generate_documentation = false;

  auto operator==(const EmitOptions&) const -> bool = default;
};

// What happens when declaration binding reported errors.
enum class EmitPolicy : uint8_t {
  kFailClosed,  // Stop before compiling bodies; nothing is serialized
  kEmitAnyway,  // Compile, finalize and serialize; still report failure
};

auto ParseEmitPolicy(std::string_view text) -> Result<EmitPolicy>;

}  // namespace strata::emit
