#pragma once

#include <compare>
#include <cstdint>
#include <string>

#include "strata/common/source_manager.hpp"

namespace strata {

// Position of a syntax node inside a unit. Line and column are 1-based;
// zero means the loader had no position for the node.
struct SourceSpan {
  FileId file_id;
  uint32_t line = 0;
  uint32_t column = 0;

  auto operator==(const SourceSpan&) const -> bool = default;
  auto operator<=>(const SourceSpan&) const = default;
};

// Format a SourceSpan as "file:line:col" using the SourceManager.
// Returns empty string if the span or file is invalid.
auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string;

}  // namespace strata
