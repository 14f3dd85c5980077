#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/parallel.hpp"

namespace strata {

enum class OutputKind : uint8_t {
  kLibrary,
  kExecutable,
};

auto ParseOutputKind(std::string_view text) -> Result<OutputKind>;
auto ToString(OutputKind kind) -> std::string_view;

// Compilation configuration. An immutable value carried by a SourceSet;
// changing it means creating a new SourceSet.
struct CompilationOptions {
  std::string module_name;
  OutputKind output_kind = OutputKind::kLibrary;
  bool concurrent_build = true;
  uint32_t max_parallelism = 0;
  bool warnings_as_errors = false;
  std::vector<std::string> suppressed_codes;

  [[nodiscard]] auto WithConcurrentBuild(bool enabled) const
      -> CompilationOptions {
    CompilationOptions copy = *this;
    copy.concurrent_build = enabled;
    return copy;
  }

  [[nodiscard]] auto Parallelism() const -> common::ParallelOptions {
    return common::ParallelOptions{
        .concurrent = concurrent_build,
        .max_parallelism = max_parallelism,
    };
  }

  auto operator==(const CompilationOptions&) const -> bool = default;
};

}  // namespace strata
