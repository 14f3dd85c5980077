#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/source/source_set.hpp"

namespace strata::analysis {

// Analyzer configuration as given on the command line or in strata.toml,
// keyed "<analyzer>.<option>".
class AnalyzerOptions {
 public:
  AnalyzerOptions() = default;
  explicit AnalyzerOptions(std::map<std::string, std::string> values)
      : values_(std::move(values)) {
  }

  void Set(std::string key, std::string value) {
    values_.insert_or_assign(std::move(key), std::move(value));
  }

  [[nodiscard]] auto Get(std::string_view key) const
      -> std::optional<std::string_view>;

  // "true"/"false"/"1"/"0"; anything else yields the fallback.
  [[nodiscard]] auto GetBool(std::string_view key, bool fallback) const
      -> bool;

  [[nodiscard]] auto Values() const
      -> const std::map<std::string, std::string>& {
    return values_;
  }

 private:
  std::map<std::string, std::string> values_;
};

// Read-only view handed to every analyzer invocation.
struct AnalysisContext {
  const SourceSet& sources;
  const binding::BoundDeclarationState& bound;
  const AnalyzerOptions& options;
  std::stop_token stop;
};

// External, pluggable rule set run by the analyzer-augmented diagnostics
// pass. Implementations must not mutate shared state: the engine may call
// Analyze for different units, and different analyzers, at the same time.
class Analyzer {
 public:
  virtual ~Analyzer() = default;

  [[nodiscard]] virtual auto Name() const -> std::string_view = 0;

  // True if AnalyzeUnit may run concurrently for different units. Otherwise
  // the engine calls AnalyzeUnit for each unit in order on one task.
  [[nodiscard]] virtual auto SupportsConcurrentUnits() const -> bool {
    return false;
  }

  // True if the engine should drop repeated identical diagnostics from this
  // analyzer's output.
  [[nodiscard]] virtual auto SuppressesDuplicates() const -> bool {
    return false;
  }

  // Inspect one unit and report into `out`. Long-running analyzers should
  // poll context.stop and return early once it is requested.
  virtual void AnalyzeUnit(
      const AnalysisContext& context, uint32_t unit_index,
      DiagnosticSet& out) const = 0;
};

// Built-in analyzers by name: "naming", "documentation", "empty-body".
// Returns nullptr for an unknown name.
auto MakeBuiltinAnalyzer(std::string_view name)
    -> std::shared_ptr<const Analyzer>;

}  // namespace strata::analysis
