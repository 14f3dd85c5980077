#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata {

// Ordered, append-only collection of diagnostics produced by one pass.
// Not thread-safe: concurrent work collects into private sets that are
// appended after the join. Diagnostics are stored in order of reporting;
// callers may rely on this.
class DiagnosticSet {
 public:
  void Report(Diagnostic diag) {
    if (diag.IsError()) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(SourceSpan loc, std::string code, std::string msg) {
    Report(Diagnostic::Error(loc, std::move(code), std::move(msg)));
  }

  void Warning(SourceSpan loc, std::string code, std::string msg) {
    Report(Diagnostic::Warning(loc, std::move(code), std::move(msg)));
  }

  void Append(const DiagnosticSet& other);
  void Append(DiagnosticSet&& other);

  // Stable sort by source position. Diagnostics without a location keep
  // their relative order and sort after located ones.
  void SortByLocation();

  // Drop later copies of equal diagnostics, keeping first occurrences.
  void Deduplicate();

  // Drop diagnostics whose code is suppressed and promote warnings to errors
  // when requested.
  void ApplyOptions(
      std::span<const std::string> suppressed_codes, bool warnings_as_errors);

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto ErrorCount() const -> size_t;
  [[nodiscard]] auto WarningCount() const -> size_t;

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return diagnostics_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return diagnostics_.empty();
  }

  auto operator==(const DiagnosticSet& other) const -> bool {
    return diagnostics_ == other.diagnostics_;
  }

 private:
  void RecomputeErrorFlag();

  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace strata
