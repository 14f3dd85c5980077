#include "strata/common/diagnostic/diagnostic_set.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strata {

namespace {

auto LocationOf(const Diagnostic& diag) -> const SourceSpan* {
  return std::get_if<SourceSpan>(&diag.primary.span);
}

}  // namespace

void DiagnosticSet::Append(const DiagnosticSet& other) {
  diagnostics_.insert(
      diagnostics_.end(), other.diagnostics_.begin(),
      other.diagnostics_.end());
  has_errors_ = has_errors_ || other.has_errors_;
}

void DiagnosticSet::Append(DiagnosticSet&& other) {
  diagnostics_.insert(
      diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
      std::make_move_iterator(other.diagnostics_.end()));
  has_errors_ = has_errors_ || other.has_errors_;
  other.diagnostics_.clear();
  other.has_errors_ = false;
}

void DiagnosticSet::SortByLocation() {
  std::ranges::stable_sort(
      diagnostics_, [](const Diagnostic& lhs, const Diagnostic& rhs) {
        const SourceSpan* left = LocationOf(lhs);
        const SourceSpan* right = LocationOf(rhs);
        if (left == nullptr || right == nullptr) {
          return left != nullptr && right == nullptr;
        }
        return *left < *right;
      });
}

void DiagnosticSet::Deduplicate() {
  std::vector<Diagnostic> unique;
  unique.reserve(diagnostics_.size());
  for (auto& diag : diagnostics_) {
    if (std::ranges::find(unique, diag) == unique.end()) {
      unique.push_back(std::move(diag));
    }
  }
  diagnostics_ = std::move(unique);
}

void DiagnosticSet::ApplyOptions(
    std::span<const std::string> suppressed_codes, bool warnings_as_errors) {
  std::erase_if(diagnostics_, [&](const Diagnostic& diag) {
    return !diag.primary.code.empty() &&
           std::ranges::find(suppressed_codes, diag.primary.code) !=
               suppressed_codes.end();
  });

  if (warnings_as_errors) {
    for (auto& diag : diagnostics_) {
      if (diag.primary.kind == DiagKind::kWarning) {
        diag.primary.kind = DiagKind::kError;
      }
    }
  }
  RecomputeErrorFlag();
}

auto DiagnosticSet::ErrorCount() const -> size_t {
  return static_cast<size_t>(std::ranges::count_if(
      diagnostics_, [](const Diagnostic& diag) { return diag.IsError(); }));
}

auto DiagnosticSet::WarningCount() const -> size_t {
  return static_cast<size_t>(
      std::ranges::count_if(diagnostics_, [](const Diagnostic& diag) {
        return diag.primary.kind == DiagKind::kWarning;
      }));
}

void DiagnosticSet::RecomputeErrorFlag() {
  has_errors_ = std::ranges::any_of(
      diagnostics_, [](const Diagnostic& diag) { return diag.IsError(); });
}

}  // namespace strata
