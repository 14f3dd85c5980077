#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/source/source_set.hpp"

namespace strata::binding {

// Builds the BoundDeclarationState of a SourceSet. Binding is a pure function
// of the SourceSet: ordinary semantic errors become diagnostics, and the
// resulting diagnostic order is the same with and without concurrency
// (source order within a unit, units in SourceSet order, module-wide
// diagnostics last).
//
// Use SourceSet::GetBoundState() for the memoized result; constructing a
// binder directly always recomputes.
class DeclarationBinder {
 public:
  explicit DeclarationBinder(const SourceSet& sources);

  auto Bind() -> std::unique_ptr<BoundDeclarationState>;

 private:
  struct DeclaredType {
    TypeSymbol symbol;
    std::vector<const MethodDecl*> methods;
  };

  struct UnitDeclarations {
    std::vector<DeclaredType> types;
    DiagnosticSet diagnostics;
  };

  void DeclareUnit(uint32_t unit_index, UnitDeclarations& out) const;
  void MergeDeclarations(
      std::vector<UnitDeclarations>& declared,
      std::vector<DiagnosticSet>& unit_diagnostics);
  void MergeReferences();
  void ResolveUnit(uint32_t unit_index, DiagnosticSet& out);
  auto ResolveDeclaredType(
      uint32_t unit_index, std::string_view name, SourceSpan span,
      bool allow_void, DiagnosticSet& out) -> TypeRef;
  void BindEntryPoint(DiagnosticSet& out);

  const SourceSet& sources_;
  std::unique_ptr<BoundDeclarationState> state_;
  std::vector<std::vector<uint32_t>> unit_types_;
};

}  // namespace strata::binding
