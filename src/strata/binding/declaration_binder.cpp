#include "strata/binding/declaration_binder.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/parallel.hpp"
#include "strata/source/source_set.hpp"

namespace strata::binding {

namespace {

constexpr std::string_view kEntryPointName = "Main";

auto NamespaceOf(std::string_view qualified_name) -> std::string_view {
  auto dot = qualified_name.rfind('.');
  if (dot == std::string_view::npos) {
    return {};
  }
  return qualified_name.substr(0, dot);
}

}  // namespace

DeclarationBinder::DeclarationBinder(const SourceSet& sources)
    : sources_(sources), state_(std::make_unique<BoundDeclarationState>()) {
}

auto DeclarationBinder::Bind() -> std::unique_ptr<BoundDeclarationState> {
  const auto units = sources_.Units();
  const auto unit_count = static_cast<uint32_t>(units.size());
  const auto parallel = sources_.Options().Parallelism();

  std::vector<UnitDeclarations> declared(unit_count);
  common::ParallelFor(unit_count, parallel, [&](size_t i) {
    DeclareUnit(static_cast<uint32_t>(i), declared[i]);
  });

  std::vector<DiagnosticSet> unit_diagnostics(unit_count);
  MergeDeclarations(declared, unit_diagnostics);
  MergeReferences();

  state_->scopes_.resize(unit_count);
  for (uint32_t i = 0; i < unit_count; ++i) {
    state_->scopes_[i].namespace_name = units[i].namespace_name;
  }

  // Each unit only writes its own scope, types and methods.
  std::vector<DiagnosticSet> resolved(unit_count);
  common::ParallelFor(unit_count, parallel, [&](size_t i) {
    ResolveUnit(static_cast<uint32_t>(i), resolved[i]);
  });

  DiagnosticSet& diagnostics = state_->diagnostics_;
  for (uint32_t i = 0; i < unit_count; ++i) {
    DiagnosticSet unit_set = std::move(declared[i].diagnostics);
    unit_set.Append(std::move(unit_diagnostics[i]));
    unit_set.Append(std::move(resolved[i]));
    unit_set.SortByLocation();
    diagnostics.Append(std::move(unit_set));
  }

  DiagnosticSet module_wide;
  BindEntryPoint(module_wide);
  diagnostics.Append(std::move(module_wide));

  const auto& options = sources_.Options();
  diagnostics.ApplyOptions(options.suppressed_codes, options.warnings_as_errors);

  return std::move(state_);
}

void DeclarationBinder::DeclareUnit(
    uint32_t unit_index, UnitDeclarations& out) const {
  const SyntaxUnit& unit = sources_.Units()[unit_index];

  for (const TypeDecl& type : unit.types) {
    DeclaredType declared;
    declared.symbol.unit_index = unit_index;
    declared.symbol.name = type.name;
    declared.symbol.namespace_name = unit.namespace_name;
    declared.symbol.qualified_name = QualifyName(unit.namespace_name, type.name);
    declared.symbol.visibility = type.visibility;
    declared.symbol.decl = &type;

    // Fields and methods share one member namespace per type.
    std::unordered_map<std::string_view, SourceSpan> members;
    auto declare_member = [&](std::string_view name, SourceSpan span) {
      auto [it, inserted] = members.emplace(name, span);
      if (!inserted) {
        out.diagnostics.Report(
            Diagnostic::Error(
                span, "STR0102",
                std::format(
                    "duplicate member '{}' in type '{}'", name,
                    declared.symbol.qualified_name))
                .WithNote(it->second, "previous declaration is here"));
      }
    };

    for (const FieldDecl& field : type.fields) {
      declare_member(field.name, field.span);
      declared.symbol.fields.push_back(
          FieldSymbol{
              .name = field.name,
              .type = {},
              .visibility = field.visibility,
              .decl = &field,
          });
    }

    for (const MethodDecl& method : type.methods) {
      declare_member(method.name, method.span);

      std::unordered_map<std::string_view, SourceSpan> params;
      for (const ParameterDecl& param : method.parameters) {
        auto [it, inserted] = params.emplace(param.name, param.span);
        if (!inserted) {
          out.diagnostics.Report(
              Diagnostic::Error(
                  param.span, "STR0108",
                  std::format(
                      "duplicate parameter '{}' in method '{}'", param.name,
                      method.name))
                  .WithNote(it->second, "previous declaration is here"));
        }
      }
      declared.methods.push_back(&method);
    }

    out.types.push_back(std::move(declared));
  }
}

void DeclarationBinder::MergeDeclarations(
    std::vector<UnitDeclarations>& declared,
    std::vector<DiagnosticSet>& unit_diagnostics) {
  unit_types_.assign(declared.size(), {});

  for (uint32_t unit_index = 0; unit_index < declared.size(); ++unit_index) {
    const SyntaxUnit& unit = sources_.Units()[unit_index];
    if (!unit.namespace_name.empty()) {
      state_->namespaces_.insert(unit.namespace_name);
    }

    for (DeclaredType& type : declared[unit_index].types) {
      const std::string& qualified = type.symbol.qualified_name;
      if (auto existing = state_->FindType(qualified)) {
        const TypeSymbol& first = state_->types_[existing->index];
        unit_diagnostics[unit_index].Report(
            Diagnostic::Error(
                type.symbol.decl->span, "STR0101",
                std::format("duplicate type '{}'", qualified))
                .WithNote(first.decl->span, "previous declaration is here"));
        continue;
      }

      auto type_index = static_cast<uint32_t>(state_->types_.size());
      for (const MethodDecl* method : type.methods) {
        auto token = static_cast<uint32_t>(state_->methods_.size());
        state_->methods_.push_back(
            MethodSymbol{
                .token = token,
                .owner = type_index,
                .unit_index = unit_index,
                .name = method->name,
                .qualified_name = QualifyName(qualified, method->name),
                .visibility = method->visibility,
                .parameters = {},
                .return_type = {},
                .decl = method,
            });
        type.symbol.methods.push_back(token);
      }

      state_->type_index_.emplace(
          qualified,
          TypeRef{.kind = TypeRefKind::kSource, .index = type_index});
      unit_types_[unit_index].push_back(type_index);
      state_->types_.push_back(std::move(type.symbol));
    }
  }
}

// Referenced types never shadow source types; a clash keeps the source type.
void DeclarationBinder::MergeReferences() {
  for (const MetadataReference& reference : sources_.References()) {
    for (const ReferencedType& type : reference.types) {
      if (state_->FindType(type.qualified_name)) {
        continue;
      }

      auto type_index = static_cast<uint32_t>(state_->referenced_types_.size());
      ReferencedTypeSymbol symbol{
          .reference = reference.name,
          .namespace_name = std::string(NamespaceOf(type.qualified_name)),
          .qualified_name = type.qualified_name,
          .methods = {},
      };
      for (const ReferencedMethod& method : type.methods) {
        symbol.methods.push_back(
            static_cast<uint32_t>(state_->referenced_methods_.size()));
        state_->referenced_methods_.push_back(
            ReferencedMethodSymbol{
                .owner = type_index,
                .name = method.name,
                .param_count = method.param_count,
                .returns_value = method.returns_value,
            });
      }

      if (!symbol.namespace_name.empty()) {
        state_->namespaces_.insert(symbol.namespace_name);
      }
      state_->type_index_.emplace(
          type.qualified_name,
          TypeRef{.kind = TypeRefKind::kReferenced, .index = type_index});
      state_->referenced_types_.push_back(std::move(symbol));
    }
  }
}

void DeclarationBinder::ResolveUnit(uint32_t unit_index, DiagnosticSet& out) {
  const SyntaxUnit& unit = sources_.Units()[unit_index];
  UnitScope& scope = state_->scopes_[unit_index];

  for (const ImportDecl& import : unit.imports) {
    ImportBinding binding{
        .name = import.name,
        .span = import.span,
        .resolved = state_->HasNamespace(import.name),
        .duplicate = false,
        .used_by_declarations = false,
    };
    for (const ImportBinding& earlier : scope.imports) {
      if (earlier.name == import.name) {
        binding.duplicate = true;
        break;
      }
    }

    if (!binding.resolved) {
      out.Error(
          import.span, "STR0104",
          std::format("namespace '{}' not found", import.name));
    } else if (binding.duplicate) {
      out.Warning(
          import.span, "STR0109",
          std::format("duplicate import '{}'", import.name));
    }
    scope.imports.push_back(std::move(binding));
  }

  for (uint32_t type_index : unit_types_[unit_index]) {
    TypeSymbol& type = state_->types_[type_index];

    for (FieldSymbol& field : type.fields) {
      field.type = ResolveDeclaredType(
          unit_index, field.decl->type_name, field.decl->span, false, out);
    }

    for (uint32_t token : type.methods) {
      MethodSymbol& method = state_->methods_[token];
      for (const ParameterDecl& param : method.decl->parameters) {
        method.parameters.push_back(ResolveDeclaredType(
            unit_index, param.type_name, param.span, false, out));
      }
      method.return_type = ResolveDeclaredType(
          unit_index, method.decl->return_type, method.decl->span, true, out);
    }
  }
}

auto DeclarationBinder::ResolveDeclaredType(
    uint32_t unit_index, std::string_view name, SourceSpan span,
    bool allow_void, DiagnosticSet& out) -> TypeRef {
  TypeLookup lookup = state_->LookupType(unit_index, name);

  if (lookup.ambiguous) {
    out.Error(
        span, "STR0110",
        std::format("'{}' is ambiguous between imported namespaces", name));
    return TypeRef{};
  }
  if (lookup.type.kind == TypeRefKind::kError) {
    out.Error(span, "STR0103", std::format("undeclared identifier '{}'", name));
    return TypeRef{};
  }
  if (!allow_void && lookup.type.IsVoid()) {
    out.Error(span, "STR0105", "'void' is only valid as a method return type");
    return TypeRef{};
  }
  if (lookup.import_index) {
    state_->scopes_[unit_index]
        .imports[*lookup.import_index]
        .used_by_declarations = true;
  }
  return lookup.type;
}

void DeclarationBinder::BindEntryPoint(DiagnosticSet& out) {
  if (sources_.Options().output_kind != OutputKind::kExecutable) {
    return;
  }

  std::vector<uint32_t> candidates;
  for (const MethodSymbol& method : state_->methods_) {
    if (method.name == kEntryPointName && method.decl->parameters.empty()) {
      candidates.push_back(method.token);
    }
  }

  if (candidates.empty()) {
    out.Report(
        Diagnostic::Error(
            "STR0106",
            std::format(
                "executable module '{}' does not define an entry point",
                sources_.Options().module_name))
            .WithNote(std::format(
                "declare a method '{}' with no parameters", kEntryPointName)));
    return;
  }

  state_->entry_point_ = candidates.front();
  const MethodSymbol& first = state_->methods_[candidates.front()];
  for (size_t i = 1; i < candidates.size(); ++i) {
    const MethodSymbol& other = state_->methods_[candidates[i]];
    out.Report(
        Diagnostic::Error(
            other.decl->span, "STR0107",
            std::format(
                "'{}' is also an entry point; only one is allowed",
                other.qualified_name))
            .WithNote(first.decl->span, "first entry point is here"));
  }
}

}  // namespace strata::binding
