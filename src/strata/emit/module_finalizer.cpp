#include "strata/emit/module_finalizer.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/internal_error.hpp"

namespace strata::emit {

namespace {

using binding::BoundDeclarationState;
using binding::MethodSymbol;
using binding::TypeSymbol;

void AttachResources(
    ModuleBuildState& module, std::span<const ManifestResource> resources,
    DiagnosticSet& out) {
  std::unordered_set<std::string> seen;
  for (const ManifestResource& resource : resources) {
    if (resource.name.empty()) {
      out.Report(
          Diagnostic::Error("STR0401", "manifest resource has no name"));
      continue;
    }
    if (!seen.insert(resource.name).second) {
      out.Report(
          Diagnostic::Error(
              "STR0401",
              std::format("duplicate manifest resource '{}'", resource.name)));
      continue;
    }
    module.AddResource(resource);
  }
}

auto MethodId(const BoundDeclarationState& bound, const MethodSymbol& method)
    -> std::string {
  std::string id = "M:" + method.qualified_name;
  if (method.parameters.empty()) {
    return id;
  }
  id += '(';
  for (size_t i = 0; i < method.parameters.size(); ++i) {
    if (i != 0) {
      id += ',';
    }
    id += bound.TypeName(method.parameters[i]);
  }
  id += ')';
  return id;
}

// Documentation document:
//   { "module": name, "members": [ { "id": "T:Ns.Type", "summary": ... } ] }
// Members appear in declaration order: each type, then its fields, then its
// methods. Private members are listed only when they are emitted.
void GenerateDocumentation(ModuleBuildState& module, DiagnosticSet& out) {
  const BoundDeclarationState& bound = module.Bound();
  const bool include_private = module.Options().include_private_members;

  auto members = nlohmann::json::array();
  auto add_member = [&](const std::string& id, const std::string& summary,
                        bool is_public, SourceSpan span) {
    if (is_public && summary.empty()) {
      out.Warning(
          span, "STR0402",
          std::format("missing documentation for public member '{}'", id));
    }
    if (!is_public && !include_private) {
      return;
    }
    nlohmann::json entry;
    entry["id"] = id;
    entry["summary"] = summary;
    members.push_back(std::move(entry));
  };

  for (const TypeSymbol& type : bound.Types()) {
    const bool type_public = type.visibility == Visibility::kPublic;
    add_member(
        "T:" + type.qualified_name, type.decl->doc, type_public,
        type.decl->span);

    for (const binding::FieldSymbol& field : type.fields) {
      add_member(
          std::format("F:{}.{}", type.qualified_name, field.name),
          field.decl->doc,
          type_public && field.visibility == Visibility::kPublic,
          field.decl->span);
    }
    for (uint32_t token : type.methods) {
      const MethodSymbol& method = bound.Methods()[token];
      add_member(
          MethodId(bound, method), method.decl->doc,
          type_public && method.visibility == Visibility::kPublic,
          method.decl->span);
    }
  }

  nlohmann::json document;
  document["module"] = module.ModuleName();
  document["members"] = std::move(members);
  module.SetDocumentation(document.dump(2) + "\n");
}

void ReportUnusedImports(const ModuleBuildState& module, DiagnosticSet& out) {
  const auto& scopes = module.Bound().Scopes();
  for (uint32_t unit = 0; unit < scopes.size(); ++unit) {
    const auto& imports = scopes[unit].imports;
    for (uint32_t i = 0; i < imports.size(); ++i) {
      const binding::ImportBinding& import = imports[i];
      // Unresolved and repeated imports already carry a diagnostic.
      if (!import.resolved || import.duplicate) {
        continue;
      }
      if (!module.IsImportUsed(unit, i)) {
        out.Warning(
            import.span, "STR0403",
            std::format("unnecessary import '{}'", import.name));
      }
    }
  }
}

}  // namespace

auto Finalize(
    ModuleBuildState& module, std::span<const ManifestResource> resources,
    DiagnosticSet& diagnostics) -> bool {
  if (module.Stage() != ModuleStage::kOpen) {
    common::ThrowInvalidState(
        "Finalize",
        std::format(
            "module '{}' is {}; only an Open module can be finalized",
            module.ModuleName(), ToString(module.Stage())));
  }
  if (!module.MethodsCompiled()) {
    common::ThrowInvalidState(
        "Finalize",
        std::format(
            "methods of module '{}' have not been compiled",
            module.ModuleName()));
  }

  DiagnosticSet local;
  AttachResources(module, resources, local);

  if (module.Options().generate_documentation) {
    GenerateDocumentation(module, local);
  }

  if (!module.Options().emit_metadata_only) {
    ReportUnusedImports(module, local);
  }

  module.Seal();

  const auto& compilation = module.Sources().Options();
  local.ApplyOptions(
      compilation.suppressed_codes, compilation.warnings_as_errors);
  const bool success = !local.HasErrors();
  diagnostics.Append(std::move(local));
  return success;
}

}  // namespace strata::emit
