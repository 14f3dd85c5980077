#include "strata/binding/bound_state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace strata::binding {

auto QualifyName(std::string_view namespace_name, std::string_view name)
    -> std::string {
  if (namespace_name.empty()) {
    return std::string(name);
  }
  std::string result(namespace_name);
  result += '.';
  result += name;
  return result;
}

auto LookupBuiltinType(std::string_view name) -> std::optional<BuiltinType> {
  if (name == "int") return BuiltinType::kInt;
  if (name == "bool") return BuiltinType::kBool;
  if (name == "string") return BuiltinType::kString;
  if (name == "void") return BuiltinType::kVoid;
  return std::nullopt;
}

auto BuiltinTypeName(BuiltinType type) -> std::string_view {
  switch (type) {
    case BuiltinType::kInt:
      return "int";
    case BuiltinType::kBool:
      return "bool";
    case BuiltinType::kString:
      return "string";
    case BuiltinType::kVoid:
      return "void";
  }
  return "void";
}

auto BoundDeclarationState::HasNamespace(std::string_view name) const -> bool {
  return namespaces_.contains(std::string(name));
}

auto BoundDeclarationState::FindType(std::string_view qualified_name) const
    -> std::optional<TypeRef> {
  auto it = type_index_.find(std::string(qualified_name));
  if (it == type_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto BoundDeclarationState::LookupType(
    uint32_t unit_index, std::string_view name) const -> TypeLookup {
  if (auto builtin = LookupBuiltinType(name)) {
    return TypeLookup{.type = TypeRef::Builtin(*builtin)};
  }

  if (name.find('.') != std::string_view::npos) {
    if (auto found = FindType(name)) {
      return TypeLookup{.type = *found};
    }
    return TypeLookup{};
  }

  if (unit_index >= scopes_.size()) {
    return TypeLookup{};
  }
  const UnitScope& scope = scopes_[unit_index];

  if (auto found = FindType(QualifyName(scope.namespace_name, name))) {
    return TypeLookup{.type = *found};
  }

  TypeLookup result;
  for (uint32_t i = 0; i < scope.imports.size(); ++i) {
    const ImportBinding& import = scope.imports[i];
    if (!import.resolved || import.duplicate) {
      continue;
    }
    auto found = FindType(QualifyName(import.name, name));
    if (!found) {
      continue;
    }
    if (result.import_index && result.type != *found) {
      result.ambiguous = true;
      return result;
    }
    if (!result.import_index) {
      result.type = *found;
      result.import_index = i;
    }
  }
  return result;
}

auto BoundDeclarationState::FindMethod(TypeRef owner, std::string_view name)
    const -> std::optional<CallTarget> {
  if (owner.kind == TypeRefKind::kSource && owner.index < types_.size()) {
    for (uint32_t token : types_[owner.index].methods) {
      const MethodSymbol& method = methods_[token];
      if (method.name == name) {
        return CallTarget{
            .kind = CallTargetKind::kSource,
            .index = token,
            .param_count = static_cast<uint32_t>(method.parameters.size()),
            .returns_value = !method.return_type.IsVoid(),
            .visibility = method.visibility,
        };
      }
    }
    return std::nullopt;
  }

  if (owner.kind == TypeRefKind::kReferenced &&
      owner.index < referenced_types_.size()) {
    for (uint32_t index : referenced_types_[owner.index].methods) {
      const ReferencedMethodSymbol& method = referenced_methods_[index];
      if (method.name == name) {
        return CallTarget{
            .kind = CallTargetKind::kReferenced,
            .index = index,
            .param_count = method.param_count,
            .returns_value = method.returns_value,
            .visibility = Visibility::kPublic,
        };
      }
    }
  }
  return std::nullopt;
}

auto BoundDeclarationState::TypeName(TypeRef type) const -> std::string {
  switch (type.kind) {
    case TypeRefKind::kBuiltin:
      return std::string(BuiltinTypeName(static_cast<BuiltinType>(type.index)));
    case TypeRefKind::kSource:
      return types_.at(type.index).qualified_name;
    case TypeRefKind::kReferenced:
      return referenced_types_.at(type.index).qualified_name;
    case TypeRefKind::kError:
      return "<error>";
  }
  return "<error>";
}

}  // namespace strata::binding
