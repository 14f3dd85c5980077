#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/source_span.hpp"
#include "strata/source/syntax_unit.hpp"

namespace strata::binding {

enum class BuiltinType : uint8_t {
  kInt,
  kBool,
  kString,
  kVoid,
};

enum class TypeRefKind : uint8_t {
  kBuiltin,     // index is a BuiltinType
  kSource,      // index into BoundDeclarationState::Types()
  kReferenced,  // index into BoundDeclarationState::ReferencedTypes()
  kError,       // unresolved; a diagnostic was reported
};

struct TypeRef {
  TypeRefKind kind = TypeRefKind::kError;
  uint32_t index = 0;

  static auto Builtin(BuiltinType type) -> TypeRef {
    return TypeRef{
        .kind = TypeRefKind::kBuiltin, .index = static_cast<uint32_t>(type)};
  }

  [[nodiscard]] auto IsVoid() const -> bool {
    return kind == TypeRefKind::kBuiltin &&
           index == static_cast<uint32_t>(BuiltinType::kVoid);
  }

  auto operator==(const TypeRef&) const -> bool = default;
};

struct FieldSymbol {
  std::string name;
  TypeRef type;
  Visibility visibility = Visibility::kPrivate;
  const FieldDecl* decl = nullptr;
};

struct MethodSymbol {
  uint32_t token = 0;  // Declaration order across the whole source set
  uint32_t owner = 0;  // Index into Types()
  uint32_t unit_index = 0;
  std::string name;
  std::string qualified_name;
  Visibility visibility = Visibility::kPublic;
  std::vector<TypeRef> parameters;
  TypeRef return_type;
  const MethodDecl* decl = nullptr;
};

struct TypeSymbol {
  uint32_t unit_index = 0;
  std::string name;
  std::string namespace_name;
  std::string qualified_name;
  Visibility visibility = Visibility::kPublic;
  std::vector<FieldSymbol> fields;
  std::vector<uint32_t> methods;  // Tokens into Methods()
  const TypeDecl* decl = nullptr;
};

struct ReferencedMethodSymbol {
  uint32_t owner = 0;  // Index into ReferencedTypes()
  std::string name;
  uint32_t param_count = 0;
  bool returns_value = false;
};

struct ReferencedTypeSymbol {
  std::string reference;  // MetadataReference name
  std::string namespace_name;
  std::string qualified_name;
  std::vector<uint32_t> methods;  // Indices into ReferencedMethods()
};

struct ImportBinding {
  std::string name;
  SourceSpan span;
  bool resolved = false;   // Namespace exists
  bool duplicate = false;  // Repeats an earlier import of the same unit
  bool used_by_declarations = false;
};

struct UnitScope {
  std::string namespace_name;
  std::vector<ImportBinding> imports;
};

struct TypeLookup {
  TypeRef type;
  std::optional<uint32_t> import_index;  // Import that made the name visible
  bool ambiguous = false;
};

enum class CallTargetKind : uint8_t {
  kSource,      // index is a method token
  kReferenced,  // index into ReferencedMethods()
};

struct CallTarget {
  CallTargetKind kind = CallTargetKind::kSource;
  uint32_t index = 0;
  uint32_t param_count = 0;
  bool returns_value = false;
  Visibility visibility = Visibility::kPublic;
};

// Result of declaration binding for one SourceSet: the symbol table plus the
// declaration diagnostics. Read-only after the binder returns it, so it can
// be shared by every later stage and by concurrent analyzer tasks.
class BoundDeclarationState {
 public:
  [[nodiscard]] auto Types() const -> const std::vector<TypeSymbol>& {
    return types_;
  }
  [[nodiscard]] auto Methods() const -> const std::vector<MethodSymbol>& {
    return methods_;
  }
  [[nodiscard]] auto ReferencedTypes() const
      -> const std::vector<ReferencedTypeSymbol>& {
    return referenced_types_;
  }
  [[nodiscard]] auto ReferencedMethods() const
      -> const std::vector<ReferencedMethodSymbol>& {
    return referenced_methods_;
  }
  [[nodiscard]] auto Scopes() const -> const std::vector<UnitScope>& {
    return scopes_;
  }
  [[nodiscard]] auto Diagnostics() const -> const DiagnosticSet& {
    return diagnostics_;
  }
  [[nodiscard]] auto EntryPoint() const -> std::optional<uint32_t> {
    return entry_point_;
  }

  [[nodiscard]] auto HasNamespace(std::string_view name) const -> bool;

  // Exact lookup of a namespace-qualified type name.
  [[nodiscard]] auto FindType(std::string_view qualified_name) const
      -> std::optional<TypeRef>;

  // Resolves a type name as written inside a unit: builtins, then the unit's
  // own namespace, then its imports. Qualified names resolve directly.
  [[nodiscard]] auto LookupType(uint32_t unit_index, std::string_view name)
      const -> TypeLookup;

  [[nodiscard]] auto FindMethod(TypeRef owner, std::string_view name) const
      -> std::optional<CallTarget>;

  // Display name used in diagnostics, metadata and documentation ids.
  [[nodiscard]] auto TypeName(TypeRef type) const -> std::string;

 private:
  friend class DeclarationBinder;

  std::vector<TypeSymbol> types_;
  std::vector<MethodSymbol> methods_;
  std::vector<ReferencedTypeSymbol> referenced_types_;
  std::vector<ReferencedMethodSymbol> referenced_methods_;
  std::vector<UnitScope> scopes_;
  std::unordered_map<std::string, TypeRef> type_index_;
  std::unordered_set<std::string> namespaces_;
  std::optional<uint32_t> entry_point_;
  DiagnosticSet diagnostics_;
};

// Maps a builtin type keyword ("int", "bool", "string", "void").
auto LookupBuiltinType(std::string_view name) -> std::optional<BuiltinType>;
auto BuiltinTypeName(BuiltinType type) -> std::string_view;

// "Ns" + "Type" -> "Ns.Type"; an empty namespace leaves the name unchanged.
auto QualifyName(std::string_view namespace_name, std::string_view name)
    -> std::string;

}  // namespace strata::binding
