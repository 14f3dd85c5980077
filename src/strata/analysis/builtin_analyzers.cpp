#include <cctype>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "strata/analysis/analyzer.hpp"
#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"

namespace strata::analysis {

namespace {

auto StartsUpper(std::string_view name) -> bool {
  return !name.empty() &&
         std::isupper(static_cast<unsigned char>(name.front())) != 0;
}

auto StartsLower(std::string_view name) -> bool {
  return !name.empty() &&
         std::islower(static_cast<unsigned char>(name.front())) != 0;
}

// Types and methods are PascalCase; fields and parameters are camelCase.
class NamingAnalyzer final : public Analyzer {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "naming";
  }

  [[nodiscard]] auto SupportsConcurrentUnits() const -> bool override {
    return true;
  }

  void AnalyzeUnit(
      const AnalysisContext& context, uint32_t unit_index,
      DiagnosticSet& out) const override {
    bool check_fields = context.options.GetBool("naming.check_fields", true);

    for (const binding::TypeSymbol& type : context.bound.Types()) {
      if (type.unit_index != unit_index) {
        continue;
      }
      if (context.stop.stop_requested()) {
        return;
      }
      if (!StartsUpper(type.name)) {
        out.Warning(
            type.decl->span, "STR1001",
            std::format("type name '{}' should start with an uppercase letter",
                        type.name));
      }

      if (check_fields) {
        for (const binding::FieldSymbol& field : type.fields) {
          if (!StartsLower(field.name)) {
            out.Warning(
                field.decl->span, "STR1001",
                std::format(
                    "field name '{}' should start with a lowercase letter",
                    field.name));
          }
        }
      }

      for (uint32_t token : type.methods) {
        const binding::MethodSymbol& method = context.bound.Methods()[token];
        if (!StartsUpper(method.name)) {
          out.Warning(
              method.decl->span, "STR1001",
              std::format(
                  "method name '{}' should start with an uppercase letter",
                  method.name));
        }
        for (const ParameterDecl& param : method.decl->parameters) {
          if (!StartsLower(param.name)) {
            out.Warning(
                param.span, "STR1001",
                std::format(
                    "parameter name '{}' should start with a lowercase letter",
                    param.name));
          }
        }
      }
    }
  }
};

// Publicly visible declarations should carry a doc comment.
class DocumentationAnalyzer final : public Analyzer {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "documentation";
  }

  [[nodiscard]] auto SupportsConcurrentUnits() const -> bool override {
    return true;
  }

  void AnalyzeUnit(
      const AnalysisContext& context, uint32_t unit_index,
      DiagnosticSet& out) const override {
    bool include_fields =
        context.options.GetBool("documentation.include_fields", false);

    for (const binding::TypeSymbol& type : context.bound.Types()) {
      if (type.unit_index != unit_index ||
          type.visibility != Visibility::kPublic) {
        continue;
      }
      if (type.decl->doc.empty()) {
        out.Warning(
            type.decl->span, "STR1002",
            std::format("public type '{}' is not documented",
                        type.qualified_name));
      }
      for (uint32_t token : type.methods) {
        const binding::MethodSymbol& method = context.bound.Methods()[token];
        if (method.visibility == Visibility::kPublic &&
            method.decl->doc.empty()) {
          out.Warning(
              method.decl->span, "STR1002",
              std::format("public method '{}' is not documented",
                          method.qualified_name));
        }
      }
      if (include_fields) {
        for (const binding::FieldSymbol& field : type.fields) {
          if (field.visibility == Visibility::kPublic &&
              field.decl->doc.empty()) {
            out.Warning(
                field.decl->span, "STR1002",
                std::format("public field '{}.{}' is not documented",
                            type.qualified_name, field.name));
          }
        }
      }
    }
  }
};

// Methods without statements. Runs over units sequentially.
class EmptyBodyAnalyzer final : public Analyzer {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "empty-body";
  }

  [[nodiscard]] auto SuppressesDuplicates() const -> bool override {
    return true;
  }

  void AnalyzeUnit(
      const AnalysisContext& context, uint32_t unit_index,
      DiagnosticSet& out) const override {
    for (const binding::MethodSymbol& method : context.bound.Methods()) {
      if (method.unit_index == unit_index && method.decl->body.empty()) {
        out.Warning(
            method.decl->span, "STR1003",
            std::format("method '{}' has an empty body",
                        method.qualified_name));
      }
    }
  }
};

}  // namespace

auto AnalyzerOptions::Get(std::string_view key) const
    -> std::optional<std::string_view> {
  auto it = values_.find(std::string(key));
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto AnalyzerOptions::GetBool(std::string_view key, bool fallback) const
    -> bool {
  auto value = Get(key);
  if (!value) {
    return fallback;
  }
  if (*value == "true" || *value == "1") {
    return true;
  }
  if (*value == "false" || *value == "0") {
    return false;
  }
  return fallback;
}

auto MakeBuiltinAnalyzer(std::string_view name)
    -> std::shared_ptr<const Analyzer> {
  if (name == "naming") {
    return std::make_shared<NamingAnalyzer>();
  }
  if (name == "documentation") {
    return std::make_shared<DocumentationAnalyzer>();
  }
  if (name == "empty-body") {
    return std::make_shared<EmptyBodyAnalyzer>();
  }
  return nullptr;
}

}  // namespace strata::analysis
