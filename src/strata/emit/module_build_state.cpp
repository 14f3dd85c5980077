#include "strata/emit/module_build_state.hpp"

#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "strata/common/internal_error.hpp"

namespace strata::emit {

auto ToString(ModuleStage stage) -> std::string_view {
  switch (stage) {
    case ModuleStage::kOpen:
      return "Open";
    case ModuleStage::kFinalized:
      return "Finalized";
    case ModuleStage::kSerialized:
      return "Serialized";
  }
  return "Open";
}

ModuleBuildState::ModuleBuildState(
    std::shared_ptr<const SourceSet> sources, EmitOptions options)
    : sources_(std::move(sources)), options_(std::move(options)) {
  if (sources_ == nullptr) {
    common::ThrowInternalError("ModuleBuildState", "null source set");
  }
  if (!sources_->IsBound()) {
    common::ThrowInvalidState(
        "ModuleBuildState",
        "declaration binding has not completed for this source set");
  }

  module_name_ = options_.output_name_override.empty()
                     ? sources_->Options().module_name
                     : options_.output_name_override;

  const auto& bound = sources_->GetBoundState();
  bodies_.resize(bound.Methods().size());
  used_imports_.reserve(bound.Scopes().size());
  for (const binding::UnitScope& scope : bound.Scopes()) {
    std::vector<bool> used;
    used.reserve(scope.imports.size());
    for (const binding::ImportBinding& import : scope.imports) {
      used.push_back(import.used_by_declarations);
    }
    used_imports_.push_back(std::move(used));
  }
}

auto ModuleBuildState::ModuleName() const -> const std::string& {
  return module_name_;
}

void ModuleBuildState::RequireOpen(const char* operation) const {
  if (stage_ != ModuleStage::kOpen) {
    common::ThrowInvalidState(
        operation, std::format(
                       "module '{}' is {}; content can only change while Open",
                       module_name_, ToString(stage_)));
  }
}

void ModuleBuildState::AddMethodBody(CompiledMethod method) {
  RequireOpen("ModuleBuildState::AddMethodBody");
  if (method.token >= bodies_.size()) {
    common::ThrowInternalError(
        "ModuleBuildState::AddMethodBody",
        std::format("method token {} out of range", method.token));
  }
  auto token = method.token;
  bodies_[token] = std::make_unique<CompiledMethod>(std::move(method));
}

auto ModuleBuildState::MethodBody(uint32_t token) const
    -> const CompiledMethod* {
  if (token >= bodies_.size()) {
    return nullptr;
  }
  return bodies_[token].get();
}

auto ModuleBuildState::MethodBodyCount() const -> uint32_t {
  uint32_t count = 0;
  for (const auto& body : bodies_) {
    if (body != nullptr) {
      ++count;
    }
  }
  return count;
}

void ModuleBuildState::MarkMethodsCompiled(uint32_t probe_count) {
  RequireOpen("ModuleBuildState::MarkMethodsCompiled");
  if (methods_compiled_) {
    common::ThrowInvalidState(
        "ModuleBuildState::MarkMethodsCompiled",
        std::format(
            "methods of module '{}' were already compiled", module_name_));
  }
  methods_compiled_ = true;
  probe_count_ = probe_count;
}

void ModuleBuildState::MarkImportUsed(
    uint32_t unit_index, uint32_t import_index) {
  RequireOpen("ModuleBuildState::MarkImportUsed");
  used_imports_.at(unit_index).at(import_index) = true;
}

auto ModuleBuildState::IsImportUsed(
    uint32_t unit_index, uint32_t import_index) const -> bool {
  return used_imports_.at(unit_index).at(import_index);
}

void ModuleBuildState::AddResource(ManifestResource resource) {
  RequireOpen("ModuleBuildState::AddResource");
  resources_.push_back(std::move(resource));
}

void ModuleBuildState::SetDocumentation(std::string text) {
  RequireOpen("ModuleBuildState::SetDocumentation");
  documentation_ = std::move(text);
  has_documentation_ = true;
}

void ModuleBuildState::Seal() {
  RequireOpen("ModuleBuildState::Seal");
  stage_ = ModuleStage::kFinalized;
}

void ModuleBuildState::MarkSerialized() {
  if (stage_ == ModuleStage::kOpen) {
    common::ThrowInvalidState(
        "ModuleBuildState::MarkSerialized",
        std::format("module '{}' has not been finalized", module_name_));
  }
  stage_ = ModuleStage::kSerialized;
}

}  // namespace strata::emit
