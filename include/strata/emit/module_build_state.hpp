#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/source/source_set.hpp"

namespace strata::emit {

// Lifecycle of the module-being-built. Transitions only move forward.
enum class ModuleStage : uint8_t {
  kOpen,        // Accepting method bodies, resources and documentation
  kFinalized,   // Sealed; ready to serialize
  kSerialized,  // Written at least once; may be written again
};

auto ToString(ModuleStage stage) -> std::string_view;

struct SequencePoint {
  uint32_t offset = 0;
  uint32_t line = 0;
  uint32_t column = 0;

  auto operator==(const SequencePoint&) const -> bool = default;
};

struct CompiledMethod {
  uint32_t token = 0;
  std::vector<uint8_t> code;
  uint16_t max_stack = 0;
  uint16_t local_count = 0;
  std::vector<SequencePoint> sequence_points;
  uint32_t first_probe = 0;
  uint32_t probe_count = 0;
};

struct ManifestResource {
  std::string name;
  std::vector<uint8_t> data;
  bool is_public = true;
};

// In-progress module of one emit run. Exactly one run owns it; it is never
// shared between concurrent stages or reused across compilation attempts.
// Every mutator requires ModuleStage::kOpen and throws
// common::InvalidStateError otherwise.
class ModuleBuildState {
 public:
  ModuleBuildState(std::shared_ptr<const SourceSet> sources, EmitOptions options);

  ModuleBuildState(const ModuleBuildState&) = delete;
  ModuleBuildState& operator=(const ModuleBuildState&) = delete;
  ModuleBuildState(ModuleBuildState&&) = delete;
  ModuleBuildState& operator=(ModuleBuildState&&) = delete;
  ~ModuleBuildState() = default;

  [[nodiscard]] auto Stage() const -> ModuleStage {
    return stage_;
  }
  [[nodiscard]] auto Sources() const -> const SourceSet& {
    return *sources_;
  }
  [[nodiscard]] auto Bound() const -> const binding::BoundDeclarationState& {
    return sources_->GetBoundState();
  }
  [[nodiscard]] auto Options() const -> const EmitOptions& {
    return options_;
  }
  // Output name override if given, otherwise the compilation's module name.
  [[nodiscard]] auto ModuleName() const -> const std::string&;

  // Method bodies, indexed by method token; null where no body was produced.
  void AddMethodBody(CompiledMethod method);
  [[nodiscard]] auto MethodBody(uint32_t token) const -> const CompiledMethod*;
  [[nodiscard]] auto MethodBodyCount() const -> uint32_t;

  void MarkMethodsCompiled(uint32_t probe_count);
  [[nodiscard]] auto MethodsCompiled() const -> bool {
    return methods_compiled_;
  }
  [[nodiscard]] auto ProbeCount() const -> uint32_t {
    return probe_count_;
  }

  void MarkImportUsed(uint32_t unit_index, uint32_t import_index);
  [[nodiscard]] auto IsImportUsed(uint32_t unit_index, uint32_t import_index)
      const -> bool;

  void AddResource(ManifestResource resource);
  [[nodiscard]] auto Resources() const -> const std::vector<ManifestResource>& {
    return resources_;
  }

  void SetDocumentation(std::string text);
  [[nodiscard]] auto Documentation() const -> const std::string& {
    return documentation_;
  }
  [[nodiscard]] auto HasDocumentation() const -> bool {
    return has_documentation_;
  }

  // Open -> Finalized.
  void Seal();
  // Finalized/Serialized -> Serialized.
  void MarkSerialized();

 private:
  void RequireOpen(const char* operation) const;

  std::shared_ptr<const SourceSet> sources_;
  EmitOptions options_;
  ModuleStage stage_ = ModuleStage::kOpen;
  std::string module_name_;

  std::vector<std::unique_ptr<CompiledMethod>> bodies_;
  bool methods_compiled_ = false;
  uint32_t probe_count_ = 0;
  std::vector<std::vector<bool>> used_imports_;
  std::vector<ManifestResource> resources_;
  std::string documentation_;
  bool has_documentation_ = false;
};

}  // namespace strata::emit
