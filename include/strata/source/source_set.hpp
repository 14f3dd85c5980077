#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include "strata/source/compilation_options.hpp"
#include "strata/source/syntax_unit.hpp"

namespace strata {

namespace binding {
class BoundDeclarationState;
}  // namespace binding

// Immutable input of one compilation: parsed units, metadata references and
// options. Owns the lazily computed BoundDeclarationState, which is computed
// at most once per instance and shared read-only afterwards.
//
// A SourceSet is never mutated. WithOptions() yields a new instance that
// shares unit and reference storage but starts with an empty cache, so
// re-binding after an option change (or for a fresh measurement) always
// observes a pristine input.
class SourceSet {
 public:
  // Throws common::InternalError for malformed input: empty module name,
  // a unit without a path, or two units sharing a FileId.
  static auto Create(
      std::vector<SyntaxUnit> units, std::vector<MetadataReference> references,
      CompilationOptions options) -> std::shared_ptr<const SourceSet>;

  [[nodiscard]] auto WithOptions(CompilationOptions options) const
      -> std::shared_ptr<const SourceSet>;

  [[nodiscard]] auto Units() const -> std::span<const SyntaxUnit> {
    return *units_;
  }

  [[nodiscard]] auto References() const
      -> std::span<const MetadataReference> {
    return *references_;
  }

  [[nodiscard]] auto Options() const -> const CompilationOptions& {
    return options_;
  }

  // Runs declaration binding on first use; later calls return the cached
  // state. Safe to call from several threads.
  [[nodiscard]] auto GetBoundState() const
      -> const binding::BoundDeclarationState&;

  // True once GetBoundState() has completed on this instance.
  [[nodiscard]] auto IsBound() const -> bool {
    return bound_ready_.load(std::memory_order_acquire);
  }

  SourceSet(const SourceSet&) = delete;
  SourceSet& operator=(const SourceSet&) = delete;
  SourceSet(SourceSet&&) = delete;
  SourceSet& operator=(SourceSet&&) = delete;
  ~SourceSet();

 private:
  SourceSet(
      std::shared_ptr<const std::vector<SyntaxUnit>> units,
      std::shared_ptr<const std::vector<MetadataReference>> references,
      CompilationOptions options);

  std::shared_ptr<const std::vector<SyntaxUnit>> units_;
  std::shared_ptr<const std::vector<MetadataReference>> references_;
  CompilationOptions options_;

  mutable std::once_flag bind_once_;
  mutable std::unique_ptr<const binding::BoundDeclarationState> bound_;
  mutable std::atomic<bool> bound_ready_{false};
};

}  // namespace strata
