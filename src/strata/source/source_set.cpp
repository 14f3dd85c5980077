#include "strata/source/source_set.hpp"

#include <format>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/binding/declaration_binder.hpp"
#include "strata/common/internal_error.hpp"

namespace strata {

namespace {

void ValidateInput(
    const std::vector<SyntaxUnit>& units, const CompilationOptions& options) {
  if (options.module_name.empty()) {
    common::ThrowInternalError(
        "SourceSet::Create", "compilation options have no module name");
  }

  std::unordered_set<uint32_t> file_ids;
  for (const SyntaxUnit& unit : units) {
    if (unit.path.empty()) {
      common::ThrowInternalError(
          "SourceSet::Create", "source unit without a path");
    }
    if (unit.file_id && !file_ids.insert(unit.file_id.value).second) {
      common::ThrowInternalError(
          "SourceSet::Create",
          std::format(
              "units share file id {} ('{}')", unit.file_id.value, unit.path));
    }
  }
}

}  // namespace

SourceSet::SourceSet(
    std::shared_ptr<const std::vector<SyntaxUnit>> units,
    std::shared_ptr<const std::vector<MetadataReference>> references,
    CompilationOptions options)
    : units_(std::move(units)),
      references_(std::move(references)),
      options_(std::move(options)) {
}

SourceSet::~SourceSet() = default;

auto SourceSet::Create(
    std::vector<SyntaxUnit> units, std::vector<MetadataReference> references,
    CompilationOptions options) -> std::shared_ptr<const SourceSet> {
  ValidateInput(units, options);
  return std::shared_ptr<const SourceSet>(new SourceSet(
      std::make_shared<const std::vector<SyntaxUnit>>(std::move(units)),
      std::make_shared<const std::vector<MetadataReference>>(
          std::move(references)),
      std::move(options)));
}

auto SourceSet::WithOptions(CompilationOptions options) const
    -> std::shared_ptr<const SourceSet> {
  ValidateInput(*units_, options);
  return std::shared_ptr<const SourceSet>(
      new SourceSet(units_, references_, std::move(options)));
}

auto SourceSet::GetBoundState() const -> const binding::BoundDeclarationState& {
  std::call_once(bind_once_, [this] {
    binding::DeclarationBinder binder(*this);
    bound_ = binder.Bind();
    bound_ready_.store(true, std::memory_order_release);
  });
  return *bound_;
}

}  // namespace strata
