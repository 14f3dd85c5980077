#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "strata/common/source_manager.hpp"
#include "strata/source/compilation_options.hpp"
#include "strata/source/source_set.hpp"
#include "strata/source/syntax_unit.hpp"
#include "strata/source/unit_loader.hpp"

namespace strata::test {

// Options of a small library module; concurrency follows the argument.
inline auto TestOptions(bool concurrent = false) -> CompilationOptions {
  return CompilationOptions{
      .module_name = "Test",
      .output_kind = OutputKind::kLibrary,
      .concurrent_build = concurrent,
      .max_parallelism = 4,
      .warnings_as_errors = false,
      .suppressed_codes = {},
  };
}

// Collects unit and reference documents written inline as YAML.
//
// Usage:
//   TestSources src;
//   src.AddUnit("a.yaml", R"(
//   namespace: App
//   types: [{name: Point}]
//   )");
//   auto sources = src.Build(TestOptions());
class TestSources {
 public:
  auto AddUnit(std::string path, std::string yaml) -> TestSources& {
    auto unit = ParseUnit(std::move(path), std::move(yaml), mgr_);
    if (!unit) {
      throw std::runtime_error(unit.error().primary.message);
    }
    units_.push_back(std::move(*unit));
    return *this;
  }

  auto AddReference(std::string yaml) -> TestSources& {
    auto reference = ParseReference("reference.yaml", yaml);
    if (!reference) {
      throw std::runtime_error(reference.error().primary.message);
    }
    references_.push_back(std::move(*reference));
    return *this;
  }

  [[nodiscard]] auto Build(CompilationOptions options) const
      -> std::shared_ptr<const SourceSet> {
    return SourceSet::Create(units_, references_, std::move(options));
  }

  [[nodiscard]] auto Manager() const -> const SourceManager& {
    return mgr_;
  }

  // FileId of the n-th added unit.
  [[nodiscard]] auto FileOf(size_t index) const -> FileId {
    return units_.at(index).file_id;
  }

 private:
  SourceManager mgr_;
  std::vector<SyntaxUnit> units_;
  std::vector<MetadataReference> references_;
};

// Message ids of a diagnostic set, in order.
template <typename Set>
auto Codes(const Set& diagnostics) -> std::vector<std::string> {
  std::vector<std::string> codes;
  for (const auto& diag : diagnostics.GetDiagnostics()) {
    codes.push_back(diag.primary.code);
  }
  return codes;
}

}  // namespace strata::test
