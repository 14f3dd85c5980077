#pragma once

#include <filesystem>
#include <string>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/source_manager.hpp"
#include "strata/source/syntax_unit.hpp"

namespace strata {

// Maps an already-parsed unit document (YAML) onto SyntaxUnit. The file text
// is registered with the SourceManager so diagnostics can quote it.
//
//   namespace: Geometry
//   imports: [Core]
//   types:
//     - name: Point
//       doc: A point in the plane.
//       fields: [{name: x, type: int}]
//       methods:
//         - name: Sum
//           params: [{name: a, type: int}]
//           returns: int
//           body: ["load a", "ret"]
//
// Malformed documents and unknown keys are host errors with file:line.
auto ParseUnit(std::string path, std::string content, SourceManager& mgr)
    -> Result<SyntaxUnit>;
auto LoadUnit(const std::filesystem::path& path, SourceManager& mgr)
    -> Result<SyntaxUnit>;

// Reference document:
//
//   reference: Core
//   types:
//     - name: Core.Console
//       methods: [{name: Print, params: 1, returns: false}]
auto ParseReference(const std::string& path, const std::string& content)
    -> Result<MetadataReference>;
auto LoadReference(const std::filesystem::path& path)
    -> Result<MetadataReference>;

}  // namespace strata
