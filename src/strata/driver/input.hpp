#pragma once

#include <argparse/argparse.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "config.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/source_manager.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/emit/module_build_state.hpp"
#include "strata/source/compilation_options.hpp"
#include "strata/source/source_set.hpp"

namespace strata::driver {

// Everything a command needs, after merging strata.toml with the flags.
struct CompilationInput {
  std::vector<std::string> files;
  std::vector<std::string> references;
  CompilationOptions options;

  std::vector<std::string> analyzers;
  std::map<std::string, std::string> analyzer_options;

  emit::EmitOptions emit;
  emit::EmitPolicy policy = emit::EmitPolicy::kFailClosed;
  std::vector<std::string> resources;
  std::string out_dir = "out";
  std::string image_path;     // Empty: <out_dir>/<module>.strm
  std::string metadata_path;  // Empty: no metadata stream

  int verbose = 0;  // Verbosity level (0-2)
  bool stats = false;
};

// Flags shared by check, analyze and emit. Each -v bumps `verbosity`.
void AddCompilationFlags(argparse::ArgumentParser& cmd, int& verbosity);
void AddAnalyzerFlags(argparse::ArgumentParser& cmd);
void AddEmitFlags(argparse::ArgumentParser& cmd);

// Merge CLI arguments and optional config into a CompilationInput. Flags
// override scalars and extend lists.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config, int verbosity)
    -> strata::Result<CompilationInput>;

// Merge the flags added by AddAnalyzerFlags / AddEmitFlags.
auto ApplyAnalyzerFlags(
    const argparse::ArgumentParser& cmd, CompilationInput& input)
    -> strata::Result<void>;
auto ApplyEmitFlags(const argparse::ArgumentParser& cmd, CompilationInput& input)
    -> strata::Result<void>;

// Loads every unit and reference file of `input` into a new SourceSet.
auto LoadSources(const CompilationInput& input, SourceManager& mgr)
    -> strata::Result<std::shared_ptr<const SourceSet>>;

// Reads the manifest resources listed in `input`; names are file names.
auto LoadResources(const CompilationInput& input)
    -> strata::Result<std::vector<emit::ManifestResource>>;

}  // namespace strata::driver
