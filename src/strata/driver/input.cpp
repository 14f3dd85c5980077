#include "input.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "argparse/argparse.hpp"
#include "config.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/source/compilation_options.hpp"
#include "strata/source/source_set.hpp"
#include "strata/source/unit_loader.hpp"

namespace strata::driver {

namespace {

namespace fs = std::filesystem;

void Extend(
    std::vector<std::string>& out,
    const std::optional<std::vector<std::string>>& values) {
  if (values) {
    out.insert(out.end(), values->begin(), values->end());
  }
}

auto SplitKeyValue(const std::string& text)
    -> strata::Result<std::pair<std::string, std::string>> {
  auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("invalid analyzer option '{}', use key=value", text)));
  }
  return std::pair{text.substr(0, eq), text.substr(eq + 1)};
}

}  // namespace

void AddCompilationFlags(argparse::ArgumentParser& cmd, int& verbosity) {
  cmd.add_argument("--name").help("Module name (default: package.name)");
  cmd.add_argument("--kind").help("Output kind: library or executable");
  cmd.add_argument("-r", "--reference")
      .append()
      .help("Reference document (repeatable)");
  cmd.add_argument("--no-concurrent")
      .implicit_value(true)
      .help("Run every stage on the calling thread");
  cmd.add_argument("-j", "--max-parallelism")
      .scan<'i', int>()
      .help("Upper bound on worker threads (0: hardware concurrency)");
  cmd.add_argument("--warnings-as-errors")
      .implicit_value(true)
      .help("Treat warnings as errors");
  cmd.add_argument("--suppress")
      .append()
      .metavar("CODE")
      .help("Suppress a message id (repeatable)");
  cmd.add_argument("-v", "--verbose")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Log pipeline phases (repeat for detail)");
  cmd.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase durations");
  cmd.add_argument("files").remaining().help(
      "Unit files (uses strata.toml if not specified)");
}

void AddAnalyzerFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--analyzer")
      .append()
      .metavar("NAME")
      .help("Enable a built-in analyzer (repeatable)");
  cmd.add_argument("--analyzer-option")
      .append()
      .metavar("KEY=VALUE")
      .help("Analyzer option (repeatable)");
}

void AddEmitFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-o", "--output").help("Primary image path");
  cmd.add_argument("--out-dir").help("Output directory (default: out)");
  cmd.add_argument("--metadata-out").help("Also write the metadata stream");
  cmd.add_argument("--debug").help("Debug info: none, embedded or separate");
  cmd.add_argument("--metadata-only")
      .implicit_value(true)
      .help("Emit declarations without method bodies");
  cmd.add_argument("--no-private")
      .implicit_value(true)
      .help("Omit private members (metadata-only output)");
  cmd.add_argument("--doc").implicit_value(true).help(
      "Generate the documentation stream");
  cmd.add_argument("--coverage")
      .implicit_value(true)
      .help("Instrument method bodies with coverage probes");
  cmd.add_argument("--emit-anyway")
      .implicit_value(true)
      .help("Emit even when declarations have errors");
  cmd.add_argument("--output-name").help("Override the emitted module name");
  cmd.add_argument("--resource")
      .append()
      .help("Manifest resource file (repeatable)");
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config, int verbosity)
    -> strata::Result<CompilationInput> {
  CompilationInput input;
  input.verbose = verbosity;
  input.stats = cmd.get<bool>("--stats");

  // Files: CLI replaces config entirely
  if (auto files = cmd.present<std::vector<std::string>>("files")) {
    input.files = *files;
  } else if (config) {
    input.files = config->files;
  }
  if (input.files.empty()) {
    return std::unexpected(Diagnostic::HostError("no input files"));
  }

  // Scalars: CLI overrides config
  if (auto name = cmd.present<std::string>("--name")) {
    input.options.module_name = *name;
  } else if (config) {
    input.options.module_name = config->name;
  } else {
    input.options.module_name = fs::path(input.files.front()).stem().string();
  }

  std::string kind = config ? config->kind : "library";
  if (auto k = cmd.present<std::string>("--kind")) {
    kind = *k;
  }
  auto output_kind = ParseOutputKind(kind);
  if (!output_kind) {
    return std::unexpected(output_kind.error());
  }
  input.options.output_kind = *output_kind;

  if (config) {
    input.options.concurrent_build = config->concurrent;
    input.options.max_parallelism = config->max_parallelism;
    input.options.warnings_as_errors = config->warnings_as_errors;
  }
  if (cmd.present<bool>("--no-concurrent")) {
    input.options.concurrent_build = false;
  }
  if (auto max = cmd.present<int>("--max-parallelism")) {
    if (*max < 0) {
      return std::unexpected(
          Diagnostic::HostError("--max-parallelism must not be negative"));
    }
    input.options.max_parallelism = static_cast<uint32_t>(*max);
  }
  if (auto w = cmd.present<bool>("--warnings-as-errors")) {
    input.options.warnings_as_errors = *w;
  }

  // Lists: config + CLI merged
  if (config) {
    input.references = config->references;
    input.options.suppressed_codes = config->suppress;
    input.analyzers = config->analyzers;
    input.analyzer_options = config->analyzer_options;
    input.resources = config->resources;
    input.out_dir = (config->root_dir / config->out_dir).string();

    input.emit.include_private_members = config->include_private;
    input.emit.emit_metadata_only = config->metadata_only;
    input.emit.output_name_override = config->output_name;
    input.emit.emit_test_coverage = config->coverage;
    input.emit.generate_documentation = config->documentation;

    auto debug = emit::ParseDebugInfoMode(config->debug);
    if (!debug) {
      return std::unexpected(debug.error());
    }
    input.emit.debug_info = *debug;

    auto policy = emit::ParseEmitPolicy(config->policy);
    if (!policy) {
      return std::unexpected(policy.error());
    }
    input.policy = *policy;
  }
  Extend(
      input.references, cmd.present<std::vector<std::string>>("--reference"));
  Extend(
      input.options.suppressed_codes,
      cmd.present<std::vector<std::string>>("--suppress"));

  return input;
}

auto ApplyAnalyzerFlags(
    const argparse::ArgumentParser& cmd, CompilationInput& input)
    -> strata::Result<void> {
  Extend(input.analyzers, cmd.present<std::vector<std::string>>("--analyzer"));
  if (auto values =
          cmd.present<std::vector<std::string>>("--analyzer-option")) {
    for (const auto& text : *values) {
      auto kv = SplitKeyValue(text);
      if (!kv) {
        return std::unexpected(kv.error());
      }
      input.analyzer_options.insert_or_assign(kv->first, kv->second);
    }
  }
  return {};
}

auto ApplyEmitFlags(const argparse::ArgumentParser& cmd, CompilationInput& input)
    -> strata::Result<void> {
  if (auto out = cmd.present<std::string>("--output")) {
    input.image_path = *out;
  }
  if (auto dir = cmd.present<std::string>("--out-dir")) {
    input.out_dir = *dir;
  }
  if (auto out = cmd.present<std::string>("--metadata-out")) {
    input.metadata_path = *out;
  }
  if (auto debug = cmd.present<std::string>("--debug")) {
    auto mode = emit::ParseDebugInfoMode(*debug);
    if (!mode) {
      return std::unexpected(mode.error());
    }
    input.emit.debug_info = *mode;
  }
  if (auto v = cmd.present<bool>("--metadata-only")) {
    input.emit.emit_metadata_only = *v;
  }
  if (cmd.present<bool>("--no-private")) {
    input.emit.include_private_members = false;
  }
  if (auto v = cmd.present<bool>("--doc")) {
    input.emit.generate_documentation = *v;
  }
  if (auto v = cmd.present<bool>("--coverage")) {
    input.emit.emit_test_coverage = *v;
  }
  if (cmd.present<bool>("--emit-anyway")) {
    input.policy = emit::EmitPolicy::kEmitAnyway;
  }
  if (auto name = cmd.present<std::string>("--output-name")) {
    input.emit.output_name_override = *name;
  }
  Extend(input.resources, cmd.present<std::vector<std::string>>("--resource"));
  return {};
}

auto LoadSources(const CompilationInput& input, SourceManager& mgr)
    -> strata::Result<std::shared_ptr<const SourceSet>> {
  std::vector<SyntaxUnit> units;
  units.reserve(input.files.size());
  for (const auto& file : input.files) {
    auto unit = LoadUnit(file, mgr);
    if (!unit) {
      return std::unexpected(unit.error());
    }
    units.push_back(std::move(*unit));
  }

  std::vector<MetadataReference> references;
  for (const auto& file : input.references) {
    auto reference = LoadReference(file);
    if (!reference) {
      return std::unexpected(reference.error());
    }
    references.push_back(std::move(*reference));
  }

  if (input.options.module_name.empty()) {
    return std::unexpected(Diagnostic::HostError("module name is empty"));
  }
  return SourceSet::Create(
      std::move(units), std::move(references), input.options);
}

auto LoadResources(const CompilationInput& input)
    -> strata::Result<std::vector<emit::ManifestResource>> {
  std::vector<emit::ManifestResource> resources;
  for (const auto& file : input.resources) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("cannot read resource '{}'", file)));
    }
    resources.push_back(
        emit::ManifestResource{
            .name = fs::path(file).filename().string(),
            .data = std::vector<uint8_t>(
                std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>()),
            .is_public = true,
        });
  }
  return resources;
}

}  // namespace strata::driver
